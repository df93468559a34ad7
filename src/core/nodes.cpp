#include "core/types/node.h"
#include <stdexcept>

namespace agentflow {

std::string to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::CALL: return "call";
        case NodeKind::LITERAL: return "literal";
        case NodeKind::FOREACH: return "foreach";
        case NodeKind::WHILE: return "while";
    }
    return "unknown";
}

namespace {

Value rewrite_arguments(const Value& args, const ExprRewriter& rewrite) {
    if (args.is_string()) return rewrite(args.get<std::string>());
    if (args.is_array()) {
        Value out = Value::array();
        for (const auto& item : args) out.push_back(rewrite_arguments(item, rewrite));
        return out;
    }
    if (args.is_object()) {
        Value out = Value::object();
        for (auto it = args.begin(); it != args.end(); ++it) {
            out[it.key()] = rewrite_arguments(it.value(), rewrite);
        }
        return out;
    }
    return args;
}

std::shared_ptr<const WorkflowGraph> rewrite_body(const std::shared_ptr<const WorkflowGraph>& body,
                                                  const IdMapper& map_id,
                                                  const ExprRewriter& rewrite) {
    if (!body) return nullptr;
    return std::make_shared<const WorkflowGraph>(body->rewritten(map_id, rewrite));
}

} // namespace

// ————————————————————————
// CallNode
// ————————————————————————

CallNode::CallNode(NodeId id, std::string target, Value arguments)
    : Node(std::move(id), NodeKind::CALL),
      target(std::move(target)),
      arguments(arguments.is_null() ? Value::object() : std::move(arguments)) {}

std::unique_ptr<Node> CallNode::clone_as(const IdMapper& map_id, const ExprRewriter& rewrite) const {
    auto node = std::make_unique<CallNode>(map_id(id), target, rewrite_arguments(arguments, rewrite));
    node->metadata = metadata;
    return node;
}

// ————————————————————————
// LiteralNode
// ————————————————————————

LiteralNode::LiteralNode(NodeId id, Value value)
    : Node(std::move(id), NodeKind::LITERAL), value(std::move(value)) {}

std::unique_ptr<Node> LiteralNode::clone_as(const IdMapper& map_id, const ExprRewriter& rewrite) const {
    auto node = std::make_unique<LiteralNode>(map_id(id), rewrite_arguments(value, rewrite));
    node->metadata = metadata;
    return node;
}

// ————————————————————————
// ForEachNode
// ————————————————————————

ForEachNode::ForEachNode(NodeId id, std::string var, std::string collection_expr,
                         std::shared_ptr<const WorkflowGraph> body)
    : Node(std::move(id), NodeKind::FOREACH),
      iteration_var(std::move(var)),
      collection_expr(std::move(collection_expr)),
      body(std::move(body)) {}

std::unique_ptr<Node> ForEachNode::clone_as(const IdMapper& map_id, const ExprRewriter& rewrite) const {
    auto node = std::make_unique<ForEachNode>(map_id(id), iteration_var, rewrite(collection_expr),
                                              rewrite_body(body, map_id, rewrite));
    node->metadata = metadata;
    return node;
}

// ————————————————————————
// WhileNode
// ————————————————————————

WhileNode::WhileNode(NodeId id, std::string condition_expr, std::shared_ptr<const WorkflowGraph> body)
    : Node(std::move(id), NodeKind::WHILE),
      condition_expr(std::move(condition_expr)),
      body(std::move(body)) {}

std::unique_ptr<Node> WhileNode::clone_as(const IdMapper& map_id, const ExprRewriter& rewrite) const {
    auto node = std::make_unique<WhileNode>(map_id(id), rewrite(condition_expr),
                                            rewrite_body(body, map_id, rewrite));
    node->metadata = metadata;
    return node;
}

// ————————————————————————
// WorkflowGraph
// ————————————————————————

void WorkflowGraph::add_node(std::unique_ptr<Node> node) {
    if (!node) throw std::invalid_argument("add_node: null node");
    if (index_.count(node->id)) {
        throw FlowError(ErrorCode::GRAPH_ERROR, "Duplicate node id '" + node->id + "' in " +
                        (source_path.empty() ? name : source_path));
    }
    index_[node->id] = nodes.size();
    nodes.push_back(std::move(node));
}

const Node* WorkflowGraph::find_node(const NodeId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : nodes[it->second].get();
}

std::vector<NodeId> WorkflowGraph::node_ids() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes.size());
    for (const auto& n : nodes) ids.push_back(n->id);
    return ids;
}

std::unordered_set<NodeId> WorkflowGraph::local_ids() const {
    std::unordered_set<NodeId> ids;
    for (const auto& n : nodes) {
        ids.insert(n->id);
        const WorkflowGraph* body = nullptr;
        if (auto* fe = dynamic_cast<const ForEachNode*>(n.get())) body = fe->body.get();
        if (auto* wh = dynamic_cast<const WhileNode*>(n.get())) body = wh->body.get();
        if (body) {
            auto inner = body->local_ids();
            ids.insert(inner.begin(), inner.end());
        }
    }
    return ids;
}

WorkflowGraph WorkflowGraph::rewritten(const IdMapper& map_id, const ExprRewriter& rewrite) const {
    WorkflowGraph out;
    out.name = name;
    out.source_path = source_path;
    out.metadata = metadata;
    out.resources = resources;
    out.flows = flows;
    for (const auto& n : nodes) {
        out.add_node(n->clone_as(map_id, rewrite));
    }
    for (const auto& e : edges) {
        Edge copy{map_id(e.from), map_id(e.to), std::nullopt, e.kind};
        if (e.condition) copy.condition = rewrite(*e.condition);
        out.edges.push_back(std::move(copy));
    }
    for (const auto& id : entry) out.entry.push_back(map_id(id));
    for (const auto& id : exit) out.exit.push_back(map_id(id));
    return out;
}

} // namespace agentflow
