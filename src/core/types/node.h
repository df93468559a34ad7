#ifndef AGENTFLOW_TYPES_NODE_H
#define AGENTFLOW_TYPES_NODE_H

#include "context.h"  // 引入 Value
#include "errors.h"   // 引入 NodeId
#include "resource.h" // 引入 ResourcePattern
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentflow {

// 节点类型枚举
enum class NodeKind : uint8_t {
    CALL,
    LITERAL,
    FOREACH,
    WHILE
};

enum class EdgeKind : uint8_t {
    NORMAL,
    ON_ERROR
};

std::string to_string(NodeKind kind);

struct Edge {
    NodeId from;
    NodeId to;
    std::optional<std::string> condition; // boolean expression, unconditional if empty
    EdgeKind kind = EdgeKind::NORMAL;

    bool is_conditional() const { return condition.has_value() && !condition->empty(); }
};

// Maps an old node id to its new id (merge prefixing)
using IdMapper = std::function<NodeId(const NodeId&)>;
// Rewrites one expression string (variable prefixing)
using ExprRewriter = std::function<std::string(const std::string&)>;

struct WorkflowGraph;

// Base Node. id and kind are fixed at construction; rewriting produces a new node.
struct Node {
    const NodeId id;
    const NodeKind kind;
    Value metadata;

    Node(NodeId id, NodeKind kind, Value metadata = Value::object())
        : id(std::move(id)), kind(kind), metadata(std::move(metadata)) {}

    virtual ~Node() = default;

    [[nodiscard]] virtual std::unique_ptr<Node> clone_as(const IdMapper& map_id,
                                                         const ExprRewriter& rewrite) const = 0;
};

// Call(target_name, argument_map)
struct CallNode : public Node {
    std::string target;
    Value arguments; // object; string leaves are expressions

    CallNode(NodeId id, std::string target, Value arguments = Value::object());
    [[nodiscard]] std::unique_ptr<Node> clone_as(const IdMapper& map_id,
                                                 const ExprRewriter& rewrite) const override;
};

// Literal(value)
struct LiteralNode : public Node {
    Value value;

    LiteralNode(NodeId id, Value value);
    [[nodiscard]] std::unique_ptr<Node> clone_as(const IdMapper& map_id,
                                                 const ExprRewriter& rewrite) const override;
};

// ForEach(iteration_var, collection_expr, body)
struct ForEachNode : public Node {
    std::string iteration_var;
    std::string collection_expr;
    std::shared_ptr<const WorkflowGraph> body;

    ForEachNode(NodeId id, std::string var, std::string collection_expr,
                std::shared_ptr<const WorkflowGraph> body);
    [[nodiscard]] std::unique_ptr<Node> clone_as(const IdMapper& map_id,
                                                 const ExprRewriter& rewrite) const override;
};

// While(condition_expr, body)
struct WhileNode : public Node {
    std::string condition_expr;
    std::shared_ptr<const WorkflowGraph> body;

    WhileNode(NodeId id, std::string condition_expr, std::shared_ptr<const WorkflowGraph> body);
    [[nodiscard]] std::unique_ptr<Node> clone_as(const IdMapper& map_id,
                                                 const ExprRewriter& rewrite) const override;
};

struct FlowImport {
    std::string alias;
    std::string path; // as written in the source unit
};

// One compiled unit. Before merge `flows` lists the imports, after merge it is empty.
struct WorkflowGraph {
    std::string name;
    std::string source_path;
    std::vector<std::unique_ptr<Node>> nodes; // declaration order
    std::vector<Edge> edges;                  // declaration order
    std::vector<NodeId> entry;
    std::vector<NodeId> exit;
    std::vector<ResourcePattern> resources;
    std::vector<FlowImport> flows;
    Value metadata = Value::object();

    WorkflowGraph() = default;
    WorkflowGraph(WorkflowGraph&&) = default;
    WorkflowGraph& operator=(WorkflowGraph&&) = default;
    WorkflowGraph(const WorkflowGraph&) = delete;
    WorkflowGraph& operator=(const WorkflowGraph&) = delete;

    // throws GraphError on a duplicate id
    void add_node(std::unique_ptr<Node> node);
    const Node* find_node(const NodeId& id) const;
    bool has_node(const NodeId& id) const { return find_node(id) != nullptr; }

    // Top-level ids only
    std::vector<NodeId> node_ids() const;
    // Top-level ids plus the ids defined inside loop bodies
    std::unordered_set<NodeId> local_ids() const;

    // Deep copy with every id passed through `map_id` and every expression through `rewrite`
    [[nodiscard]] WorkflowGraph rewritten(const IdMapper& map_id, const ExprRewriter& rewrite) const;

private:
    std::unordered_map<NodeId, size_t> index_;
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_NODE_H
