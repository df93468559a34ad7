// modules/graph/workflow_loader.cpp
#include "graph/workflow_loader.h"
#include "common/utils/path_utils.h"
#include "common/utils/yaml_json.h"
#include <fstream>
#include <sstream>

namespace agentflow {

namespace {

[[noreturn]] void parse_error(const std::string& origin, const std::string& what) {
    throw FlowError(ErrorCode::PARSE_ERROR, origin + ": " + what);
}

std::string scalar(const YAML::Node& node, const std::string& origin, const std::string& field) {
    if (!node || !node.IsScalar()) parse_error(origin, "'" + field + "' must be a string");
    return node.Scalar();
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& origin, const std::string& field) {
    std::vector<std::string> out;
    if (!node || node.IsNull()) return out;
    if (node.IsScalar()) {
        out.push_back(node.Scalar());
        return out;
    }
    if (!node.IsSequence()) parse_error(origin, "'" + field + "' must be a string or a list of strings");
    for (const auto& item : node) out.push_back(scalar(item, origin, field));
    return out;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// "a -> b -> c" -> {a, b, c}
std::vector<std::string> split_chain(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t arrow = text.find("->", start);
        out.push_back(trim(text.substr(start, arrow == std::string::npos ? std::string::npos : arrow - start)));
        if (arrow == std::string::npos) break;
        start = arrow + 2;
    }
    return out;
}

Edge edge_from_map(const YAML::Node& e, const std::string& default_from, const std::string& origin) {
    Edge edge;
    edge.from = e["from"] ? scalar(e["from"], origin, "from") : default_from;
    edge.to = scalar(e["to"], origin, "to");
    if (edge.from.empty()) parse_error(origin, "edge to '" + edge.to + "' has no source");
    if (e["if"]) edge.condition = scalar(e["if"], origin, "if");
    if (e["on_error"] && e["on_error"].as<bool>(false)) edge.kind = EdgeKind::ON_ERROR;
    return edge;
}

} // namespace

WorkflowGraph WorkflowLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FlowError(ErrorCode::PARSE_ERROR, "Cannot open workflow: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    WorkflowGraph graph = load_string(buffer.str(), path);
    graph.source_path = path;
    if (graph.name.empty()) graph.name = file_stem(path);
    return graph;
}

WorkflowGraph WorkflowLoader::load_string(const std::string& content, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw FlowError(ErrorCode::PARSE_ERROR, origin + ": " + e.what());
    }
    return from_yaml(root, origin);
}

WorkflowGraph WorkflowLoader::from_yaml(const YAML::Node& root, const std::string& origin) {
    if (!root || !root.IsMap()) parse_error(origin, "workflow must be a mapping");

    WorkflowGraph graph;
    graph.source_path = origin;
    try {
        if (root["name"]) graph.name = scalar(root["name"], origin, "name");
        if (root["metadata"]) graph.metadata = yaml_to_json(root["metadata"]);
        graph.entry = string_list(root["entry"], origin, "entry");
        graph.exit = string_list(root["exit"], origin, "exit");

        if (const auto& flows = root["flows"]) {
            if (!flows.IsMap()) parse_error(origin, "'flows' must map an alias to a path");
            for (const auto& kv : flows) {
                graph.flows.push_back(FlowImport{kv.first.as<std::string>(), scalar(kv.second, origin, "flows")});
            }
        }

        const std::pair<const char*, ResourceKind> resource_keys[] = {
            {"prompts", ResourceKind::PROMPT},
            {"agents", ResourceKind::AGENT},
            {"tools", ResourceKind::TOOL},
            {"modules", ResourceKind::MODULE},
        };
        for (const auto& [key, kind] : resource_keys) {
            for (auto& pattern : string_list(root[key], origin, key)) {
                graph.resources.push_back(ResourcePattern{kind, std::move(pattern)});
            }
        }

        if (root["nodes"]) parse_nodes(root["nodes"], graph, origin);
        if (root["edges"]) parse_edges(root["edges"], graph, origin);
    } catch (const YAML::Exception& e) {
        parse_error(origin, e.what());
    }
    return graph;
}

void WorkflowLoader::parse_nodes(const YAML::Node& nodes, WorkflowGraph& graph, const std::string& origin) {
    if (nodes.IsMap()) {
        for (const auto& kv : nodes) parse_node(kv.first.as<std::string>(), kv.second, graph, origin);
        return;
    }
    if (nodes.IsSequence()) {
        for (const auto& node_doc : nodes) {
            if (!node_doc.IsMap() || !node_doc["id"]) parse_error(origin, "node entries in a list need an 'id'");
            parse_node(scalar(node_doc["id"], origin, "id"), node_doc, graph, origin);
        }
        return;
    }
    parse_error(origin, "'nodes' must be a mapping or a list");
}

void WorkflowLoader::parse_node(const std::string& id, const YAML::Node& node_doc, WorkflowGraph& graph,
                                const std::string& origin) {
    if (id.empty()) parse_error(origin, "empty node id");
    if (!node_doc.IsMap()) parse_error(origin, "node '" + id + "' must be a mapping");

    std::unique_ptr<Node> node;
    if (node_doc["call"]) {
        Value args = node_doc["args"] ? yaml_to_json(node_doc["args"]) : Value::object();
        if (!args.is_object()) parse_error(origin, "node '" + id + "': 'args' must be a mapping");
        node = std::make_unique<CallNode>(id, scalar(node_doc["call"], origin, "call"), std::move(args));
    } else if (node_doc["literal"]) {
        node = std::make_unique<LiteralNode>(id, yaml_to_json(node_doc["literal"]));
    } else if (node_doc["foreach"]) {
        const auto& fe = node_doc["foreach"];
        if (!fe.IsMap() || !fe["var"] || !fe["in"]) {
            parse_error(origin, "node '" + id + "': foreach needs 'var' and 'in'");
        }
        node = std::make_unique<ForEachNode>(id, scalar(fe["var"], origin, "var"), scalar(fe["in"], origin, "in"),
                                             parse_body(node_doc["body"], origin + "#" + id));
    } else if (node_doc["while"]) {
        node = std::make_unique<WhileNode>(id, scalar(node_doc["while"], origin, "while"),
                                           parse_body(node_doc["body"], origin + "#" + id));
    } else {
        parse_error(origin, "node '" + id + "' needs one of call, literal, foreach, while");
    }

    if (node_doc["metadata"]) node->metadata = yaml_to_json(node_doc["metadata"]);
    graph.add_node(std::move(node));
    parse_inline_edges(id, node_doc, graph, origin);
}

void WorkflowLoader::parse_inline_edges(const std::string& id, const YAML::Node& node_doc, WorkflowGraph& graph,
                                        const std::string& origin) {
    if (const auto& next = node_doc["next"]) {
        auto add = [&](const YAML::Node& item) {
            if (item.IsScalar()) {
                graph.edges.push_back(Edge{id, item.Scalar(), std::nullopt, EdgeKind::NORMAL});
            } else if (item.IsMap()) {
                graph.edges.push_back(edge_from_map(item, id, origin));
            } else {
                parse_error(origin, "node '" + id + "': bad 'next' entry");
            }
        };
        if (next.IsSequence()) {
            for (const auto& item : next) add(item);
        } else {
            add(next);
        }
    }
    if (const auto& on_error = node_doc["on_error"]) {
        graph.edges.push_back(Edge{id, scalar(on_error, origin, "on_error"), std::nullopt, EdgeKind::ON_ERROR});
    }
}

void WorkflowLoader::parse_edges(const YAML::Node& edges, WorkflowGraph& graph, const std::string& origin) {
    if (!edges.IsSequence()) parse_error(origin, "'edges' must be a list");
    for (const auto& e : edges) {
        if (e.IsScalar()) {
            auto hops = split_chain(e.Scalar());
            if (hops.size() < 2) parse_error(origin, "edge '" + e.Scalar() + "' needs 'from -> to'");
            for (size_t i = 0; i + 1 < hops.size(); ++i) {
                if (hops[i].empty() || hops[i + 1].empty()) parse_error(origin, "empty node in '" + e.Scalar() + "'");
                graph.edges.push_back(Edge{hops[i], hops[i + 1], std::nullopt, EdgeKind::NORMAL});
            }
        } else if (e.IsMap()) {
            graph.edges.push_back(edge_from_map(e, "", origin));
        } else {
            parse_error(origin, "edge entries must be strings or mappings");
        }
    }
}

std::shared_ptr<const WorkflowGraph> WorkflowLoader::parse_body(const YAML::Node& body, const std::string& origin) {
    if (!body || !body.IsMap()) parse_error(origin, "loop needs a 'body' mapping");
    if (body["flows"]) parse_error(origin, "loop bodies cannot import flows");
    return std::make_shared<const WorkflowGraph>(from_yaml(body, origin));
}

} // namespace agentflow
