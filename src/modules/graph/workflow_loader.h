// modules/graph/workflow_loader.h
#ifndef AGENTFLOW_MODULES_GRAPH_WORKFLOW_LOADER_H
#define AGENTFLOW_MODULES_GRAPH_WORKFLOW_LOADER_H

#include "core/types/node.h" // 引入 WorkflowGraph
#include <string>
#include <yaml-cpp/yaml.h>

namespace agentflow {

// Builds one unmerged WorkflowGraph from a workflow document:
//
//   name: order
//   entry: [start]
//   exit: [done]
//   flows: {payment: ./payment.yaml}
//   prompts: ["prompts/*.prompt"]        # also agents:, tools:, modules:
//   nodes:
//     start: {call: set_context, args: {status: "'new'"}, next: check}
//     check: {literal: {ok: true}}
//     each:  {foreach: {var: item, in: "$ctx.items"}, body: {nodes: {...}, edges: [...]}}
//     spin:  {while: "$ctx.n < 3", body: {...}}
//   edges:
//     - "check -> each -> done"
//     - {from: check, to: spin, if: "$ctx.retry"}
//     - {from: start, to: recover, on_error: true}
//
// `nodes` may also be a list of maps carrying an `id`. Syntax problems are ParseError.
class WorkflowLoader {
public:
    static WorkflowGraph load_file(const std::string& path);
    static WorkflowGraph load_string(const std::string& content, const std::string& origin = "<string>");
    static WorkflowGraph from_yaml(const YAML::Node& root, const std::string& origin);

private:
    static void parse_nodes(const YAML::Node& nodes, WorkflowGraph& graph, const std::string& origin);
    static void parse_node(const std::string& id, const YAML::Node& node_doc, WorkflowGraph& graph,
                           const std::string& origin);
    static void parse_edges(const YAML::Node& edges, WorkflowGraph& graph, const std::string& origin);
    static void parse_inline_edges(const std::string& id, const YAML::Node& node_doc, WorkflowGraph& graph,
                                   const std::string& origin);
    static std::shared_ptr<const WorkflowGraph> parse_body(const YAML::Node& body, const std::string& origin);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_GRAPH_WORKFLOW_LOADER_H
