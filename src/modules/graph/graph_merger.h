// modules/graph/graph_merger.h
#ifndef AGENTFLOW_MODULES_GRAPH_GRAPH_MERGER_H
#define AGENTFLOW_MODULES_GRAPH_GRAPH_MERGER_H

#include "core/types/node.h" // 引入 WorkflowGraph
#include <string>
#include <vector>

namespace agentflow {

// Flattens a workflow and its `flows:` imports into one graph. Imported node ids and
// the variable references that point at them are prefixed with the alias, chained for
// nested imports (order.payment.charge). Resource patterns are resolved against the
// directory of the unit that declared them and de-duplicated.
class GraphMerger {
public:
    struct Config {
        bool validate = true; // run ensure_valid on the result
    };

    GraphMerger() = default;
    explicit GraphMerger(Config config) : config_(config) {}

    // throws ParseError, CircularImport, GraphError
    WorkflowGraph merge(const std::string& root_path) const;

    // Merge an already parsed root unit; its flows resolve against `base_dir`
    WorkflowGraph merge(WorkflowGraph root, const std::string& base_dir) const;

private:
    Config config_;

    struct Chain {
        std::vector<std::string> keys;    // canonical paths
        std::vector<std::string> display; // as resolved from the import
    };

    WorkflowGraph merge_unit(WorkflowGraph unit, const std::string& dir, Chain& chain) const;
    static void splice(WorkflowGraph& parent, WorkflowGraph child, const std::string& alias);
    static void add_resource(WorkflowGraph& graph, const ResourcePattern& pattern);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_GRAPH_GRAPH_MERGER_H
