// modules/graph/graph_validator.h
#ifndef AGENTFLOW_MODULES_GRAPH_GRAPH_VALIDATOR_H
#define AGENTFLOW_MODULES_GRAPH_GRAPH_VALIDATOR_H

#include "core/types/node.h"
#include <string>
#include <vector>

namespace agentflow {

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }
};

// Structural checks on a merged graph (and recursively its loop bodies):
// edge endpoints and entry/exit ids exist, expressions parse, ids are identifiers.
ValidationReport validate_graph(const WorkflowGraph& graph);

// Throws GraphError listing every error; warnings are logged
void ensure_valid(const WorkflowGraph& graph);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_GRAPH_GRAPH_VALIDATOR_H
