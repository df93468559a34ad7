// modules/graph/graph_validator.cpp
#include "graph/graph_validator.h"
#include "common/utils/logger.h"
#include "expr/expression.h"
#include <cctype>
#include <unordered_set>

namespace agentflow {

namespace {

bool is_identifier_path(const std::string& id) {
    if (id.empty() || id.front() == '.' || id.back() == '.') return false;
    bool segment_start = true;
    for (char c : id) {
        if (c == '.') {
            if (segment_start) return false;
            segment_start = true;
            continue;
        }
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        if (!ok || (segment_start && std::isdigit(static_cast<unsigned char>(c)))) return false;
        segment_start = false;
    }
    return true;
}

void check_expression(const std::string& expr, const std::string& where, ValidationReport& report) {
    try {
        Expression::parse(expr);
    } catch (const FlowError& e) {
        report.errors.push_back(where + ": " + e.what());
    }
}

void validate_into(const WorkflowGraph& graph, const std::string& scope, ValidationReport& report) {
    std::string prefix = scope.empty() ? "" : scope + ": ";
    if (graph.nodes.empty()) report.warnings.push_back(prefix + "graph has no nodes");

    for (const auto& node : graph.nodes) {
        if (!is_identifier_path(node->id)) {
            report.warnings.push_back(prefix + "node id '" + node->id + "' cannot be referenced as $" + node->id);
        }
        if (auto* fe = dynamic_cast<const ForEachNode*>(node.get())) {
            check_expression(fe->collection_expr, prefix + "foreach '" + node->id + "'", report);
            if (fe->body) validate_into(*fe->body, prefix + node->id, report);
        } else if (auto* wh = dynamic_cast<const WhileNode*>(node.get())) {
            check_expression(wh->condition_expr, prefix + "while '" + node->id + "'", report);
            if (wh->body) validate_into(*wh->body, prefix + node->id, report);
        } else if (auto* call = dynamic_cast<const CallNode*>(node.get())) {
            if (call->target.empty()) report.errors.push_back(prefix + "node '" + node->id + "' has no call target");
        }
    }

    std::unordered_set<NodeId> has_incoming;
    std::unordered_set<NodeId> error_sources;
    for (const auto& e : graph.edges) {
        std::string label = e.from + " -> " + e.to;
        if (!graph.has_node(e.from)) report.errors.push_back(prefix + "edge " + label + ": unknown source '" + e.from + "'");
        if (!graph.has_node(e.to)) report.errors.push_back(prefix + "edge " + label + ": unknown target '" + e.to + "'");
        if (e.is_conditional()) check_expression(*e.condition, prefix + "edge " + label, report);
        if (e.kind == EdgeKind::ON_ERROR) {
            if (e.is_conditional()) report.warnings.push_back(prefix + "edge " + label + ": condition on an error edge is ignored");
            if (!error_sources.insert(e.from).second) {
                report.warnings.push_back(prefix + "node '" + e.from + "' has several on_error edges; the first one is used");
            }
        }
        has_incoming.insert(e.to);
    }

    for (const auto& id : graph.entry) {
        if (!graph.has_node(id)) report.errors.push_back(prefix + "entry node '" + id + "' does not exist");
    }
    for (const auto& id : graph.exit) {
        if (!graph.has_node(id)) report.errors.push_back(prefix + "exit node '" + id + "' does not exist");
    }

    if (!graph.entry.empty()) {
        std::unordered_set<NodeId> entries(graph.entry.begin(), graph.entry.end());
        for (const auto& node : graph.nodes) {
            if (!entries.count(node->id) && !has_incoming.count(node->id)) {
                report.warnings.push_back(prefix + "node '" + node->id + "' has no incoming edge and is not an entry; it never runs");
            }
        }
    }
}

} // namespace

ValidationReport validate_graph(const WorkflowGraph& graph) {
    ValidationReport report;
    validate_into(graph, "", report);
    return report;
}

void ensure_valid(const WorkflowGraph& graph) {
    auto report = validate_graph(graph);
    for (const auto& w : report.warnings) log_warning(graph.name + ": " + w);
    if (report.ok()) return;

    std::string message = "Invalid workflow '" + graph.name + "':";
    for (const auto& e : report.errors) message += "\n  - " + e;
    throw FlowError(ErrorCode::GRAPH_ERROR, message, {}, Value{{"errors", report.errors}});
}

} // namespace agentflow
