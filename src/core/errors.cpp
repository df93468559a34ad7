#include "core/types/errors.h"
#include "core/types/resource.h"

namespace agentflow {

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PARSE_ERROR: return "ParseError";
        case ErrorCode::CIRCULAR_IMPORT: return "CircularImport";
        case ErrorCode::GRAPH_ERROR: return "GraphError";
        case ErrorCode::EVAL_ERROR: return "EvalError";
        case ErrorCode::UNRESOLVED_VARIABLE: return "UnresolvedVariable";
        case ErrorCode::MISSING_ARGUMENT: return "MissingArgument";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::TOOL_RESOLUTION_ERROR: return "ToolResolutionError";
        case ErrorCode::TOOL_TIMEOUT: return "ToolTimeout";
        case ErrorCode::CALL_FAILURE: return "CallFailure";
        case ErrorCode::BUDGET_EXCEEDED: return "BudgetExceeded";
        case ErrorCode::RECURSION_LIMIT: return "RecursionLimit";
        case ErrorCode::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

std::string to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::PROMPT: return "prompts";
        case ResourceKind::AGENT: return "agents";
        case ResourceKind::TOOL: return "tools";
        case ResourceKind::MODULE: return "modules";
    }
    return "unknown";
}

Value ErrorInfo::to_value() const {
    return Value{
        {"code", to_string(code)},
        {"message", message},
        {"node", node},
        {"details", details}
    };
}

FlowError::FlowError(ErrorCode code, const std::string& message, NodeId node, Value details)
    : std::runtime_error(message), code_(code), node_(std::move(node)), details_(std::move(details)) {}

ErrorInfo FlowError::info() const {
    return ErrorInfo{code_, what(), node_, details_};
}

FlowError FlowError::at_node(const NodeId& node) const {
    if (!node_.empty()) return *this;
    return FlowError(code_, what(), node, details_);
}

} // namespace agentflow
