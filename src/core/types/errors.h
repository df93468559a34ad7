#ifndef AGENTFLOW_TYPES_ERRORS_H
#define AGENTFLOW_TYPES_ERRORS_H

#include "context.h" // 引入 Value
#include <cstdint>
#include <stdexcept>
#include <string>

namespace agentflow {

using NodeId = std::string; // e.g., "order.payment.charge"

enum class ErrorCode : uint8_t {
    PARSE_ERROR,
    CIRCULAR_IMPORT,
    GRAPH_ERROR,
    EVAL_ERROR,
    UNRESOLVED_VARIABLE,
    MISSING_ARGUMENT,
    INVALID_ARGUMENT,
    TOOL_RESOLUTION_ERROR,
    TOOL_TIMEOUT,
    CALL_FAILURE,
    BUDGET_EXCEEDED,
    RECURSION_LIMIT,
    CANCELLED
};

// "ParseError", "CircularImport", ...
std::string to_string(ErrorCode code);

// The structured $error value routed through OnError edges
struct ErrorInfo {
    ErrorCode code = ErrorCode::CALL_FAILURE;
    std::string message;
    NodeId node;
    Value details = nullptr;

    // {code, message, node, details}
    Value to_value() const;
};

class FlowError : public std::runtime_error {
public:
    FlowError(ErrorCode code, const std::string& message, NodeId node = {}, Value details = nullptr);

    ErrorCode code() const noexcept { return code_; }
    const NodeId& node() const noexcept { return node_; }
    const Value& details() const noexcept { return details_; }

    ErrorInfo info() const;

    // Returns a copy attributed to `node` unless it already names one
    FlowError at_node(const NodeId& node) const;

private:
    ErrorCode code_;
    NodeId node_;
    Value details_;
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_ERRORS_H
