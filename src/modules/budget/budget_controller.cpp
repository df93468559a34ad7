// modules/budget/budget_controller.cpp
#include "budget/budget_controller.h"
#include <chrono>

namespace agentflow {

void BudgetController::consume_node(const NodeId& node) {
    if (!budget_.try_consume_node()) {
        throw FlowError(ErrorCode::BUDGET_EXCEEDED,
                        "Node budget exhausted (max_nodes=" + std::to_string(budget_.max_nodes) + ")", node);
    }
}

void BudgetController::consume_model_call(const NodeId& node) {
    if (!budget_.try_consume_model_call()) {
        throw FlowError(ErrorCode::BUDGET_EXCEEDED,
                        "Model call budget exhausted (max_model_calls=" + std::to_string(budget_.max_model_calls) + ")",
                        node);
    }
}

Value BudgetController::snapshot() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - budget_.start_time).count();
    return Value{
        {"max_nodes", budget_.max_nodes},
        {"max_model_calls", budget_.max_model_calls},
        {"max_duration_sec", budget_.max_duration_sec},
        {"nodes_used", budget_.nodes_used.load()},
        {"model_calls_used", budget_.model_calls_used.load()},
        {"elapsed_ms", elapsed}
    };
}

} // namespace agentflow
