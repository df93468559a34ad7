// modules/budget/budget_controller.h
#ifndef AGENTFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define AGENTFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h" // 引入 ExecutionBudget (已包含 atomic 计数器)
#include "core/types/context.h"
#include "core/types/errors.h"

namespace agentflow {

// BudgetController 类封装了预算的管理和检查逻辑
class BudgetController {
public:
    explicit BudgetController(const ExecutionBudget& budget = ExecutionBudget()) : budget_(budget) {}

    // throw BudgetExceeded attributed to `node` when the limit is reached
    void consume_node(const NodeId& node);
    void consume_model_call(const NodeId& node);

    bool exceeded() const { return budget_.exceeded(); }
    bool timed_out() const { return budget_.timed_out(); }

    int max_loop_iterations() const { return budget_.max_loop_iterations; }
    int max_call_depth() const { return budget_.max_call_depth; }
    int max_tool_turns() const { return budget_.max_tool_turns; }

    const ExecutionBudget& get_budget() const { return budget_; }

    // Limits plus current usage, for traces
    Value snapshot() const;

private:
    ExecutionBudget budget_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
