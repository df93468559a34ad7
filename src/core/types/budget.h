#ifndef AGENTFLOW_TYPES_BUDGET_H
#define AGENTFLOW_TYPES_BUDGET_H

#include <atomic> // For atomic budget counters
#include <chrono>

namespace agentflow {

// 执行预算结构. -1 表示无限制
struct ExecutionBudget {
    int max_nodes = -1;
    int max_model_calls = -1;
    int max_duration_sec = -1;
    int max_loop_iterations = 100; // per While/ForEach node
    int max_call_depth = 10;       // nested runtime sub-workflows
    int max_tool_turns = 10;       // model turns per agent call

    mutable std::atomic<int> nodes_used{0};
    mutable std::atomic<int> model_calls_used{0};
    std::chrono::steady_clock::time_point start_time;

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}

    // 复制限制，重置计数器
    ExecutionBudget(const ExecutionBudget& other)
        : max_nodes(other.max_nodes),
          max_model_calls(other.max_model_calls),
          max_duration_sec(other.max_duration_sec),
          max_loop_iterations(other.max_loop_iterations),
          max_call_depth(other.max_call_depth),
          max_tool_turns(other.max_tool_turns),
          start_time(std::chrono::steady_clock::now()) {}

    ExecutionBudget& operator=(const ExecutionBudget& other) {
        if (this != &other) {
            max_nodes = other.max_nodes;
            max_model_calls = other.max_model_calls;
            max_duration_sec = other.max_duration_sec;
            max_loop_iterations = other.max_loop_iterations;
            max_call_depth = other.max_call_depth;
            max_tool_turns = other.max_tool_turns;
            nodes_used = 0;
            model_calls_used = 0;
            start_time = std::chrono::steady_clock::now();
        }
        return *this;
    }

    bool timed_out() const {
        if (max_duration_sec < 0) return false;
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time).count();
        return elapsed >= max_duration_sec;
    }

    bool exceeded() const {
        if (max_nodes >= 0 && nodes_used.load() > max_nodes) return true;
        if (max_model_calls >= 0 && model_calls_used.load() > max_model_calls) return true;
        return timed_out();
    }

    bool try_consume_node() { return try_consume(nodes_used, max_nodes); }
    bool try_consume_model_call() { return try_consume(model_calls_used, max_model_calls); }

private:
    static bool try_consume(std::atomic<int>& counter, int limit) {
        int expected = counter.load();
        do {
            if (limit >= 0 && expected >= limit) return false; // Another thread consumed the last unit
        } while (!counter.compare_exchange_weak(expected, expected + 1));
        return true;
    }
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_BUDGET_H
