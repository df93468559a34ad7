// modules/context/execution_context.h
#ifndef AGENTFLOW_MODULES_CONTEXT_EXECUTION_CONTEXT_H
#define AGENTFLOW_MODULES_CONTEXT_EXECUTION_CONTEXT_H

#include "core/types/context.h" // 引入 Value
#include "core/types/errors.h"  // 引入 NodeId, ErrorInfo
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentflow {

// One active loop iteration: `$<var>` and `$loop.index/first/last`
struct LoopScope {
    std::string var;
    Value item = nullptr;
    int64_t index = 0;
    bool first = false;
    bool last = false;

    Value loop_value() const {
        return Value{{"index", index}, {"first", first}, {"last", last}, {"item", item}};
    }
};

// Innermost scope last. Lives on the scheduler frame, so concurrent branches
// outside a loop never see its bindings.
using LoopScopes = std::vector<LoopScope>;

// 定义合并策略类型
enum class MergeStrategy : uint8_t {
    REPLACE,      // last write wins
    DEEP_MERGE,   // objects merged recursively, everything else replaced
    ARRAY_APPEND  // arrays concatenated, a scalar is appended
};

MergeStrategy parse_merge_strategy(const std::string& name);

// Run-scoped state shared by every node of one (merged) graph. All accessors lock;
// a write replaces one key atomically and concurrent writers race last-writer-wins.
class ExecutionContext {
public:
    explicit ExecutionContext(Value input = Value::object());

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // input is set once at run start
    const Value& input() const { return input_; }

    // ---- ctx ----
    Value get(const std::string& dotted) const;
    Value get(const std::vector<std::string>& path, size_t from = 0) const;
    bool has_key(const std::string& top_level_key) const;
    void set(const std::string& dotted, Value v, MergeStrategy strategy = MergeStrategy::REPLACE);
    bool erase(const std::string& dotted);
    Value ctx() const;

    // ---- last_output ----
    void record_output(const NodeId& node, Value output);
    // node record gets "error", ctx gets `error` = {code, message, node, details}
    void record_failure(const ErrorInfo& error);
    Value node_record(const NodeId& node) const;
    bool has_node_record(const NodeId& node) const;
    // Longest dotted prefix of `path` that names a recorded node: (id, segments used)
    std::optional<std::pair<NodeId, size_t>> match_node(const std::vector<std::string>& path) const;
    Value current_output() const;
    std::optional<NodeId> current_node() const;

    // ---- reply ----
    void set_reply(Value reply);
    Value reply() const;

    // ---- runtime sub-workflow stack ----
    // throws RecursionLimit on re-entry or when the stack would exceed max_depth
    void enter_execution(const std::string& identifier, int max_depth);
    void exit_execution(const std::string& identifier);
    std::vector<std::string> execution_stack() const;
    void inherit_execution_stack(std::vector<std::string> stack);

    // {input, ctx, outputs, reply}
    Value to_value() const;

private:
    const Value input_;
    mutable std::mutex mutex_;
    Value ctx_ = Value::object();
    std::unordered_map<NodeId, Value> outputs_;
    std::optional<NodeId> current_;
    Value reply_ = Value::object();
    std::vector<std::string> execution_stack_;
};

// Pops the identifier on scope exit
class ExecutionGuard {
public:
    ExecutionGuard(ExecutionContext& ctx, std::string identifier, int max_depth)
        : ctx_(ctx), identifier_(std::move(identifier)) {
        ctx_.enter_execution(identifier_, max_depth);
    }
    ~ExecutionGuard() { ctx_.exit_execution(identifier_); }

    ExecutionGuard(const ExecutionGuard&) = delete;
    ExecutionGuard& operator=(const ExecutionGuard&) = delete;

private:
    ExecutionContext& ctx_;
    std::string identifier_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CONTEXT_EXECUTION_CONTEXT_H
