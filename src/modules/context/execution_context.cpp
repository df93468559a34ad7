// modules/context/execution_context.cpp
#include "context/execution_context.h"
#include "context/value_path.h"
#include <algorithm>

namespace agentflow {

namespace {

void deep_merge(Value& target, const Value& source) {
    if (!target.is_object() || !source.is_object()) {
        target = source;
        return;
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        auto t = target.find(it.key());
        if (t != target.end() && t->is_object() && it.value().is_object()) {
            deep_merge(*t, it.value());
        } else {
            target[it.key()] = it.value();
        }
    }
}

Value merged(const Value& existing, Value incoming, MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::REPLACE:
            return incoming;
        case MergeStrategy::DEEP_MERGE: {
            Value out = existing;
            deep_merge(out, incoming);
            return out;
        }
        case MergeStrategy::ARRAY_APPEND: {
            Value out = existing.is_array() ? existing
                                            : (existing.is_null() ? Value::array() : Value::array({existing}));
            if (incoming.is_array()) {
                for (auto& item : incoming) out.push_back(std::move(item));
            } else {
                out.push_back(std::move(incoming));
            }
            return out;
        }
    }
    return incoming;
}

} // namespace

MergeStrategy parse_merge_strategy(const std::string& name) {
    if (name.empty() || name == "replace" || name == "last_write_wins") return MergeStrategy::REPLACE;
    if (name == "deep_merge" || name == "merge") return MergeStrategy::DEEP_MERGE;
    if (name == "append" || name == "array_append") return MergeStrategy::ARRAY_APPEND;
    throw FlowError(ErrorCode::INVALID_ARGUMENT, "Unknown merge strategy: " + name);
}

ExecutionContext::ExecutionContext(Value input)
    : input_(input.is_null() ? Value::object() : std::move(input)) {}

Value ExecutionContext::get(const std::string& dotted) const {
    return get(split_path(dotted));
}

Value ExecutionContext::get(const std::vector<std::string>& path, size_t from) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_at_path(ctx_, path, from);
}

bool ExecutionContext::has_key(const std::string& top_level_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.contains(top_level_key);
}

void ExecutionContext::set(const std::string& dotted, Value v, MergeStrategy strategy) {
    auto path = split_path(dotted);
    std::lock_guard<std::mutex> lock(mutex_);
    if (strategy != MergeStrategy::REPLACE) {
        v = merged(get_at_path(ctx_, path), std::move(v), strategy);
    }
    set_at_path(ctx_, path, std::move(v));
}

bool ExecutionContext::erase(const std::string& dotted) {
    std::lock_guard<std::mutex> lock(mutex_);
    return erase_at_path(ctx_, split_path(dotted));
}

Value ExecutionContext::ctx() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_;
}

void ExecutionContext::record_output(const NodeId& node, Value output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_[node] = Value{{"output", std::move(output)}};
    current_ = node;
}

void ExecutionContext::record_failure(const ErrorInfo& error) {
    Value err = error.to_value();
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_[error.node] = Value{{"output", nullptr}, {"error", err}};
    ctx_["error"] = std::move(err);
}

Value ExecutionContext::node_record(const NodeId& node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outputs_.find(node);
    return it == outputs_.end() ? Value(nullptr) : it->second;
}

bool ExecutionContext::has_node_record(const NodeId& node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outputs_.count(node) > 0;
}

std::optional<std::pair<NodeId, size_t>> ExecutionContext::match_node(const std::vector<std::string>& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t n = path.size(); n >= 1; --n) {
        NodeId candidate = join_path(std::vector<std::string>(path.begin(), path.begin() + n));
        if (outputs_.count(candidate)) return std::make_pair(candidate, n);
    }
    return std::nullopt;
}

Value ExecutionContext::current_output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) return nullptr;
    auto it = outputs_.find(*current_);
    return it == outputs_.end() ? Value(nullptr) : it->second.value("output", Value(nullptr));
}

std::optional<NodeId> ExecutionContext::current_node() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ExecutionContext::set_reply(Value reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    reply_ = std::move(reply);
}

Value ExecutionContext::reply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reply_;
}

void ExecutionContext::enter_execution(const std::string& identifier, int max_depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(execution_stack_.begin(), execution_stack_.end(), identifier) != execution_stack_.end()) {
        std::string chain;
        for (const auto& id : execution_stack_) chain += id + " -> ";
        throw FlowError(ErrorCode::RECURSION_LIMIT, "Recursive workflow execution: " + chain + identifier,
                        {}, Value{{"stack", execution_stack_}});
    }
    if (max_depth >= 0 && static_cast<int>(execution_stack_.size()) >= max_depth) {
        throw FlowError(ErrorCode::RECURSION_LIMIT, "Maximum workflow nesting depth (" +
                        std::to_string(max_depth) + ") exceeded at " + identifier);
    }
    execution_stack_.push_back(identifier);
}

void ExecutionContext::exit_execution(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(execution_stack_.rbegin(), execution_stack_.rend(), identifier);
    if (it != execution_stack_.rend()) execution_stack_.erase(std::next(it).base());
}

std::vector<std::string> ExecutionContext::execution_stack() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return execution_stack_;
}

void ExecutionContext::inherit_execution_stack(std::vector<std::string> stack) {
    std::lock_guard<std::mutex> lock(mutex_);
    execution_stack_ = std::move(stack);
}

Value ExecutionContext::to_value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Value outputs = Value::object();
    for (const auto& [id, record] : outputs_) outputs[id] = record;
    return Value{{"input", input_}, {"ctx", ctx_}, {"outputs", outputs}, {"reply", reply_}};
}

} // namespace agentflow
