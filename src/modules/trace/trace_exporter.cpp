// modules/trace/trace_exporter.cpp
#include "trace/trace_exporter.h"
#include <algorithm>

namespace agentflow {

void TraceExporter::on_node_start(const NodeId& node, NodeKind kind, const Value& budget) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.node_id = node;
    record.kind = to_string(kind);
    record.status = "running";
    record.start_time = std::chrono::system_clock::now();
    record.budget_snapshot = budget;

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

void TraceExporter::on_node_end(const NodeId& node, const std::string& status,
                                const std::optional<std::string>& error_code,
                                const Value& ctx_before, const Value& ctx_after, const Value& budget) {
    Value delta = calculate_context_delta(ctx_before, ctx_after);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(traces_.rbegin(), traces_.rend(), [&node](const TraceRecord& r) {
        return r.node_id == node && r.status == "running";
    });
    if (it == traces_.rend()) return;

    it->end_time = std::chrono::system_clock::now();
    it->status = status;
    it->error_code = error_code;
    it->context_delta = std::move(delta);
    it->budget_snapshot = budget;
}

void TraceExporter::on_node_unreachable(const NodeId& node, NodeKind kind) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.node_id = node;
    record.kind = to_string(kind);
    record.status = "unreachable";
    record.start_time = record.end_time = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

size_t TraceExporter::count(const NodeId& node, const std::string& status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(traces_.begin(), traces_.end(), [&](const TraceRecord& r) {
        return r.node_id == node && r.status == status;
    }));
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

Value TraceExporter::calculate_context_delta(const Value& before, const Value& after) {
    // Top-level keys only
    Value delta = Value::object();
    if (!after.is_object()) return delta;
    for (auto it = after.begin(); it != after.end(); ++it) {
        auto old = before.is_object() ? before.find(it.key()) : before.end();
        if (!before.is_object() || old == before.end() || *old != it.value()) delta[it.key()] = it.value();
    }
    if (before.is_object()) {
        for (auto it = before.begin(); it != before.end(); ++it) {
            if (!after.contains(it.key())) delta[it.key()] = nullptr; // deletion
        }
    }
    return delta;
}

Value TraceExporter::to_value(const TraceRecord& record) {
    auto ms = [](std::chrono::system_clock::time_point t) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    };
    Value v{
        {"trace_id", record.trace_id},
        {"node", record.node_id},
        {"kind", record.kind},
        {"status", record.status},
        {"start_ms", ms(record.start_time)},
        {"end_ms", ms(record.end_time)},
        {"context_delta", record.context_delta},
        {"budget", record.budget_snapshot}
    };
    if (record.error_code) v["error_code"] = *record.error_code;
    return v;
}

} // namespace agentflow
