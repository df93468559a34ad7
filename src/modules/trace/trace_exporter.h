// modules/trace/trace_exporter.h
#ifndef AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include "core/types/node.h" // 引入 NodeId, NodeKind
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct TraceRecord {
    std::string trace_id;
    NodeId node_id;
    std::string kind;   // "call", "literal", "foreach", "while"
    std::string status; // "running", "done", "failed", "unreachable"
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::optional<std::string> error_code;
    Value context_delta = Value::object(); // ctx keys changed while the node ran
    Value budget_snapshot = Value::object();
};

// One record per node visit. Thread-safe: concurrent nodes report from worker threads.
class TraceExporter {
public:
    explicit TraceExporter(std::string trace_id = "t-default") : trace_id_(std::move(trace_id)) {}

    void on_node_start(const NodeId& node, NodeKind kind, const Value& budget);
    void on_node_end(const NodeId& node, const std::string& status, const std::optional<std::string>& error_code,
                     const Value& ctx_before, const Value& ctx_after, const Value& budget);
    void on_node_unreachable(const NodeId& node, NodeKind kind);

    std::vector<TraceRecord> get_traces() const;
    // how many records for `node` ended with `status`
    size_t count(const NodeId& node, const std::string& status) const;
    void clear_traces();

    static Value calculate_context_delta(const Value& before, const Value& after);
    static Value to_value(const TraceRecord& record);

private:
    std::string trace_id_;
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
