// modules/scheduler/execution_session.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define AGENTFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "context/execution_context.h"
#include "core/types/event.h"
#include "core/types/node.h"
#include "tools/tool_context.h"
#include "trace/trace_exporter.h"
#include <functional>
#include <optional>

namespace agentflow {

// Outcome of one node visit
struct NodeResult {
    NodeId node;
    bool success = false;
    Value value = nullptr;
    bool persist = true;
    bool stream = true;
    std::optional<ErrorInfo> error;
};

// ExecutionSession 执行单个节点: budget, dispatch, last-output bookkeeping, trace and events.
// Loop bodies are handed back to the scheduler through BodyRunner.
class ExecutionSession {
public:
    // runs one body iteration; returns the body's result value, throws FlowError on failure
    using BodyRunner = std::function<Value(const WorkflowGraph&, ExecutionContext&, const LoopScopes&)>;

    ExecutionSession(RunServices& services, EventChannel& events, TraceExporter& traces, BodyRunner body_runner);

    // Never throws: failures come back in NodeResult::error, attributed to the node
    NodeResult execute_node(const Node& node, ExecutionContext& context, const LoopScopes& scopes);

    RunServices& services() { return services_; }
    EventChannel& events() { return events_; }
    TraceExporter& traces() { return traces_; }

private:
    Value execute_call(const CallNode& node, ExecutionContext& context, const LoopScopes& scopes, NodeResult& result);
    Value execute_foreach(const ForEachNode& node, ExecutionContext& context, const LoopScopes& scopes);
    Value execute_while(const WhileNode& node, ExecutionContext& context, const LoopScopes& scopes);
    Value run_iteration(const Node& loop, const WorkflowGraph& body, ExecutionContext& context,
                        const LoopScopes& scopes, int64_t iteration);

    Value budget_snapshot() const;

    RunServices& services_;
    EventChannel& events_;
    TraceExporter& traces_;
    BodyRunner body_runner_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
