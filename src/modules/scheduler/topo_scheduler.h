// modules/scheduler/topo_scheduler.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H
#define AGENTFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H

#include "context/execution_context.h" // 引入 ExecutionContext, LoopScopes
#include "core/types/node.h"           // 引入 WorkflowGraph
#include "scheduler/execution_session.h"
#include <cstdint>
#include <string>

namespace agentflow {

// 节点运行状态
enum class NodeStatus : uint8_t {
    PENDING,
    READY,
    RUNNING,
    DONE,
    FAILED,
    UNREACHABLE
};

std::string to_string(NodeStatus status);

// Drives one merged graph to completion.
//
// A node becomes READY the first time an incoming edge is satisfied and UNREACHABLE once
// every incoming edge is decided impossible. Ready nodes run as std::async tasks, at most
// `max_parallel` at a time; edge evaluation and status changes stay on the calling thread.
class TopoScheduler {
public:
    struct Config {
        int max_parallel = 8;
        Config() = default;
    };

    TopoScheduler(Config config, RunServices& services, EventChannel& events, TraceExporter& traces);

    // Value of the exit node(s), or of the last persisted node when no exit is declared.
    // throws FlowError with the first failure no OnError edge handled.
    // Reentrant: loop bodies run through the same instance on worker threads.
    Value run(const WorkflowGraph& graph, ExecutionContext& context, const LoopScopes& scopes = {});

    ExecutionSession& session() { return session_; }

private:
    Config config_;
    ExecutionSession session_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H
