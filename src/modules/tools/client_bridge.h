// modules/tools/client_bridge.h
#ifndef AGENTFLOW_MODULES_TOOLS_CLIENT_BRIDGE_H
#define AGENTFLOW_MODULES_TOOLS_CLIENT_BRIDGE_H

#include "core/types/event.h"
#include "scheduler/cancellation.h"
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace agentflow {

// A tool call handed to the attached client, waiting for its result
struct PendingToolCall {
    std::string id;
    std::string target;
    Value args;
    std::promise<Value> completion; // single use
    std::chrono::steady_clock::time_point deadline;
};

// Round trips tool calls through the observer channel: the client sees a
// `tool_call {id, target, args}` event and answers with resolve(id, result).
class ClientBridge {
public:
    explicit ClientBridge(std::chrono::milliseconds timeout = std::chrono::seconds(120)) : timeout_(timeout) {}

    // Blocks until resolved, rejected (CallFailure), past the deadline (ToolTimeout)
    // or cancelled (Cancelled).
    Value emit_and_await(const std::string& target, const Value& args, EventChannel& events, const NodeId& node,
                         const CancellationToken& cancel);

    // false when `id` is not pending (already settled, timed out, unknown)
    bool resolve(const std::string& id, Value result);
    bool reject(const std::string& id, const std::string& message);

    // every pending call fails with Cancelled
    void cancel_all(const std::string& reason);

    std::vector<std::string> pending_ids() const;
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::shared_ptr<PendingToolCall> take(const std::string& id);

    std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PendingToolCall>> pending_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_CLIENT_BRIDGE_H
