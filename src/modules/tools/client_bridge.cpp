// modules/tools/client_bridge.cpp
#include "tools/client_bridge.h"
#include "common/utils/logger.h"
#include <algorithm>

namespace agentflow {

Value ClientBridge::emit_and_await(const std::string& target, const Value& args, EventChannel& events,
                                   const NodeId& node, const CancellationToken& cancel) {
    auto call = std::make_shared<PendingToolCall>();
    call->id = "call_" + std::to_string(next_id_++);
    call->target = target;
    call->args = args;
    call->deadline = std::chrono::steady_clock::now() + timeout_;
    std::future<Value> result = call->completion.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[call->id] = call;
    }

    log_debug("Client tool call " + call->id + ": " + target);
    events.emit("tool_call", node, Value{{"id", call->id}, {"target", target}, {"args", args}});

    // short waits so a cancelled run is noticed even when nobody calls cancel_all
    while (true) {
        auto slice = std::min(call->deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
        if (result.wait_until(slice) == std::future_status::ready) return result.get(); // rethrows reject/cancel
        if (cancel.cancelled()) {
            take(call->id);
            throw FlowError(ErrorCode::CANCELLED, "Client tool call cancelled: " + cancel.reason(), node,
                            Value{{"call_id", call->id}, {"target", target}});
        }
        if (std::chrono::steady_clock::now() >= call->deadline) {
            // a late resolve may have won the race
            if (!take(call->id)) return result.get();
            throw FlowError(ErrorCode::TOOL_TIMEOUT,
                            "Client did not answer '" + target + "' within " + std::to_string(timeout_.count()) + " ms",
                            node, Value{{"call_id", call->id}, {"target", target}});
        }
    }
}

std::shared_ptr<PendingToolCall> ClientBridge::take(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return nullptr;
    auto call = it->second;
    pending_.erase(it);
    return call;
}

bool ClientBridge::resolve(const std::string& id, Value result) {
    auto call = take(id);
    if (!call) {
        log_warning("Result for unknown client tool call " + id);
        return false;
    }
    call->completion.set_value(std::move(result));
    return true;
}

bool ClientBridge::reject(const std::string& id, const std::string& message) {
    auto call = take(id);
    if (!call) return false;
    call->completion.set_exception(std::make_exception_ptr(
        FlowError(ErrorCode::CALL_FAILURE, "Client tool '" + call->target + "' failed: " + message, {},
                  Value{{"call_id", id}, {"target", call->target}})));
    return true;
}

void ClientBridge::cancel_all(const std::string& reason) {
    std::map<std::string, std::shared_ptr<PendingToolCall>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    for (auto& [id, call] : drained) {
        call->completion.set_exception(std::make_exception_ptr(
            FlowError(ErrorCode::CANCELLED, "Client tool call cancelled: " + reason, {},
                      Value{{"call_id", id}, {"target", call->target}})));
    }
}

std::vector<std::string> ClientBridge::pending_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, _] : pending_) ids.push_back(id);
    return ids;
}

} // namespace agentflow
