// modules/scheduler/cancellation.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_CANCELLATION_H
#define AGENTFLOW_MODULES_SCHEDULER_CANCELLATION_H

#include "core/types/errors.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace agentflow {

// Shared run-level cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel(const std::string& reason) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) return;
        state_->reason = reason;
    }

    bool cancelled() const { return state_->cancelled.load(); }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->reason;
    }

    void throw_if_cancelled(const NodeId& node = {}) const {
        if (cancelled()) throw FlowError(ErrorCode::CANCELLED, "Run cancelled: " + reason(), node);
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::string reason;
        std::mutex mutex;
    };
    std::shared_ptr<State> state_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_CANCELLATION_H
