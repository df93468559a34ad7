// modules/scheduler/topo_scheduler.cpp
#include "scheduler/topo_scheduler.h"
#include "budget/budget_controller.h"
#include "common/utils/logger.h"
#include "expr/variable_resolver.h"
#include "tools/client_bridge.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace agentflow {

std::string to_string(NodeStatus status) {
    switch (status) {
    case NodeStatus::PENDING: return "pending";
    case NodeStatus::READY: return "ready";
    case NodeStatus::RUNNING: return "running";
    case NodeStatus::DONE: return "done";
    case NodeStatus::FAILED: return "failed";
    case NodeStatus::UNREACHABLE: return "unreachable";
    }
    return "unknown";
}

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Per-invocation state of TopoScheduler::run
class GraphRun {
public:
    GraphRun(const WorkflowGraph& graph, ExecutionContext& context, const LoopScopes& scopes,
             ExecutionSession& session, int max_parallel)
        : graph_(graph), context_(context), scopes_(scopes), session_(session),
          max_parallel_(max_parallel > 0 ? static_cast<size_t>(max_parallel) : 1) {}

    Value execute();

private:
    struct NodeState {
        NodeStatus status = NodeStatus::PENDING;
        size_t undecided = 0; // incoming edges not yet satisfied or killed
    };

    void seed();
    void launch_ready();
    void check_deadline();
    void on_done(const NodeResult& result);
    void on_failed(const NodeId& id, const ErrorInfo& error);
    void satisfy(const Edge& edge);
    void kill(const Edge& edge);
    void mark_ready(const NodeId& id);
    void mark_unreachable(const NodeId& id);
    bool stopping() const { return failure_.has_value() || session_.services().cancel.cancelled(); }
    Value collect_output() const;

    const WorkflowGraph& graph_;
    ExecutionContext& context_;
    const LoopScopes& scopes_;
    ExecutionSession& session_;
    const size_t max_parallel_;

    std::unordered_map<NodeId, NodeState> states_;
    std::unordered_map<NodeId, std::vector<const Edge*>> outgoing_;
    std::unordered_map<NodeId, Value> values_;
    std::deque<NodeId> ready_;
    std::optional<ErrorInfo> failure_;
    std::optional<NodeId> last_persisted_;

    // completion queue, filled from worker threads
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<NodeResult> completed_;
    // declared last: destroying the futures joins any task still using the queue
    std::unordered_map<NodeId, std::future<void>> running_;
};

Value GraphRun::execute() {
    seed();

    while (true) {
        check_deadline();
        if (!stopping()) launch_ready();
        if (running_.empty()) {
            if (ready_.empty() || stopping()) break;
            continue;
        }

        std::deque<NodeResult> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, kPollInterval, [this] { return !completed_.empty(); });
            batch.swap(completed_);
        }
        for (auto& result : batch) {
            auto it = running_.find(result.node);
            if (it != running_.end()) {
                it->second.get();
                running_.erase(it);
            }
            if (result.success) {
                on_done(result);
            } else {
                on_failed(result.node, *result.error);
            }
        }
    }

    if (!failure_ && session_.services().cancel.cancelled()) {
        failure_ = ErrorInfo{ErrorCode::CANCELLED, "Run cancelled: " + session_.services().cancel.reason(), {}, nullptr};
    }

    // whatever never became ready is unreachable
    for (const auto& node : graph_.nodes) {
        NodeStatus status = states_[node->id].status;
        if (status == NodeStatus::PENDING || status == NodeStatus::READY) mark_unreachable(node->id);
    }

    if (failure_) {
        throw FlowError(failure_->code, failure_->message, failure_->node, failure_->details);
    }
    return collect_output();
}

void GraphRun::seed() {
    for (const auto& node : graph_.nodes) {
        states_[node->id];
        outgoing_[node->id];
    }
    for (const auto& edge : graph_.edges) {
        states_[edge.to].undecided++;
        outgoing_[edge.from].push_back(&edge);
    }

    if (!graph_.entry.empty()) {
        for (const auto& id : graph_.entry) mark_ready(id);
        // zero-incoming nodes outside the entry set never run
        for (const auto& node : graph_.nodes) {
            const NodeState& state = states_[node->id];
            if (state.status == NodeStatus::PENDING && state.undecided == 0) mark_unreachable(node->id);
        }
    } else {
        for (const auto& node : graph_.nodes) {
            if (states_[node->id].undecided == 0) mark_ready(node->id);
        }
    }
}

void GraphRun::launch_ready() {
    while (!ready_.empty() && running_.size() < max_parallel_) {
        NodeId id = ready_.front();
        ready_.pop_front();
        const Node* node = graph_.find_node(id);
        if (!node) continue;

        states_[id].status = NodeStatus::RUNNING;
        running_[id] = std::async(std::launch::async, [this, node] {
            NodeResult result = session_.execute_node(*node, context_, scopes_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                completed_.push_back(std::move(result));
            }
            cv_.notify_one();
        });
    }
}

void GraphRun::check_deadline() {
    RunServices& services = session_.services();
    if (!services.budget || services.cancel.cancelled() || !services.budget->timed_out()) return;
    log_warning("Run exceeded max_duration_sec, cancelling");
    services.cancel.cancel("max_duration_sec exceeded");
    if (services.bridge) services.bridge->cancel_all("max_duration_sec exceeded");
}

void GraphRun::on_done(const NodeResult& result) {
    const NodeId& id = result.node;
    states_[id].status = NodeStatus::DONE;
    values_[id] = result.value;
    if (result.persist) last_persisted_ = id;

    const auto& edges = outgoing_[id];
    std::vector<bool> passed(edges.size(), false);
    bool has_conditional = false;
    bool any_passed = false;

    VariableResolver resolver(context_, scopes_);
    for (size_t i = 0; i < edges.size(); ++i) {
        const Edge& edge = *edges[i];
        if (edge.kind != EdgeKind::NORMAL || !edge.is_conditional()) continue;
        has_conditional = true;
        std::optional<ErrorCode> broken;
        std::string reason;
        try {
            passed[i] = resolver.condition(*edge.condition);
        } catch (const FlowError& e) {
            broken = e.code();
            reason = e.what();
        } catch (const std::exception& e) {
            broken = ErrorCode::EVAL_ERROR;
            reason = e.what();
        }
        if (broken) {
            // a broken condition fails its source node
            ErrorInfo info{*broken, "Edge condition '" + *edge.condition + "' failed: " + reason, id,
                           Value{{"to", edge.to}, {"condition", *edge.condition}}};
            session_.events().emit("error", id, info.to_value());
            on_failed(id, info);
            return;
        }
        any_passed = any_passed || passed[i];
    }

    for (size_t i = 0; i < edges.size(); ++i) {
        const Edge& edge = *edges[i];
        if (edge.kind == EdgeKind::ON_ERROR) {
            kill(edge);
        } else if (edge.is_conditional()) {
            passed[i] ? satisfy(edge) : kill(edge);
        } else if (!has_conditional || !any_passed) {
            satisfy(edge); // default branch
        } else {
            kill(edge);
        }
    }
}

void GraphRun::on_failed(const NodeId& id, const ErrorInfo& error) {
    states_[id].status = NodeStatus::FAILED;

    const Edge* handler = nullptr;
    for (const Edge* edge : outgoing_[id]) {
        if (edge->kind == EdgeKind::ON_ERROR) {
            handler = edge;
            break;
        }
    }

    if (handler) {
        log_warning("Node '" + id + "' failed (" + to_string(error.code) + "), routing to '" + handler->to + "'");
        context_.record_failure(error);
    } else {
        log_error("Node '" + id + "' failed: " + error.message);
        if (!failure_) failure_ = error;
    }
    for (const Edge* edge : outgoing_[id]) {
        edge == handler ? satisfy(*edge) : kill(*edge);
    }
}

void GraphRun::satisfy(const Edge& edge) {
    NodeState& state = states_[edge.to];
    if (state.undecided > 0) state.undecided--;
    if (state.status == NodeStatus::PENDING) mark_ready(edge.to);
}

void GraphRun::kill(const Edge& edge) {
    NodeState& state = states_[edge.to];
    if (state.undecided > 0) state.undecided--;
    if (state.status == NodeStatus::PENDING && state.undecided == 0) mark_unreachable(edge.to);
}

void GraphRun::mark_ready(const NodeId& id) {
    NodeState& state = states_[id];
    if (state.status != NodeStatus::PENDING) return;
    state.status = NodeStatus::READY;
    ready_.push_back(id);
}

void GraphRun::mark_unreachable(const NodeId& id) {
    NodeState& state = states_[id];
    if (state.status == NodeStatus::UNREACHABLE) return;
    state.status = NodeStatus::UNREACHABLE;

    if (const Node* node = graph_.find_node(id)) session_.traces().on_node_unreachable(id, node->kind);
    session_.events().emit("node_skipped", id, Value{{"reason", "unreachable"}});
    for (const Edge* edge : outgoing_[id]) kill(*edge);
}

Value GraphRun::collect_output() const {
    auto value_of = [this](const NodeId& id) -> Value {
        auto it = values_.find(id);
        return it == values_.end() ? Value(nullptr) : it->second;
    };

    if (graph_.exit.size() == 1) return value_of(graph_.exit.front());
    if (!graph_.exit.empty()) {
        Value out = Value::object();
        for (const auto& id : graph_.exit) out[id] = value_of(id);
        return out;
    }
    return last_persisted_ ? value_of(*last_persisted_) : Value(nullptr);
}

} // namespace

TopoScheduler::TopoScheduler(Config config, RunServices& services, EventChannel& events, TraceExporter& traces)
    : config_(config),
      session_(services, events, traces,
               [this](const WorkflowGraph& body, ExecutionContext& context, const LoopScopes& scopes) {
                   return this->run(body, context, scopes);
               }) {}

Value TopoScheduler::run(const WorkflowGraph& graph, ExecutionContext& context, const LoopScopes& scopes) {
    GraphRun run(graph, context, scopes, session_, config_.max_parallel);
    return run.execute();
}

} // namespace agentflow
