#ifndef AGENTFLOW_TYPES_EVENT_H
#define AGENTFLOW_TYPES_EVENT_H

#include "context.h"
#include "errors.h"
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace agentflow {

// Observer channel event: node_start, content, node_complete, node_skipped,
// error, done, tool_call, notify
struct Event {
    std::string type;
    NodeId node;
    Value data = nullptr;

    Value to_value() const;
};

// 外部观察者 (SSE, CLI). Fire-and-forget.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;
};

// Serializes emits of one run so the sink sees a single ordered sequence.
// A channel without a sink drops events.
class EventChannel {
public:
    EventChannel() = default;
    explicit EventChannel(std::shared_ptr<EventSink> sink) : sink_(std::move(sink)) {}

    void emit(const Event& event);
    void emit(std::string type, NodeId node, Value data = nullptr) {
        emit(Event{std::move(type), std::move(node), std::move(data)});
    }

    bool attached() const { return sink_ != nullptr; }
    const std::shared_ptr<EventSink>& sink() const { return sink_; }

private:
    std::shared_ptr<EventSink> sink_;
    std::mutex mutex_;
};

// Keeps every event in memory
class CollectingEventSink : public EventSink {
public:
    void emit(const Event& event) override;

    std::vector<Event> events() const;
    std::vector<Event> events_of(const std::string& type) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// Writes one JSON document per line
class JsonLinesEventSink : public EventSink {
public:
    explicit JsonLinesEventSink(std::ostream& out) : out_(out) {}
    void emit(const Event& event) override;

private:
    std::ostream& out_;
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_EVENT_H
