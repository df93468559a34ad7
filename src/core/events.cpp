#include "core/types/event.h"

namespace agentflow {

Value Event::to_value() const {
    Value v{{"type", type}};
    if (!node.empty()) v["node"] = node;
    if (!data.is_null()) v["data"] = data;
    return v;
}

void EventChannel::emit(const Event& event) {
    if (!sink_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sink_->emit(event);
}

void CollectingEventSink::emit(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<Event> CollectingEventSink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<Event> CollectingEventSink::events_of(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.type == type) out.push_back(e);
    }
    return out;
}

void CollectingEventSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

void JsonLinesEventSink::emit(const Event& event) {
    out_ << event.to_value().dump() << '\n';
    out_.flush();
}

} // namespace agentflow
