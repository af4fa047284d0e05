#include "geo_query/query_events.hpp"

#include <stdexcept>

namespace geo_query {

std::string_view to_string(QueryEventKind kind) noexcept {
    switch (kind) {
        case QueryEventKind::Entered:
            return "entered";
        case QueryEventKind::Exited:
            return "exited";
        case QueryEventKind::Changed:
            return "changed";
        case QueryEventKind::Moved:
            return "moved";
        case QueryEventKind::Error:
            return "error";
        case QueryEventKind::Ready:
            return "ready";
    }
    return "unknown";
}

void QueryEventQueue::on_event(const QueryEvent& event) {
    std::scoped_lock lock(mutex_);
    queue_events_.push(event);
}

std::optional<QueryEvent> QueryEventQueue::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    QueryEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t QueryEventQueue::size() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

CallbackSink::CallbackSink(Callback callback)
    : callback_(std::move(callback)) {
    if (!callback_) {
        throw std::invalid_argument("CallbackSink requires a callable");
    }
}

void CallbackSink::on_event(const QueryEvent& event) {
    callback_(event);
}

}  // namespace geo_query
