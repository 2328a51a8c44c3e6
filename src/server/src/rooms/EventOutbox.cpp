#include "rooms/EventOutbox.hpp"
#include <algorithm>
#include <utility>

namespace NearbyConnect {

EventOutbox::EventOutbox(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

EventOutbox::PushResult EventOutbox::push(RoomEventPtr event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            dropped_++;
            return PushResult::CLOSED;
        }
        if (queue_.size() >= capacity_) {
            dropped_++;
            return PushResult::FULL;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return PushResult::QUEUED;
}

std::vector<RoomEventPtr> EventOutbox::poll(size_t maxEvents) {
    std::lock_guard<std::mutex> lock(mutex_);

    const size_t count = std::min(maxEvents, queue_.size());
    std::vector<RoomEventPtr> events;
    events.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        events.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return events;
}

RoomEventPtr EventOutbox::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        return nullptr;
    }
    RoomEventPtr event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventOutbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventOutbox::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventOutbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace NearbyConnect
