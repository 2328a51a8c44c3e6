#pragma once

#include "rooms/RoomEvent.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

// [REALTIME_AGENT] Bounded per-connection event queue
// Decouples publish from delivery: publishers never block on a slow consumer.
// A full queue rejects the new event; a closed queue rejects everything.

namespace NearbyConnect {

class EventOutbox {
public:
    enum class PushResult : uint8_t {
        QUEUED,
        FULL,
        CLOSED
    };

    explicit EventOutbox(size_t capacity = Constants::DEFAULT_OUTBOX_CAPACITY);

    PushResult push(RoomEventPtr event);

    // Up to maxEvents queued events, oldest first, without waiting
    [[nodiscard]] std::vector<RoomEventPtr> poll(size_t maxEvents = SIZE_MAX);

    // Next event, or nullptr on timeout or once closed and drained
    [[nodiscard]] RoomEventPtr waitPop(std::chrono::milliseconds timeout);

    // Wakes waiters; queued events stay readable
    void close();

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] uint64_t getDroppedCount() const { return dropped_.load(); }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RoomEventPtr> queue_;
    bool closed_{false};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace NearbyConnect
