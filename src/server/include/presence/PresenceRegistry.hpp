#pragma once

#include "core/CoreTypes.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

// [PRESENCE_AGENT] Last-activity registry
// Entries are never deleted; "active" is a pure function of now - lastActive.
// Concurrent touches are resolved by timestamp, not by arrival order.

namespace NearbyConnect {

class PresenceRegistry {
public:
    using Window = std::chrono::milliseconds;

    PresenceRegistry() = default;
    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;

    // Record activity. Returns false when `at` is not newer than the stored value.
    bool touch(const UserId& userId, Timestamp at = Clock::now());

    // now - lastActive < window (boundary excluded). Unknown users are inactive.
    [[nodiscard]] bool isActive(const UserId& userId, Timestamp now,
                                Window window = Constants::PRESENCE_WINDOW) const;

    [[nodiscard]] std::optional<Timestamp> lastActive(const UserId& userId) const;
    [[nodiscard]] bool contains(const UserId& userId) const;

    // Copy of every presence record that is active as of `now`
    [[nodiscard]] std::vector<UserPresence> activeUsers(Timestamp now,
                                                        Window window = Constants::PRESENCE_WINDOW) const;

    [[nodiscard]] size_t size() const;

    // Pure predicate shared with the query engine
    [[nodiscard]] static bool withinWindow(Timestamp lastActive, Timestamp now, Window window) {
        return now - lastActive < window;
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<UserId, Timestamp> lastActive;
    };

    std::array<Shard, Constants::PRESENCE_SHARDS> shards_;

    [[nodiscard]] Shard& shardFor(const UserId& userId);
    [[nodiscard]] const Shard& shardFor(const UserId& userId) const;
};

} // namespace NearbyConnect
