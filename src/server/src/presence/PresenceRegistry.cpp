#include "presence/PresenceRegistry.hpp"
#include <functional>

namespace NearbyConnect {

PresenceRegistry::Shard& PresenceRegistry::shardFor(const UserId& userId) {
    return shards_[std::hash<UserId>{}(userId) % shards_.size()];
}

const PresenceRegistry::Shard& PresenceRegistry::shardFor(const UserId& userId) const {
    return shards_[std::hash<UserId>{}(userId) % shards_.size()];
}

bool PresenceRegistry::touch(const UserId& userId, Timestamp at) {
    Shard& shard = shardFor(userId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto [it, inserted] = shard.lastActive.try_emplace(userId, at);
    if (inserted) {
        return true;
    }
    if (at <= it->second) {
        return false;  // Reordered or duplicate activity
    }
    it->second = at;
    return true;
}

bool PresenceRegistry::isActive(const UserId& userId, Timestamp now, Window window) const {
    auto last = lastActive(userId);
    return last && withinWindow(*last, now, window);
}

std::optional<Timestamp> PresenceRegistry::lastActive(const UserId& userId) const {
    const Shard& shard = shardFor(userId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.lastActive.find(userId);
    if (it == shard.lastActive.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PresenceRegistry::contains(const UserId& userId) const {
    return lastActive(userId).has_value();
}

std::vector<UserPresence> PresenceRegistry::activeUsers(Timestamp now, Window window) const {
    std::vector<UserPresence> result;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [userId, last] : shard.lastActive) {
            if (withinWindow(last, now, window)) {
                result.push_back({userId, last});
            }
        }
    }
    return result;
}

size_t PresenceRegistry::size() const {
    size_t count = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        count += shard.lastActive.size();
    }
    return count;
}

} // namespace NearbyConnect
