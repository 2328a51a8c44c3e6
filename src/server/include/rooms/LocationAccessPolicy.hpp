#pragma once

#include "core/CoreTypes.hpp"
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// [SECURITY_AGENT] Who may subscribe to a user's location_updates room
// Owners always may; anyone else needs an explicit grant from the owner.

namespace NearbyConnect {

class LocationAccessPolicy {
public:
    // True if the grant is new
    bool grant(const UserId& owner, const UserId& viewer);

    // True if a grant was removed
    bool revoke(const UserId& owner, const UserId& viewer);

    [[nodiscard]] bool isAllowed(const UserId& viewer, const UserId& owner) const;
    [[nodiscard]] std::vector<UserId> viewersOf(const UserId& owner) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, std::unordered_set<UserId>> grants_;  // owner -> viewers
};

} // namespace NearbyConnect
