#include "rooms/LocationAccessPolicy.hpp"

namespace NearbyConnect {

bool LocationAccessPolicy::grant(const UserId& owner, const UserId& viewer) {
    if (owner == viewer) {
        return false;  // Implicit
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_[owner].insert(viewer).second;
}

bool LocationAccessPolicy::revoke(const UserId& owner, const UserId& viewer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(owner);
    if (it == grants_.end()) {
        return false;
    }
    bool removed = it->second.erase(viewer) > 0;
    if (it->second.empty()) {
        grants_.erase(it);
    }
    return removed;
}

bool LocationAccessPolicy::isAllowed(const UserId& viewer, const UserId& owner) const {
    if (viewer == owner) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(owner);
    return it != grants_.end() && it->second.count(viewer) > 0;
}

std::vector<UserId> LocationAccessPolicy::viewersOf(const UserId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(owner);
    if (it == grants_.end()) {
        return {};
    }
    return std::vector<UserId>(it->second.begin(), it->second.end());
}

} // namespace NearbyConnect
