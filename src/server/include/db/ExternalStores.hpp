#pragma once

#include "core/CoreTypes.hpp"
#include <optional>
#include <vector>

// [DATABASE_AGENT] Collaborators the core consumes but does not own
// Implementations may block; they are the only suspension points of a request.
// Write failures are reported through return values. A read that cannot be answered
// throws StoreUnavailableError so it is never mistaken for a missing record.

namespace NearbyConnect {

class UserStore {
public:
    virtual ~UserStore() = default;

    // nullopt when the user does not exist; StoreUnavailableError when the store can't say
    [[nodiscard]] virtual std::optional<UserProfile> getUser(const UserId& userId) = 0;
};

class MessageStore {
public:
    virtual ~MessageStore() = default;

    // Durably record the message; returns the assigned id, nullopt on failure
    [[nodiscard]] virtual std::optional<MessageId> persistMessage(const OutboundMessage& message) = 0;
};

class LocationStore {
public:
    virtual ~LocationStore() = default;

    [[nodiscard]] virtual bool persistLocation(const UserId& userId, double lat, double lon,
                                               Timestamp at) = 0;

    // Forget a user's stored point (pruned or deleted accounts)
    virtual bool removeLocation(const UserId& userId) = 0;

    // Every stored point, used to warm the spatial index after a restart
    [[nodiscard]] virtual std::vector<LocationPoint> loadLocations() = 0;
};

} // namespace NearbyConnect
