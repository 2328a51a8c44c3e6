// [SERVER_AGENT] NearbyService implementation

#include "service/NearbyService.hpp"
#include "core/Errors.hpp"
#include "geo/GeoMath.hpp"
#include <functional>
#include <iostream>
#include <mutex>
#include <utility>

namespace NearbyConnect {

NearbyService::NearbyService(UserStore& users, MessageStore& messages, LocationStore& locations,
                             ServiceOptions options, NowFn now)
    : users_(users)
    , locations_(locations)
    , now_(std::move(now))
    , router_(options.outboxCapacity)
    , engine_(index_, presence_, options.presenceWindow)
    , dispatcher_(users, messages, router_, presence_) {}

// ============================================================================
// Location / discovery
// ============================================================================

bool NearbyService::updateLocation(const UserId& userId, double lat, double lon) {
    if (userId.empty()) {
        throw ValidationError("user id must not be empty");
    }
    Geo::validateCoordinate(lat, lon);

    const Timestamp now = now_();
    {
        // A concurrent older update for this user either lands first or is rejected,
        // so the store never ends up behind the index
        std::lock_guard<std::mutex> lock(writeStripeFor(userId));
        if (!index_.upsert(userId, lat, lon, now)) {
            return false;  // A newer point is already indexed
        }
        presence_.touch(userId, now);

        if (!locations_.persistLocation(userId, lat, lon, now)) {
            locationPersistFailures_++;
            std::cerr << "[SERVICE] Failed to persist location for " << userId << std::endl;
        }
    }

    LocationPoint point{userId, lat, lon, now};
    const RoomId room = RoomNames::locationUpdates(userId);
    router_.publish(room, makeRoomEvent(room, Constants::EVENT_LOCATION_UPDATE,
                                        toLocationPayload(point), now));
    return true;
}

std::vector<NearbyUser> NearbyService::findNearby(const UserId& requesterId,
                                                  double lat, double lon, double radiusMiles) {
    // Reject bad input before any store round trip
    ProximityQueryEngine::validateRadius(radiusMiles);
    Geo::validateCoordinate(lat, lon);

    if (!users_.getUser(requesterId)) {
        throw NotFoundError("unknown user: " + requesterId);
    }

    auto results = engine_.nearby(requesterId, lat, lon, radiusMiles, now_());

    // Profile lookups happen after the query so no index lock is held across I/O
    for (auto& result : results) {
        if (auto profile = users_.getUser(result.userId)) {
            result.name = profile->name;
        }
    }
    return results;
}

nlohmann::json NearbyService::toLocationPayload(const LocationPoint& point) {
    return {
        {"user_id", point.userId},
        {"latitude", point.latitude},
        {"longitude", point.longitude},
        {"timestamp", toIso8601(point.updatedAt)}
    };
}

// ============================================================================
// Messaging
// ============================================================================

MessageId NearbyService::sendMessage(const UserId& senderId,
                                     const std::vector<UserId>& recipientIds,
                                     const std::string& content,
                                     const std::optional<std::string>& imageData) {
    return dispatcher_.send(senderId, recipientIds, content, imageData, now_());
}

// ============================================================================
// Connections and rooms
// ============================================================================

bool NearbyService::onConnect(ConnectionID connectionId, const UserId& userId) {
    if (userId.empty()) {
        throw ValidationError("user id must not be empty");
    }
    if (!router_.connect(connectionId, userId)) {
        std::cerr << "[SERVICE] Connection " << connectionId << " already registered" << std::endl;
        return false;
    }
    presence_.touch(userId, now_());
    return true;
}

bool NearbyService::onDisconnect(ConnectionID connectionId) {
    return router_.disconnect(connectionId);
}

UserId NearbyService::requireIdentity(ConnectionID connectionId) const {
    auto identity = router_.identityOf(connectionId);
    if (!identity) {
        throw NotFoundError("unknown connection: " + std::to_string(connectionId));
    }
    return *identity;
}

void NearbyService::joinRoom(ConnectionID connectionId, const RoomId& roomId) {
    const UserId viewer = requireIdentity(connectionId);

    std::unique_lock<std::mutex> accessLock(accessMutex_, std::defer_lock);
    if (auto owner = RoomNames::locationOwner(roomId)) {
        // Held through the join so a revoke cannot slip between check and subscribe
        accessLock.lock();
        if (!policy_.isAllowed(viewer, *owner)) {
            throw PermissionDeniedError(viewer + " may not follow " + *owner);
        }
    }

    if (!router_.join(connectionId, roomId)) {
        // Disconnected between the identity lookup and the join
        throw NotFoundError("unknown connection: " + std::to_string(connectionId));
    }
}

void NearbyService::leaveRoom(ConnectionID connectionId, const RoomId& roomId) {
    if (!router_.leave(connectionId, roomId)) {
        throw NotFoundError("unknown connection: " + std::to_string(connectionId));
    }
}

bool NearbyService::grantLocationAccess(const UserId& owner, const UserId& viewer) {
    if (owner.empty() || viewer.empty()) {
        throw ValidationError("user id must not be empty");
    }
    std::lock_guard<std::mutex> lock(accessMutex_);
    return policy_.grant(owner, viewer);
}

bool NearbyService::revokeLocationAccess(const UserId& owner, const UserId& viewer) {
    std::lock_guard<std::mutex> lock(accessMutex_);
    if (!policy_.revoke(owner, viewer)) {
        return false;
    }

    const RoomId room = RoomNames::locationUpdates(owner);
    for (ConnectionID connectionId : router_.connectionsOf(viewer)) {
        router_.leave(connectionId, room);
    }
    return true;
}

std::vector<RoomEventPtr> NearbyService::pollEvents(ConnectionID connectionId, size_t maxEvents) {
    auto box = router_.outbox(connectionId);
    if (!box) {
        throw NotFoundError("unknown connection: " + std::to_string(connectionId));
    }
    return box->poll(maxEvents);
}

std::shared_ptr<EventOutbox> NearbyService::outbox(ConnectionID connectionId) const {
    return router_.outbox(connectionId);
}

// ============================================================================
// Maintenance
// ============================================================================

size_t NearbyService::restoreLocations() {
    size_t restored = 0;
    size_t rejected = 0;

    for (const auto& point : locations_.loadLocations()) {
        if (!Geo::isValidCoordinate(point.latitude, point.longitude) || point.userId.empty()) {
            rejected++;
            continue;
        }
        if (index_.upsert(point.userId, point.latitude, point.longitude, point.updatedAt)) {
            presence_.touch(point.userId, point.updatedAt);
            restored++;
        }
    }

    std::cout << "[SERVICE] Restored " << restored << " locations";
    if (rejected > 0) {
        std::cout << " (" << rejected << " invalid)";
    }
    std::cout << std::endl;
    return restored;
}

size_t NearbyService::pruneStaleLocations(Timestamp now, PresenceRegistry::Window retention) {
    size_t pruned = 0;

    for (const auto& userId : index_.users()) {
        std::lock_guard<std::mutex> lock(writeStripeFor(userId));
        auto last = presence_.lastActive(userId);
        if (last && PresenceRegistry::withinWindow(*last, now, retention)) {
            continue;
        }
        if (index_.remove(userId)) {
            pruned++;
            if (!locations_.removeLocation(userId)) {
                std::cerr << "[SERVICE] Failed to remove stored location for " << userId << std::endl;
            }
        }
    }

    if (pruned > 0) {
        std::cout << "[SERVICE] Pruned " << pruned << " stale locations" << std::endl;
    }
    return pruned;
}

std::mutex& NearbyService::writeStripeFor(const UserId& userId) {
    return writeStripes_[std::hash<UserId>{}(userId) % writeStripes_.size()];
}

ServiceStats NearbyService::getStats() const {
    ServiceStats stats;
    stats.indexedUsers = index_.size();
    stats.presenceRecords = presence_.size();
    stats.connections = router_.getConnectionCount();
    stats.rooms = router_.getRoomCount();
    stats.messagesSent = dispatcher_.getMessagesSent();
    stats.eventsPublished = router_.getEventsPublished();
    stats.deliveries = router_.getDeliveries();
    stats.deliveryFailures = router_.getDeliveryFailures();
    stats.messagePersistFailures = dispatcher_.getPersistFailures();
    stats.locationPersistFailures = locationPersistFailures_.load();
    return stats;
}

} // namespace NearbyConnect
