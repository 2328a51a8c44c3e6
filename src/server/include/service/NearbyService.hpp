#pragma once

#include "core/CoreTypes.hpp"
#include "db/ExternalStores.hpp"
#include "geo/GeoSpatialIndex.hpp"
#include "messaging/MessageDispatcher.hpp"
#include "presence/PresenceRegistry.hpp"
#include "proximity/ProximityQueryEngine.hpp"
#include "rooms/LocationAccessPolicy.hpp"
#include "rooms/RoomRouter.hpp"
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// [SERVER_AGENT] Operations exposed to the request and socket handlers
// Owns the in-memory state (index, presence, rooms, grants). The stores are borrowed
// and must outlive the service.

namespace NearbyConnect {

struct ServiceOptions {
    size_t outboxCapacity{Constants::DEFAULT_OUTBOX_CAPACITY};
    PresenceRegistry::Window presenceWindow{Constants::PRESENCE_WINDOW};
};

// Snapshot for the periodic stats log
struct ServiceStats {
    size_t indexedUsers{0};
    size_t presenceRecords{0};
    size_t connections{0};
    size_t rooms{0};
    uint64_t messagesSent{0};
    uint64_t eventsPublished{0};
    uint64_t deliveries{0};
    uint64_t deliveryFailures{0};
    uint64_t messagePersistFailures{0};
    uint64_t locationPersistFailures{0};
};

class NearbyService {
public:
    using NowFn = std::function<Timestamp()>;

    NearbyService(UserStore& users, MessageStore& messages, LocationStore& locations,
                  ServiceOptions options = {}, NowFn now = [] { return Clock::now(); });

    NearbyService(const NearbyService&) = delete;
    NearbyService& operator=(const NearbyService&) = delete;

    // === Location / discovery ===

    // Index, touch presence, persist (best effort), publish to location_updates_{user}.
    // False for an update older than the stored point; nothing else happens then.
    // Writes for one user reach the location store in index order.
    bool updateLocation(const UserId& userId, double lat, double lon);

    // Throws ValidationError, NotFoundError for an unknown requester, or
    // StoreUnavailableError when the user store cannot answer
    [[nodiscard]] std::vector<NearbyUser> findNearby(const UserId& requesterId,
                                                     double lat, double lon,
                                                     double radiusMiles = Constants::DEFAULT_RADIUS_MILES);

    // === Messaging ===

    MessageId sendMessage(const UserId& senderId,
                          const std::vector<UserId>& recipientIds,
                          const std::string& content,
                          const std::optional<std::string>& imageData = std::nullopt);

    // === Connections and rooms ===

    bool onConnect(ConnectionID connectionId, const UserId& userId);
    bool onDisconnect(ConnectionID connectionId);

    // Throws NotFoundError (unknown connection) or PermissionDeniedError
    void joinRoom(ConnectionID connectionId, const RoomId& roomId);
    void leaveRoom(ConnectionID connectionId, const RoomId& roomId);

    bool grantLocationAccess(const UserId& owner, const UserId& viewer);

    // Also evicts the viewer's live connections from the owner's location room
    bool revokeLocationAccess(const UserId& owner, const UserId& viewer);

    // Throws NotFoundError for an unknown connection
    [[nodiscard]] std::vector<RoomEventPtr> pollEvents(ConnectionID connectionId,
                                                       size_t maxEvents = SIZE_MAX);
    [[nodiscard]] std::shared_ptr<EventOutbox> outbox(ConnectionID connectionId) const;

    // === Maintenance ===

    // Warm the index from the location store; returns points restored
    size_t restoreLocations();

    // Remove index points of users inactive for longer than retention
    size_t pruneStaleLocations(Timestamp now,
                               PresenceRegistry::Window retention = Constants::LOCATION_RETENTION);

    size_t pruneEmptyRooms() { return router_.pruneEmptyRooms(); }

    [[nodiscard]] ServiceStats getStats() const;

    // Component access for the server loop and tests
    [[nodiscard]] const GeoSpatialIndex& index() const { return index_; }
    [[nodiscard]] const PresenceRegistry& presence() const { return presence_; }
    [[nodiscard]] const RoomRouter& router() const { return router_; }
    [[nodiscard]] Timestamp now() const { return now_(); }

    // "location_update" event body
    [[nodiscard]] static nlohmann::json toLocationPayload(const LocationPoint& point);

private:
    UserStore& users_;
    LocationStore& locations_;
    NowFn now_;

    GeoSpatialIndex index_;
    PresenceRegistry presence_;
    RoomRouter router_;
    LocationAccessPolicy policy_;
    ProximityQueryEngine engine_;
    MessageDispatcher dispatcher_;

    std::atomic<uint64_t> locationPersistFailures_{0};

    // Serializes location-room authorization (check + join) against revoke + evict
    std::mutex accessMutex_;

    // Index upsert + store write of one user happen under the same stripe
    std::array<std::mutex, Constants::LOCATION_WRITE_STRIPES> writeStripes_;

    [[nodiscard]] std::mutex& writeStripeFor(const UserId& userId);

    [[nodiscard]] UserId requireIdentity(ConnectionID connectionId) const;
};

} // namespace NearbyConnect
