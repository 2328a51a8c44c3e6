#pragma once

#include "core/CoreTypes.hpp"
#include "rooms/EventOutbox.hpp"
#include "rooms/RoomEvent.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// [REALTIME_AGENT] Room-based publish/subscribe for connected clients
// Connections: Disconnected -> Connected (auto-joined to "messages") -> Disconnected.
// Each connection owns a bounded outbox; publish only enqueues.

namespace NearbyConnect {

struct PublishResult {
    size_t delivered{0};
    size_t failed{0};   // Full or closing outboxes, not retried
};

class RoomRouter {
public:
    explicit RoomRouter(size_t outboxCapacity = Constants::DEFAULT_OUTBOX_CAPACITY);
    ~RoomRouter();

    RoomRouter(const RoomRouter&) = delete;
    RoomRouter& operator=(const RoomRouter&) = delete;

    // Register a transport session for an authenticated user and join "messages".
    // False if the connection id is already registered.
    bool connect(ConnectionID connectionId, const UserId& userId);

    // Close the outbox, then drop every subscription. False for unknown connections.
    bool disconnect(ConnectionID connectionId);

    // Idempotent. False for unknown or closing connections.
    bool join(ConnectionID connectionId, const RoomId& roomId);

    // No-op when not a member. False for unknown connections.
    bool leave(ConnectionID connectionId, const RoomId& roomId);

    // Enqueue the event for every connection subscribed right now
    PublishResult publish(const RoomId& roomId, RoomEventPtr event);

    // Outbound event stream for one connection, nullptr when unknown
    [[nodiscard]] std::shared_ptr<EventOutbox> outbox(ConnectionID connectionId) const;

    [[nodiscard]] std::optional<UserId> identityOf(ConnectionID connectionId) const;
    [[nodiscard]] std::vector<ConnectionID> connectionsOf(const UserId& userId) const;
    [[nodiscard]] std::vector<RoomId> roomsOf(ConnectionID connectionId) const;
    [[nodiscard]] bool isMember(ConnectionID connectionId, const RoomId& roomId) const;
    [[nodiscard]] size_t memberCount(const RoomId& roomId) const;

    // Drop rooms nobody is subscribed to. Returns the number removed.
    size_t pruneEmptyRooms();

    // Statistics
    [[nodiscard]] size_t getConnectionCount() const;
    [[nodiscard]] size_t getRoomCount() const;
    [[nodiscard]] uint64_t getEventsPublished() const { return eventsPublished_.load(); }
    [[nodiscard]] uint64_t getDeliveries() const { return deliveries_.load(); }
    [[nodiscard]] uint64_t getDeliveryFailures() const { return deliveryFailures_.load(); }

private:
    struct Connection {
        ConnectionID id{0};
        UserId userId;
        std::shared_ptr<EventOutbox> outbox;

        // Guards rooms and connected; serializes join/leave/disconnect per connection
        std::mutex mutex;
        std::unordered_set<RoomId> rooms;
        bool connected{true};
    };

    struct Room {
        std::mutex mutex;
        std::unordered_map<ConnectionID, std::shared_ptr<EventOutbox>> members;
    };

    size_t outboxCapacity_;

    mutable std::shared_mutex connectionsMutex_;
    std::unordered_map<ConnectionID, std::shared_ptr<Connection>> connections_;

    // Rooms are only erased under the exclusive lock; membership changes hold it shared
    mutable std::shared_mutex roomsMutex_;
    std::unordered_map<RoomId, std::shared_ptr<Room>> rooms_;

    std::atomic<uint64_t> eventsPublished_{0};
    std::atomic<uint64_t> deliveries_{0};
    std::atomic<uint64_t> deliveryFailures_{0};

    [[nodiscard]] std::shared_ptr<Connection> findConnection(ConnectionID connectionId) const;

    // Caller holds conn.mutex
    void addMember(Connection& conn, const RoomId& roomId);
    void removeMember(Connection& conn, const RoomId& roomId);
};

} // namespace NearbyConnect
