// [REALTIME_AGENT] Room router implementation
// Lock order: connection -> connection table / room table (shared) -> room. publish()
// never takes a connection lock, so teardown and fan-out cannot deadlock.

#include "rooms/RoomRouter.hpp"
#include <iostream>
#include <utility>

namespace NearbyConnect {

RoomRouter::RoomRouter(size_t outboxCapacity)
    : outboxCapacity_(outboxCapacity) {}

RoomRouter::~RoomRouter() {
    std::unique_lock<std::shared_mutex> lock(connectionsMutex_);
    for (auto& [id, conn] : connections_) {
        conn->outbox->close();
    }
}

std::shared_ptr<RoomRouter::Connection> RoomRouter::findConnection(ConnectionID connectionId) const {
    std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return nullptr;
    }
    return it->second;
}

bool RoomRouter::connect(ConnectionID connectionId, const UserId& userId) {
    auto conn = std::make_shared<Connection>();
    conn->id = connectionId;
    conn->userId = userId;
    conn->outbox = std::make_shared<EventOutbox>(outboxCapacity_);

    {
        // Held until the auto-join is done: a disconnect that finds the new entry
        // waits here instead of tearing down a half-joined connection
        std::lock_guard<std::mutex> connLock(conn->mutex);
        {
            std::unique_lock<std::shared_mutex> lock(connectionsMutex_);
            if (!connections_.emplace(connectionId, conn).second) {
                std::cerr << "[ROOMS] Connection " << connectionId << " already registered" << std::endl;
                return false;
            }
        }
        addMember(*conn, RoomNames::messages());
    }

    std::cout << "[ROOMS] Connection " << connectionId << " connected as " << userId << std::endl;
    return true;
}

bool RoomRouter::disconnect(ConnectionID connectionId) {
    auto conn = findConnection(connectionId);
    if (!conn) {
        return false;
    }

    {
        std::lock_guard<std::mutex> connLock(conn->mutex);
        if (!conn->connected) {
            return false;  // Concurrent disconnect already tearing down
        }
        conn->connected = false;

        // Closed first: a publish that already snapshotted this member is rejected
        // instead of delivered mid-teardown
        conn->outbox->close();

        auto rooms = std::move(conn->rooms);
        conn->rooms.clear();
        for (const auto& roomId : rooms) {
            removeMember(*conn, roomId);
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(connectionsMutex_);
        connections_.erase(connectionId);
    }

    std::cout << "[ROOMS] Connection " << connectionId << " disconnected" << std::endl;
    return true;
}

bool RoomRouter::join(ConnectionID connectionId, const RoomId& roomId) {
    auto conn = findConnection(connectionId);
    if (!conn) {
        return false;
    }

    std::lock_guard<std::mutex> connLock(conn->mutex);
    if (!conn->connected) {
        return false;
    }
    if (conn->rooms.count(roomId) > 0) {
        return true;  // Already a member
    }
    addMember(*conn, roomId);
    return true;
}

bool RoomRouter::leave(ConnectionID connectionId, const RoomId& roomId) {
    auto conn = findConnection(connectionId);
    if (!conn) {
        return false;
    }

    std::lock_guard<std::mutex> connLock(conn->mutex);
    if (conn->rooms.erase(roomId) > 0) {
        removeMember(*conn, roomId);
    }
    return true;
}

void RoomRouter::addMember(Connection& conn, const RoomId& roomId) {
    for (;;) {
        {
            std::shared_lock<std::shared_mutex> tableLock(roomsMutex_);
            auto it = rooms_.find(roomId);
            if (it != rooms_.end()) {
                std::lock_guard<std::mutex> roomLock(it->second->mutex);
                it->second->members[conn.id] = conn.outbox;
                conn.rooms.insert(roomId);
                return;
            }
        }

        // Create, then insert under the shared lock so pruneEmptyRooms() can't race us
        std::unique_lock<std::shared_mutex> tableLock(roomsMutex_);
        rooms_.try_emplace(roomId, std::make_shared<Room>());
    }
}

void RoomRouter::removeMember(Connection& conn, const RoomId& roomId) {
    std::shared_lock<std::shared_mutex> tableLock(roomsMutex_);
    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return;
    }
    std::lock_guard<std::mutex> roomLock(it->second->mutex);
    it->second->members.erase(conn.id);
}

PublishResult RoomRouter::publish(const RoomId& roomId, RoomEventPtr event) {
    PublishResult result;
    eventsPublished_++;

    // Snapshot of the members subscribed at the instant of publish
    std::vector<std::pair<ConnectionID, std::shared_ptr<EventOutbox>>> targets;
    {
        std::shared_lock<std::shared_mutex> tableLock(roomsMutex_);
        auto it = rooms_.find(roomId);
        if (it == rooms_.end()) {
            return result;
        }
        std::lock_guard<std::mutex> roomLock(it->second->mutex);
        targets.reserve(it->second->members.size());
        for (const auto& member : it->second->members) {
            targets.push_back(member);
        }
    }

    for (const auto& [connectionId, outbox] : targets) {
        switch (outbox->push(event)) {
            case EventOutbox::PushResult::QUEUED:
                result.delivered++;
                break;

            case EventOutbox::PushResult::FULL:
                result.failed++;
                std::cerr << "[ROOMS] Delivery failed: outbox full for connection "
                          << connectionId << " (room " << roomId << ", event "
                          << event->name << ")" << std::endl;
                break;

            case EventOutbox::PushResult::CLOSED:
                result.failed++;
                std::cerr << "[ROOMS] Delivery failed: connection " << connectionId
                          << " is closing (room " << roomId << ")" << std::endl;
                break;
        }
    }

    deliveries_ += result.delivered;
    deliveryFailures_ += result.failed;
    return result;
}

std::shared_ptr<EventOutbox> RoomRouter::outbox(ConnectionID connectionId) const {
    auto conn = findConnection(connectionId);
    return conn ? conn->outbox : nullptr;
}

std::optional<UserId> RoomRouter::identityOf(ConnectionID connectionId) const {
    auto conn = findConnection(connectionId);
    if (!conn) {
        return std::nullopt;
    }
    return conn->userId;
}

std::vector<ConnectionID> RoomRouter::connectionsOf(const UserId& userId) const {
    std::vector<ConnectionID> result;
    std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
    for (const auto& [id, conn] : connections_) {
        if (conn->userId == userId) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<RoomId> RoomRouter::roomsOf(ConnectionID connectionId) const {
    auto conn = findConnection(connectionId);
    if (!conn) {
        return {};
    }
    std::lock_guard<std::mutex> connLock(conn->mutex);
    return std::vector<RoomId>(conn->rooms.begin(), conn->rooms.end());
}

bool RoomRouter::isMember(ConnectionID connectionId, const RoomId& roomId) const {
    auto conn = findConnection(connectionId);
    if (!conn) {
        return false;
    }
    std::lock_guard<std::mutex> connLock(conn->mutex);
    return conn->rooms.count(roomId) > 0;
}

size_t RoomRouter::memberCount(const RoomId& roomId) const {
    std::shared_lock<std::shared_mutex> tableLock(roomsMutex_);
    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return 0;
    }
    std::lock_guard<std::mutex> roomLock(it->second->mutex);
    return it->second->members.size();
}

size_t RoomRouter::pruneEmptyRooms() {
    std::unique_lock<std::shared_mutex> tableLock(roomsMutex_);
    size_t removed = 0;
    for (auto it = rooms_.begin(); it != rooms_.end();) {
        bool empty;
        {
            std::lock_guard<std::mutex> roomLock(it->second->mutex);
            empty = it->second->members.empty();
        }
        if (empty) {
            it = rooms_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t RoomRouter::getConnectionCount() const {
    std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
    return connections_.size();
}

size_t RoomRouter::getRoomCount() const {
    std::shared_lock<std::shared_mutex> lock(roomsMutex_);
    return rooms_.size();
}

} // namespace NearbyConnect
