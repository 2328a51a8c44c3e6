#pragma once

#include "core/CoreTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// [REALTIME_AGENT] Events fanned out to room subscribers
// One immutable instance is shared by every outbox it is delivered to

namespace NearbyConnect {

struct RoomEvent {
    RoomId room;
    std::string name;          // "new_message", "location_update"
    nlohmann::json payload;
    Timestamp createdAt{};

    // Wire form: {"event": name, "room": room, "data": payload}
    [[nodiscard]] std::string serialize() const;
};

using RoomEventPtr = std::shared_ptr<const RoomEvent>;

[[nodiscard]] RoomEventPtr makeRoomEvent(RoomId room, std::string name,
                                         nlohmann::json payload, Timestamp at);

// [REALTIME_AGENT] Room naming conventions
namespace RoomNames {
    inline RoomId messages() {
        return Constants::MESSAGES_ROOM;
    }

    inline RoomId locationUpdates(const UserId& userId) {
        return Constants::LOCATION_ROOM_PREFIX + userId;
    }

    // Owner of a location_updates_{user} room, nullopt for any other room
    std::optional<UserId> locationOwner(const RoomId& room);
}

} // namespace NearbyConnect
