#include "rooms/RoomEvent.hpp"
#include <cstring>
#include <utility>

namespace NearbyConnect {

std::string RoomEvent::serialize() const {
    nlohmann::json wire = {
        {"event", name},
        {"room", room},
        {"data", payload}
    };
    return wire.dump();
}

RoomEventPtr makeRoomEvent(RoomId room, std::string name, nlohmann::json payload, Timestamp at) {
    auto event = std::make_shared<RoomEvent>();
    event->room = std::move(room);
    event->name = std::move(name);
    event->payload = std::move(payload);
    event->createdAt = at;
    return event;
}

namespace RoomNames {

std::optional<UserId> locationOwner(const RoomId& room) {
    const size_t prefixLen = std::strlen(Constants::LOCATION_ROOM_PREFIX);
    if (room.size() <= prefixLen || room.compare(0, prefixLen, Constants::LOCATION_ROOM_PREFIX) != 0) {
        return std::nullopt;
    }
    return room.substr(prefixLen);
}

} // namespace RoomNames

} // namespace NearbyConnect
