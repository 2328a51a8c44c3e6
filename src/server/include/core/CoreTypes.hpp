#pragma once

#include "Constants.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <glm/glm.hpp>

// [ALL-AGENTS] Core value types shared by the proximity and realtime layers
// All types are plain data; ownership lives in the component that stores them

namespace NearbyConnect {

using UserId = std::string;
using RoomId = std::string;
using MessageId = std::string;
using ConnectionID = uint64_t;  // Transport session handle (not owned by the core)

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ============================================================================
// PRESENCE / LOCATION
// ============================================================================

// [PRESENCE_AGENT] Last-known activity for a user
struct UserPresence {
    UserId userId;
    Timestamp lastActive{};
};

// [GEO_AGENT] Latest known position of a user (degrees)
struct LocationPoint {
    UserId userId;
    double latitude{0.0};
    double longitude{0.0};
    Timestamp updatedAt{};

    // x = latitude, y = longitude
    [[nodiscard]] glm::dvec2 toVec2() const {
        return glm::dvec2(latitude, longitude);
    }
};

// [PROXIMITY_AGENT] One row of a nearby query result
struct NearbyUser {
    UserId userId;
    std::optional<std::string> name;
    double distanceMiles{0.0};  // Rounded to Constants::DISTANCE_DECIMALS
    double latitude{0.0};
    double longitude{0.0};
    Timestamp lastActive{};
};

// ============================================================================
// MESSAGING
// ============================================================================

// [MESSAGING_AGENT] Message handed to the external store, immutable once dispatched
struct OutboundMessage {
    MessageId messageId;  // Empty until the store assigns one
    UserId senderId;
    std::set<UserId> recipientIds;
    std::string content;
    std::optional<std::string> imageData;  // base64 payload
    Timestamp createdAt{};
};

// [DATABASE_AGENT] Profile fields the core needs from the user store
struct UserProfile {
    UserId userId;
    std::string name;
};

// Milliseconds since epoch, used on the wire and in the stores
[[nodiscard]] inline int64_t toUnixMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp fromUnixMillis(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
[[nodiscard]] std::string toIso8601(Timestamp t);

} // namespace NearbyConnect
