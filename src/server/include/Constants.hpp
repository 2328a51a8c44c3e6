#pragma once

#include <cstdint>
#include <chrono>
#include <cstddef>

// [ALL-AGENTS] Global constants for the NearbyConnect server
// All magic numbers MUST be defined here, not scattered in code

namespace NearbyConnect {
namespace Constants {

inline constexpr const char* VERSION = "0.4.0";

// ============================================================================
// GEO CONSTANTS
// ============================================================================

// [GEO_AGENT] Mean Earth radius (IUGG), miles
inline constexpr double EARTH_RADIUS_MILES = 3958.7613;

// [GEO_AGENT] Coordinate bounds (degrees)
inline constexpr double MIN_LATITUDE = -90.0;
inline constexpr double MAX_LATITUDE = 90.0;
inline constexpr double MIN_LONGITUDE = -180.0;
inline constexpr double MAX_LONGITUDE = 180.0;

// [GEO_AGENT] Spatial cells
// 0.1 deg of latitude is ~6.9 miles, larger than the biggest supported radius,
// so a query touches at most 3 rows away from the poles
inline constexpr double GEO_CELL_SIZE_DEGREES = 0.1;
inline constexpr size_t GEO_INDEX_CELL_SHARDS = 64;
inline constexpr size_t GEO_INDEX_USER_SHARDS = 64;

// ============================================================================
// PROXIMITY CONSTANTS
// ============================================================================

// [PROXIMITY_AGENT] Radius bounds (miles, inclusive)
inline constexpr double MIN_RADIUS_MILES = 0.5;
inline constexpr double MAX_RADIUS_MILES = 5.0;
inline constexpr double DEFAULT_RADIUS_MILES = 1.0;

// [PROXIMITY_AGENT] Output distances are rounded to this many decimals
inline constexpr int DISTANCE_DECIMALS = 2;

// ============================================================================
// PRESENCE CONSTANTS
// ============================================================================

// [PRESENCE_AGENT] A user is active if now - lastActive < window
inline constexpr auto PRESENCE_WINDOW = std::chrono::minutes(30);
inline constexpr size_t PRESENCE_SHARDS = 32;

// [PRESENCE_AGENT] Index points of users inactive longer than this are pruned
inline constexpr auto LOCATION_RETENTION = std::chrono::hours(24);

// [PRESENCE_AGENT] Per-user write stripes; index and store writes for one user are serialized
inline constexpr size_t LOCATION_WRITE_STRIPES = 64;

// ============================================================================
// REALTIME CONSTANTS
// ============================================================================

// [REALTIME_AGENT] Room names
inline constexpr const char* MESSAGES_ROOM = "messages";
inline constexpr const char* LOCATION_ROOM_PREFIX = "location_updates_";

// [REALTIME_AGENT] Event names
inline constexpr const char* EVENT_NEW_MESSAGE = "new_message";
inline constexpr const char* EVENT_LOCATION_UPDATE = "location_update";

// [REALTIME_AGENT] Per-connection outbox (events), full outbox drops new events
inline constexpr size_t DEFAULT_OUTBOX_CAPACITY = 256;

// ============================================================================
// MESSAGING CONSTANTS
// ============================================================================

// [MESSAGING_AGENT] Content limits
inline constexpr size_t MAX_MESSAGE_CONTENT_BYTES = 4096;
inline constexpr size_t MAX_RECIPIENTS = 100;

// ============================================================================
// DATABASE CONSTANTS
// ============================================================================

// [DATABASE_AGENT] Redis configuration
inline constexpr uint32_t REDIS_DEFAULT_PORT = 6379;
inline constexpr uint32_t REDIS_CONNECTION_TIMEOUT_MS = 100;
inline constexpr size_t REDIS_MIN_POOL_SIZE = 2;
inline constexpr size_t REDIS_MAX_POOL_SIZE = 10;

// [DATABASE_AGENT] ScyllaDB configuration
inline constexpr uint32_t SCYLLA_DEFAULT_PORT = 9042;
inline constexpr uint32_t SCYLLA_REQUEST_TIMEOUT_MS = 5000;
inline constexpr uint32_t MESSAGE_TTL_SECONDS = 2592000;  // 30 days

// ============================================================================
// SERVER CONSTANTS
// ============================================================================

// [SERVER_AGENT] Maintenance loop
inline constexpr auto MAINTENANCE_TICK = std::chrono::milliseconds(100);
inline constexpr auto PRUNE_INTERVAL = std::chrono::seconds(60);
inline constexpr auto STATS_INTERVAL = std::chrono::seconds(30);

} // namespace Constants
} // namespace NearbyConnect
