#pragma once

#include "core/CoreTypes.hpp"
#include "db/ExternalStores.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// [DATABASE_AGENT] Redis hot-state store for user locations
// Pooled hiredis connections; each location write is one pipelined round trip

struct redisContext;

namespace NearbyConnect {

// Forward declaration
struct RedisInternal;

// [DATABASE_AGENT] Redis connection manager and LocationStore
class RedisManager : public LocationStore {
public:
    RedisManager();
    ~RedisManager() override;

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    // Connect the pool and PING; false if Redis is unreachable
    bool initialize(const std::string& host = "localhost",
                    uint16_t port = Constants::REDIS_DEFAULT_PORT);

    void shutdown();

    [[nodiscard]] bool isConnected() const;

    // === LocationStore ===

    // SADD the user to the location set and HSET lat/lon/updated_at
    [[nodiscard]] bool persistLocation(const UserId& userId, double lat, double lon,
                                       Timestamp at) override;

    bool removeLocation(const UserId& userId) override;

    // SMEMBERS + HMGET per user; malformed entries are skipped
    [[nodiscard]] std::vector<LocationPoint> loadLocations() override;

    // %.17g text; strtod gives back the exact same double
    [[nodiscard]] static std::string encodeCoordinate(double degrees);

    // === Metrics ===

    [[nodiscard]] uint64_t getCommandsSent() const;
    [[nodiscard]] uint64_t getCommandsCompleted() const;
    [[nodiscard]] uint64_t getCommandsFailed() const;
    [[nodiscard]] float getAverageLatencyMs() const;

private:
    std::unique_ptr<RedisInternal> internal_;

    [[nodiscard]] std::optional<LocationPoint> loadLocation(redisContext* ctx, const UserId& userId);
};

// [DATABASE_AGENT] Key naming conventions
namespace RedisKeys {
    inline std::string locationUsers() {
        return "nearby:location_users";
    }

    inline std::string userLocation(std::string_view userId) {
        return "nearby:user:" + std::string(userId) + ":location";
    }
}

} // namespace NearbyConnect
