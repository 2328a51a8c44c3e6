// [DATABASE_AGENT] Redis location store integration tests
// Hidden by default; run with `nearby_tests [redis]` against a live server on localhost:6379

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "db/RedisManager.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <string>

using namespace NearbyConnect;
using Catch::Approx;

namespace {
    bool redisAvailable() {
        RedisManager manager;
        bool connected = manager.initialize("localhost", Constants::REDIS_DEFAULT_PORT);
        manager.shutdown();
        return connected;
    }
}

#define SKIP_IF_NO_REDIS() \
    if (!redisAvailable()) { \
        SKIP("Redis not available - skipping test"); \
    }

TEST_CASE("Redis coordinate encoding keeps full precision", "[redis-codec]") {
    for (double value : {37.774912345678901, -122.41941234567891, 89.999999999999, -0.000001, 180.0}) {
        const std::string text = RedisManager::encodeCoordinate(value);
        REQUIRE(std::strtod(text.c_str(), nullptr) == value);
    }
}

TEST_CASE("Redis connection handling", "[.][redis]") {
    SECTION("Fail on bad host") {
        RedisManager redis;
        REQUIRE_FALSE(redis.initialize("invalid.host.example", 6379));
        REQUIRE_FALSE(redis.isConnected());
    }

    SECTION("Writes fail cleanly when not connected") {
        RedisManager redis;
        REQUIRE_FALSE(redis.persistLocation("u", 1.0, 1.0, Clock::now()));
        REQUIRE(redis.loadLocations().empty());
        REQUIRE(redis.getCommandsFailed() == 2);
    }
}

TEST_CASE("Redis location round trip", "[.][redis]") {
    SKIP_IF_NO_REDIS();

    RedisManager redis;
    REQUIRE(redis.initialize("localhost", Constants::REDIS_DEFAULT_PORT));

    const UserId userId = "it_redis_user";
    const Timestamp at = fromUnixMillis(1700000000123);
    redis.removeLocation(userId);

    REQUIRE(redis.persistLocation(userId, 89.5, -179.9, at));
    REQUIRE(redis.persistLocation("it_redis_precise", 37.774912345678901, -122.41941234567891, at));

    auto points = redis.loadLocations();
    auto it = std::find_if(points.begin(), points.end(),
                           [&](const LocationPoint& p) { return p.userId == userId; });
    REQUIRE(it != points.end());
    REQUIRE(it->latitude == Approx(89.5));
    REQUIRE(it->longitude == Approx(-179.9));
    REQUIRE(it->updatedAt == at);

    auto precise = std::find_if(points.begin(), points.end(),
                                [](const LocationPoint& p) { return p.userId == "it_redis_precise"; });
    REQUIRE(precise != points.end());
    REQUIRE(precise->latitude == 37.774912345678901);
    REQUIRE(precise->longitude == -122.41941234567891);
    REQUIRE(redis.removeLocation("it_redis_precise"));

    REQUIRE(redis.removeLocation(userId));
    points = redis.loadLocations();
    REQUIRE(std::none_of(points.begin(), points.end(),
                         [&](const LocationPoint& p) { return p.userId == userId; }));

    REQUIRE(redis.getCommandsFailed() == 0);
    REQUIRE(redis.getAverageLatencyMs() >= 0.0f);
    redis.shutdown();
}
