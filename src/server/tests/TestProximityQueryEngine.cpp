// [PROXIMITY_AGENT] Proximity query engine unit tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "proximity/ProximityQueryEngine.hpp"
#include "core/Errors.hpp"
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using namespace NearbyConnect;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {
    const Timestamp T0 = fromUnixMillis(1700000000000);

    struct EngineFixture {
        GeoSpatialIndex index;
        PresenceRegistry presence;
        ProximityQueryEngine engine{index, presence};

        void place(const UserId& userId, double lat, double lon, Timestamp active = T0) {
            index.upsert(userId, lat, lon, active);
            presence.touch(userId, active);
        }
    };
}

TEST_CASE("Proximity radius validation", "[proximity]") {
    REQUIRE_NOTHROW(ProximityQueryEngine::validateRadius(0.5));
    REQUIRE_NOTHROW(ProximityQueryEngine::validateRadius(5.0));
    REQUIRE_NOTHROW(ProximityQueryEngine::validateRadius(Constants::DEFAULT_RADIUS_MILES));
    REQUIRE_THROWS_AS(ProximityQueryEngine::validateRadius(6.0), ValidationError);
    REQUIRE_THROWS_AS(ProximityQueryEngine::validateRadius(0.3), ValidationError);
    REQUIRE_THROWS_AS(ProximityQueryEngine::validateRadius(-1.0), ValidationError);
}

TEST_CASE("Proximity query results", "[proximity]") {
    EngineFixture f;
    f.place("a", 37.7749, -122.4194);

    SECTION("San Francisco pair") {
        f.place("b", 37.7849, -122.4094);

        auto result = f.engine.nearby("a", 37.7749, -122.4194, 2.0, T0 + 1min);
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].userId == "b");
        // Great-circle distance on the mean sphere is 0.88 mi for this pair
        REQUIRE(result[0].distanceMiles == Approx(0.88).margin(0.005));
        REQUIRE(result[0].latitude == Approx(37.7849));
        REQUIRE(result[0].longitude == Approx(-122.4094));
        REQUIRE(result[0].lastActive == T0);
    }

    SECTION("Requester excluded") {
        auto result = f.engine.nearby("a", 37.7749, -122.4194, 5.0, T0);
        REQUIRE(result.empty());
    }

    SECTION("Sorted ascending, ties by user id") {
        f.place("far", 37.8049, -122.4194);
        f.place("zed", 37.7849, -122.4194);
        f.place("amy", 37.7849, -122.4194);   // Same spot as zed
        f.place("mid", 37.7949, -122.4194);

        auto result = f.engine.nearby("a", 37.7749, -122.4194, 5.0, T0);
        REQUIRE(result.size() == 4);
        REQUIRE(result[0].userId == "amy");
        REQUIRE(result[1].userId == "zed");
        REQUIRE(result[2].userId == "mid");
        REQUIRE(result[3].userId == "far");

        for (size_t i = 1; i < result.size(); ++i) {
            REQUIRE(result[i - 1].distanceMiles <= result[i].distanceMiles);
        }
    }

    SECTION("Every distance is within the radius and rounded") {
        for (int i = 0; i < 50; ++i) {
            f.place("u" + std::to_string(i), 37.7749 + i * 0.0015, -122.4194 + i * 0.001);
        }
        auto result = f.engine.nearby("a", 37.7749, -122.4194, 1.5, T0);
        REQUIRE_FALSE(result.empty());
        for (const auto& user : result) {
            REQUIRE(user.distanceMiles <= 1.5);
            REQUIRE(user.distanceMiles * 100.0 == Approx(std::round(user.distanceMiles * 100.0)));
        }
    }

    SECTION("Inactive users filtered") {
        f.place("stale", 37.7750, -122.4195, T0 - 30min);
        f.place("fresh", 37.7751, -122.4195, T0 - 29min);

        auto result = f.engine.nearby("a", 37.7749, -122.4194, 1.0, T0);
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].userId == "fresh");
    }

    SECTION("Point without presence is not reported") {
        f.index.upsert("ghost", 37.7750, -122.4195, T0);
        REQUIRE(f.engine.nearby("a", 37.7749, -122.4194, 1.0, T0).empty());
    }
}

TEST_CASE("Proximity query errors", "[proximity]") {
    EngineFixture f;
    f.place("a", 37.7749, -122.4194);

    REQUIRE_THROWS_AS(f.engine.nearby("a", 37.7749, -122.4194, 6.0, T0), ValidationError);
    REQUIRE_THROWS_AS(f.engine.nearby("a", 37.7749, -122.4194, 0.3, T0), ValidationError);
    REQUIRE_THROWS_AS(f.engine.nearby("a", 91.0, 0.0, 1.0, T0), ValidationError);
}

TEST_CASE("Proximity query for a requester with no presence record", "[proximity]") {
    EngineFixture f;
    f.place("b", 37.7849, -122.4094);

    std::vector<NearbyUser> result;
    REQUIRE_NOTHROW(result = f.engine.nearby("a", 37.7749, -122.4194, 2.0, T0 + 1min));
    REQUIRE(result.size() == 1);
    REQUIRE(result[0].userId == "b");
}

TEST_CASE("Proximity query custom presence window", "[proximity]") {
    GeoSpatialIndex index;
    PresenceRegistry presence;
    ProximityQueryEngine engine(index, presence, 5min);
    REQUIRE(engine.presenceWindow() == 5min);

    index.upsert("a", 0.0, 0.0, T0);
    presence.touch("a", T0 + 10min);
    index.upsert("b", 0.001, 0.0, T0);
    presence.touch("b", T0);

    REQUIRE(engine.nearby("a", 0.0, 0.0, 1.0, T0 + 4min).size() == 1);
    REQUIRE(engine.nearby("a", 0.0, 0.0, 1.0, T0 + 5min).empty());
}
