// [SERVER_AGENT] End-to-end tests of the service operations over in-memory stores

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "service/NearbyService.hpp"
#include "core/Errors.hpp"
#include "InMemoryStores.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace NearbyConnect;
using namespace NearbyConnect::Testing;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {
    struct ServiceFixture {
        InMemoryUserStore users;
        InMemoryMessageStore messages;
        InMemoryLocationStore locations;
        Timestamp clock{fromUnixMillis(1700000000000)};
        NearbyService service{users, messages, locations, ServiceOptions{},
                              [this] { return clock; }};

        ServiceFixture() {
            users.addUser("a", "Alice");
            users.addUser("b", "Bob");
            users.addUser("c", "Carol");
        }

        void advance(std::chrono::milliseconds by) { clock += by; }
    };
}

TEST_CASE("Service location update", "[service]") {
    ServiceFixture f;

    REQUIRE(f.service.updateLocation("a", 37.7749, -122.4194));

    SECTION("Indexed, active and persisted") {
        REQUIRE(f.service.index().find("a").has_value());
        REQUIRE(f.service.presence().isActive("a", f.clock));
        REQUIRE(f.locations.contains("a"));
    }

    SECTION("Invalid coordinates rejected with no state change") {
        REQUIRE_THROWS_AS(f.service.updateLocation("b", 91.0, 0.0), ValidationError);
        REQUIRE_FALSE(f.service.index().find("b").has_value());
        REQUIRE_FALSE(f.service.presence().contains("b"));
        REQUIRE_FALSE(f.locations.contains("b"));
    }

    SECTION("Persistence failure is logged, not surfaced") {
        f.locations.failWrites = true;
        f.advance(1s);
        REQUIRE(f.service.updateLocation("a", 40.0, -74.0));
        REQUIRE(f.service.index().find("a")->latitude == Approx(40.0));
        REQUIRE(f.service.getStats().locationPersistFailures == 1);
    }

    SECTION("Published to the owner's location room") {
        f.service.onConnect(10, "a");
        f.service.joinRoom(10, "location_updates_a");
        (void)f.service.pollEvents(10);

        f.advance(1s);
        f.service.updateLocation("a", 37.78, -122.41);

        auto events = f.service.pollEvents(10);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]->name == "location_update");
        REQUIRE(events[0]->room == "location_updates_a");
        REQUIRE(events[0]->payload["user_id"] == "a");
        REQUIRE(events[0]->payload["latitude"] == 37.78);
        REQUIRE(events[0]->payload["longitude"] == -122.41);
        REQUIRE(events[0]->payload.contains("timestamp"));
    }
}

TEST_CASE("Service nearby search", "[service]") {
    ServiceFixture f;
    f.service.updateLocation("a", 37.7749, -122.4194);
    f.service.updateLocation("b", 37.7849, -122.4094);

    SECTION("San Francisco pair") {
        auto result = f.service.findNearby("a", 37.7749, -122.4194, 2.0);
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].userId == "b");
        REQUIRE(result[0].name == std::optional<std::string>("Bob"));
        REQUIRE(result[0].distanceMiles == Approx(0.88).margin(0.005));
    }

    SECTION("Default radius is one mile") {
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194).size() == 1);
        f.service.updateLocation("c", 37.7749, -122.3894);   // ~1.6 mi east
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194).size() == 1);
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194, 2.0).size() == 2);
    }

    SECTION("Radius bounds") {
        REQUIRE_THROWS_AS(f.service.findNearby("a", 37.7749, -122.4194, 6.0), ValidationError);
        REQUIRE_THROWS_AS(f.service.findNearby("a", 37.7749, -122.4194, 0.3), ValidationError);
        REQUIRE_NOTHROW(f.service.findNearby("a", 37.7749, -122.4194, 0.5));
        REQUIRE_NOTHROW(f.service.findNearby("a", 37.7749, -122.4194, 5.0));
    }

    SECTION("Validation happens before any store lookup") {
        const int before = f.users.lookups.load();
        REQUIRE_THROWS_AS(f.service.findNearby("a", 37.7749, -122.4194, 6.0), ValidationError);
        REQUIRE(f.users.lookups.load() == before);
    }

    SECTION("Unknown requester") {
        REQUIRE_THROWS_AS(f.service.findNearby("zed", 37.7749, -122.4194), NotFoundError);
    }

    SECTION("Inactive users drop out after the window") {
        f.advance(29min);
        f.service.updateLocation("a", 37.7749, -122.4194);
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194).size() == 1);

        f.advance(1min);   // b last active exactly 30 minutes ago
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194).empty());
    }

    SECTION("Latest point wins") {
        f.advance(1s);
        f.service.updateLocation("b", 10.0, 10.0);
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194, 5.0).empty());
        REQUIRE(f.service.index().size() == 2);
    }
}

TEST_CASE("Service nearby search for a known user with no activity yet", "[service]") {
    ServiceFixture f;
    f.service.updateLocation("b", 37.7849, -122.4094);

    // "a" exists in the user store but never updated a location or connected
    REQUIRE_FALSE(f.service.presence().contains("a"));

    std::vector<NearbyUser> result;
    REQUIRE_NOTHROW(result = f.service.findNearby("a", 37.7749, -122.4194, 2.0));
    REQUIRE(result.size() == 1);
    REQUIRE(result[0].userId == "b");
    REQUIRE(result[0].name == std::optional<std::string>("Bob"));

    // Querying does not make the requester discoverable
    REQUIRE_FALSE(f.service.presence().contains("a"));
    REQUIRE(f.service.findNearby("b", 37.7849, -122.4094, 2.0).empty());
}

TEST_CASE("Service user store outage is not reported as an unknown user", "[service]") {
    ServiceFixture f;
    f.service.updateLocation("b", 37.7849, -122.4094);
    f.service.onConnect(1, "b");
    (void)f.service.pollEvents(1);
    f.users.failReads = true;

    REQUIRE_THROWS_AS(f.service.findNearby("a", 37.7749, -122.4194, 2.0), StoreUnavailableError);
    REQUIRE_THROWS_AS(f.service.sendMessage("a", {"b"}, "hello"), StoreUnavailableError);
    REQUIRE(f.messages.stored().empty());
    REQUIRE(f.service.pollEvents(1).empty());

    f.users.failReads = false;
    REQUIRE(f.service.findNearby("a", 37.7749, -122.4194, 2.0).size() == 1);
}

TEST_CASE("Service messaging", "[service]") {
    ServiceFixture f;
    f.service.onConnect(1, "b");
    f.service.onConnect(2, "c");

    MessageId id = f.service.sendMessage("a", {"b"}, "hello");
    REQUIRE_FALSE(id.empty());

    auto events = f.service.pollEvents(1);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0]->payload["id"] == id);
    REQUIRE(f.service.pollEvents(2).size() == 1);

    f.messages.failWrites = true;
    REQUIRE_THROWS_AS(f.service.sendMessage("a", {"b"}, "lost"), PersistenceError);
    REQUIRE(f.service.pollEvents(1).empty());

    REQUIRE_THROWS_AS(f.service.sendMessage("a", {}, "x"), ValidationError);
    REQUIRE_THROWS_AS(f.service.sendMessage("a", {"ghost"}, "x"), NotFoundError);
}

TEST_CASE("Service connections and rooms", "[service]") {
    ServiceFixture f;

    SECTION("Connect touches presence and joins messages") {
        REQUIRE(f.service.onConnect(1, "a"));
        REQUIRE(f.service.presence().contains("a"));
        REQUIRE(f.service.router().isMember(1, "messages"));
        REQUIRE_FALSE(f.service.onConnect(1, "b"));
    }

    SECTION("Own location room") {
        f.service.onConnect(1, "a");
        REQUIRE_NOTHROW(f.service.joinRoom(1, "location_updates_a"));
        REQUIRE(f.service.router().isMember(1, "location_updates_a"));
    }

    SECTION("Other user's location room needs a grant") {
        f.service.onConnect(2, "b");
        REQUIRE_THROWS_AS(f.service.joinRoom(2, "location_updates_a"), PermissionDeniedError);
        REQUIRE_FALSE(f.service.router().isMember(2, "location_updates_a"));

        REQUIRE(f.service.grantLocationAccess("a", "b"));
        REQUIRE_NOTHROW(f.service.joinRoom(2, "location_updates_a"));

        (void)f.service.pollEvents(2);
        f.service.updateLocation("a", 1.0, 1.0);
        REQUIRE(f.service.pollEvents(2).size() == 1);
    }

    SECTION("Revoking evicts live connections") {
        f.service.onConnect(2, "b");
        f.service.onConnect(3, "b");
        f.service.grantLocationAccess("a", "b");
        f.service.joinRoom(2, "location_updates_a");
        f.service.joinRoom(3, "location_updates_a");

        REQUIRE(f.service.revokeLocationAccess("a", "b"));
        REQUIRE_FALSE(f.service.router().isMember(2, "location_updates_a"));
        REQUIRE_FALSE(f.service.router().isMember(3, "location_updates_a"));
        REQUIRE(f.service.router().isMember(2, "messages"));
        REQUIRE_THROWS_AS(f.service.joinRoom(2, "location_updates_a"), PermissionDeniedError);
        REQUIRE_FALSE(f.service.revokeLocationAccess("a", "b"));
    }

    SECTION("Unknown connection") {
        REQUIRE_THROWS_AS(f.service.joinRoom(42, "messages"), NotFoundError);
        REQUIRE_THROWS_AS(f.service.leaveRoom(42, "messages"), NotFoundError);
        REQUIRE_THROWS_AS(f.service.pollEvents(42), NotFoundError);
        REQUIRE(f.service.outbox(42) == nullptr);
        REQUIRE_FALSE(f.service.onDisconnect(42));
    }

    SECTION("Disconnect removes every subscription") {
        f.service.onConnect(1, "a");
        f.service.onConnect(2, "b");
        f.service.joinRoom(1, "location_updates_a");
        f.service.joinRoom(2, "arbitrary");
        REQUIRE(f.service.onDisconnect(1));

        REQUIRE(f.service.router().memberCount("messages") == 1);
        REQUIRE(f.service.router().memberCount("location_updates_a") == 0);

        f.service.sendMessage("a", {"b"}, "after");
        REQUIRE(f.service.getStats().deliveries == 1);
        REQUIRE(f.service.getStats().deliveryFailures == 0);
    }

    SECTION("Leave") {
        f.service.onConnect(1, "a");
        f.service.leaveRoom(1, "messages");
        REQUIRE_FALSE(f.service.router().isMember(1, "messages"));
        REQUIRE_NOTHROW(f.service.leaveRoom(1, "messages"));
    }
}

TEST_CASE("Service restart and pruning", "[service]") {
    ServiceFixture f;

    SECTION("Restore from the location store") {
        const Timestamp earlier = f.clock - 10min;
        f.locations.seed({"a", 37.7749, -122.4194, earlier});
        f.locations.seed({"b", 37.7849, -122.4094, earlier});
        f.locations.seed({"bad", 123.0, 0.0, earlier});

        REQUIRE(f.service.restoreLocations() == 2);
        REQUIRE(f.service.index().size() == 2);
        REQUIRE(f.service.presence().lastActive("b") == earlier);
        REQUIRE(f.service.findNearby("a", 37.7749, -122.4194).size() == 1);
    }

    SECTION("Prune stale points, keep presence") {
        f.service.updateLocation("a", 37.7749, -122.4194);
        f.advance(23h);
        f.service.updateLocation("b", 37.7849, -122.4094);
        f.advance(2h);

        REQUIRE(f.service.pruneStaleLocations(f.clock) == 1);
        REQUIRE_FALSE(f.service.index().find("a").has_value());
        REQUIRE(f.service.index().find("b").has_value());
        REQUIRE_FALSE(f.locations.contains("a"));
        REQUIRE(f.service.presence().contains("a"));
    }

    SECTION("Empty rooms are dropped") {
        f.service.onConnect(1, "a");
        f.service.joinRoom(1, "location_updates_a");
        f.service.onDisconnect(1);
        REQUIRE(f.service.pruneEmptyRooms() == 2);
        REQUIRE(f.service.getStats().rooms == 0);
    }
}

TEST_CASE("Service concurrent updates and queries", "[service][concurrency]") {
    InMemoryUserStore users;
    InMemoryMessageStore messages;
    InMemoryLocationStore locations;
    NearbyService service(users, messages, locations);

    constexpr int USERS = 16;
    for (int i = 0; i < USERS; ++i) {
        users.addUser("u" + std::to_string(i), "User " + std::to_string(i));
    }

    std::atomic<bool> failed{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < USERS; ++i) {
        threads.emplace_back([&, i]() {
            const UserId self = "u" + std::to_string(i);
            for (int step = 0; step < 50; ++step) {
                const double lat = 37.77 + 0.0005 * ((i + step) % 10);
                service.updateLocation(self, lat, -122.42);
                auto result = service.findNearby(self, lat, -122.42, 2.0);
                for (const auto& user : result) {
                    if (user.userId == self || user.distanceMiles > 2.0) {
                        failed = true;
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE_FALSE(failed);
    REQUIRE(service.index().size() == USERS);
    REQUIRE(service.findNearby("u0", 37.77, -122.42, 2.0).size() == USERS - 1);
}

TEST_CASE("Service stored location follows the index under concurrent updates", "[service][concurrency]") {
    InMemoryUserStore users;
    InMemoryMessageStore messages;
    InMemoryLocationStore locations;
    std::atomic<int64_t> tick{1700000000000};
    NearbyService service(users, messages, locations, ServiceOptions{},
                          [&tick] { return fromUnixMillis(tick.fetch_add(1)); });
    users.addUser("a", "Alice");

    constexpr int WRITERS = 8;
    constexpr int STEPS = 500;
    std::vector<std::thread> threads;
    for (int w = 0; w < WRITERS; ++w) {
        threads.emplace_back([&, w]() {
            for (int step = 0; step < STEPS; ++step) {
                service.updateLocation("a", 10.0 + 0.001 * w, 20.0 + 0.0001 * step);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto indexed = service.index().find("a");
    auto stored = locations.find("a");
    REQUIRE(indexed.has_value());
    REQUIRE(stored.has_value());
    REQUIRE(stored->updatedAt == indexed->updatedAt);
    REQUIRE(stored->latitude == indexed->latitude);
    REQUIRE(stored->longitude == indexed->longitude);
}

TEST_CASE("Service revoke races location room joins", "[service][concurrency]") {
    ServiceFixture f;
    f.service.onConnect(1, "b");

    std::atomic<bool> done{false};
    std::thread joiner([&]() {
        while (!done) {
            try {
                f.service.joinRoom(1, "location_updates_a");
            } catch (const PermissionDeniedError&) {
                // Grant not in place right now
            }
        }
    });

    // Only this thread grants, so once revoke returns no join can be admitted
    bool leaked = false;
    for (int round = 0; round < 2000 && !leaked; ++round) {
        f.service.grantLocationAccess("a", "b");
        f.service.revokeLocationAccess("a", "b");
        if (f.service.router().isMember(1, "location_updates_a")) {
            leaked = true;
        }
    }
    done = true;
    joiner.join();

    REQUIRE_FALSE(leaked);
    REQUIRE_FALSE(f.service.router().isMember(1, "location_updates_a"));
}
