#pragma once

#include "Constants.hpp"
#include "db/RedisManager.hpp"
#include "db/ScyllaManager.hpp"
#include "service/NearbyService.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// [SERVER_AGENT] Process wiring for the nearby service
// Connects the stores, warms the index, then runs the maintenance loop until signalled.
// Embedding point: a transport (HTTP routes, socket handlers) links nearby_core, owns a
// NearbyServer and drives requests through service(). The nearby_server binary runs the
// same wiring headless, keeping the location store pruned and the stats line flowing.

namespace NearbyConnect {

struct ServerConfig {
    // Database connections
    std::string redisHost{"localhost"};
    uint16_t redisPort{Constants::REDIS_DEFAULT_PORT};
    std::string scyllaHost{"localhost"};
    uint16_t scyllaPort{Constants::SCYLLA_DEFAULT_PORT};

    // Realtime
    size_t outboxCapacity{Constants::DEFAULT_OUTBOX_CAPACITY};

    // Presence / retention
    std::chrono::minutes presenceWindow{Constants::PRESENCE_WINDOW};
    std::chrono::hours locationRetention{Constants::LOCATION_RETENTION};
};

class NearbyServer {
public:
    NearbyServer();
    ~NearbyServer();

    NearbyServer(const NearbyServer&) = delete;
    NearbyServer& operator=(const NearbyServer&) = delete;

    // Connect stores and build the service. False only when ScyllaDB is unreachable;
    // Redis is optional (locations are then neither persisted nor restored).
    bool initialize(const ServerConfig& config);

    // Run maintenance loop (blocking)
    void run();

    // Request shutdown (can be called from signal handlers)
    void requestShutdown();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isShutdownRequested() const { return shutdownRequested_; }

    // One maintenance pass (for external loop control)
    void tick();

    // Request entry point for the embedding transport. Valid after initialize()
    [[nodiscard]] NearbyService& service() { return *service_; }

private:
    ServerConfig config_;

    std::unique_ptr<RedisManager> redis_;
    std::unique_ptr<ScyllaManager> scylla_;
    std::unique_ptr<NearbyService> service_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};

    std::chrono::steady_clock::time_point lastPrune_;
    std::chrono::steady_clock::time_point lastStats_;

    void setupSignalHandlers();
    void logStats() const;
    void shutdown();
};

} // namespace NearbyConnect
