// [SERVER_AGENT] Nearby server implementation
// Store wiring, warm restart and periodic maintenance

#include "service/NearbyServer.hpp"
#include <csignal>
#include <iostream>
#include <thread>

namespace NearbyConnect {

// Stands in for a LocationStore when Redis is unavailable
namespace {
    class DisabledLocationStore : public LocationStore {
    public:
        bool persistLocation(const UserId&, double, double, Timestamp) override { return false; }
        bool removeLocation(const UserId&) override { return false; }
        std::vector<LocationPoint> loadLocations() override { return {}; }
    };

    DisabledLocationStore g_disabledLocations;
}

NearbyServer::NearbyServer() = default;

NearbyServer::~NearbyServer() = default;

bool NearbyServer::initialize(const ServerConfig& config) {
    config_ = config;

    std::cout << "[SERVER] Initializing..." << std::endl;

    // Initialize ScyllaDB (users and messages)
    scylla_ = std::make_unique<ScyllaManager>();
    if (!scylla_->initialize(config_.scyllaHost, config_.scyllaPort)) {
        std::cerr << "[SERVER] Failed to connect to ScyllaDB!" << std::endl;
        return false;
    }

    // Initialize Redis (location hot state)
    LocationStore* locations = &g_disabledLocations;
    redis_ = std::make_unique<RedisManager>();
    if (redis_->initialize(config_.redisHost, config_.redisPort)) {
        locations = redis_.get();
    } else {
        std::cerr << "[SERVER] Failed to connect to Redis!" << std::endl;
        // Non-fatal - locations stay in memory only
        std::cout << "[SERVER] Continuing without Redis..." << std::endl;
    }

    ServiceOptions options;
    options.outboxCapacity = config_.outboxCapacity;
    options.presenceWindow = config_.presenceWindow;

    service_ = std::make_unique<NearbyService>(*scylla_, *scylla_, *locations, options);

    if (redis_->isConnected()) {
        service_->restoreLocations();
    }

    lastPrune_ = std::chrono::steady_clock::now();
    lastStats_ = lastPrune_;

    std::cout << "[SERVER] Initialization complete" << std::endl;
    return true;
}

void NearbyServer::run() {
    std::cout << "[SERVER] Starting maintenance loop..." << std::endl;

    setupSignalHandlers();
    running_ = true;
    shutdownRequested_ = false;

    uint64_t tickCount = 0;
    while (running_) {
        tick();
        tickCount++;
        std::this_thread::sleep_for(Constants::MAINTENANCE_TICK);
    }

    std::cout << "[SERVER] Maintenance loop ended after " << tickCount << " ticks" << std::endl;
    shutdown();
}

void NearbyServer::tick() {
    if (!service_) return;

    const auto now = std::chrono::steady_clock::now();

    if (now - lastPrune_ >= Constants::PRUNE_INTERVAL) {
        lastPrune_ = now;
        service_->pruneStaleLocations(service_->now(), config_.locationRetention);
        size_t rooms = service_->pruneEmptyRooms();
        if (rooms > 0) {
            std::cout << "[SERVER] Dropped " << rooms << " empty rooms" << std::endl;
        }
    }

    if (now - lastStats_ >= Constants::STATS_INTERVAL) {
        lastStats_ = now;
        logStats();
    }
}

void NearbyServer::logStats() const {
    const ServiceStats stats = service_->getStats();
    std::cout << "[SERVER] users=" << stats.indexedUsers
              << " presence=" << stats.presenceRecords
              << " connections=" << stats.connections
              << " rooms=" << stats.rooms
              << " messages=" << stats.messagesSent
              << " events=" << stats.eventsPublished
              << " delivered=" << stats.deliveries
              << " dropped=" << stats.deliveryFailures
              << " persist_failures=" << (stats.messagePersistFailures + stats.locationPersistFailures);
    if (redis_ && redis_->isConnected()) {
        std::cout << " redis_latency_ms=" << redis_->getAverageLatencyMs();
    }
    std::cout << std::endl;
}

// Global pointer for signal handler access
static NearbyServer* g_serverInstance = nullptr;

void NearbyServer::setupSignalHandlers() {
    g_serverInstance = this;

    #ifdef _WIN32
    std::signal(SIGINT, [](int) {
        if (g_serverInstance) {
            g_serverInstance->requestShutdown();
        }
    });
    std::signal(SIGTERM, [](int) {
        if (g_serverInstance) {
            g_serverInstance->requestShutdown();
        }
    });
    #else
    struct sigaction sa;
    sa.sa_handler = [](int) {
        if (g_serverInstance) {
            g_serverInstance->requestShutdown();
        }
    };
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    #endif
}

void NearbyServer::requestShutdown() {
    // Only async-signal-safe work here; the loop logs on exit
    shutdownRequested_ = true;
    running_ = false;
}

void NearbyServer::shutdown() {
    std::cout << "[SERVER] Shutdown requested, stopping..." << std::endl;

    if (service_) {
        logStats();
    }
    // Service borrows the stores; drop it first
    service_.reset();

    if (redis_) {
        redis_->shutdown();
    }
    if (scylla_) {
        scylla_->shutdown();
    }

    std::cout << "[SERVER] Shutdown complete" << std::endl;
}

} // namespace NearbyConnect
