// [DATABASE_AGENT] Redis location store with connection pooling
// Writes are pipelined (SADD + HSET in one round trip); reads are used only at startup

#include "db/RedisManager.hpp"
#include "Constants.hpp"
#include <hiredis.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace NearbyConnect {

// ============================================================================
// Connection Pool Implementation
// ============================================================================

class RedisConnectionPool {
public:
    struct Connection {
        redisContext* ctx{nullptr};
        std::chrono::steady_clock::time_point lastUsed;
        bool inUse{false};
    };

private:
    std::vector<Connection> connections_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::string host_;
    uint16_t port_{6379};
    size_t maxPoolSize_{Constants::REDIS_MAX_POOL_SIZE};
    bool shutdown_{false};

    redisContext* createConnection() {
        struct timeval timeout;
        timeout.tv_sec = Constants::REDIS_CONNECTION_TIMEOUT_MS / 1000;
        timeout.tv_usec = (Constants::REDIS_CONNECTION_TIMEOUT_MS % 1000) * 1000;

        redisContext* ctx = redisConnectWithTimeout(host_.c_str(), port_, timeout);
        if (!ctx || ctx->err) {
            if (ctx) {
                std::cerr << "[REDIS] Connection error: " << ctx->errstr << std::endl;
                redisFree(ctx);
            } else {
                std::cerr << "[REDIS] Failed to allocate context" << std::endl;
            }
            return nullptr;
        }

        redisEnableKeepAlive(ctx);
        return ctx;
    }

public:
    RedisConnectionPool() = default;
    ~RedisConnectionPool() { shutdown(); }

    bool initialize(const std::string& host, uint16_t port, size_t minPoolSize, size_t maxPoolSize) {
        std::lock_guard<std::mutex> lock(mutex_);
        host_ = host;
        port_ = port;
        maxPoolSize_ = maxPoolSize;
        shutdown_ = false;

        for (size_t i = 0; i < minPoolSize; ++i) {
            redisContext* ctx = createConnection();
            if (!ctx) {
                std::cerr << "[REDIS] Failed to create initial connection " << i << std::endl;
                for (auto& conn : connections_) {
                    redisFree(conn.ctx);
                }
                connections_.clear();
                return false;
            }
            connections_.push_back({ctx, std::chrono::steady_clock::now(), false});
        }

        std::cout << "[REDIS] Connection pool initialized with " << connections_.size()
                  << " connections" << std::endl;
        return true;
    }

    redisContext* acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(100)) {
        std::unique_lock<std::mutex> lock(mutex_);

        auto available = [this]() {
            if (shutdown_) return true;
            for (const auto& conn : connections_) {
                if (!conn.inUse) return true;
            }
            return connections_.size() < maxPoolSize_;
        };

        if (!cv_.wait_for(lock, timeout, available) || shutdown_) {
            return nullptr;
        }

        for (auto& conn : connections_) {
            if (conn.inUse) continue;

            if (!conn.ctx || conn.ctx->err) {
                // Dead connection, replace in place
                if (conn.ctx) redisFree(conn.ctx);
                conn.ctx = createConnection();
                if (!conn.ctx) continue;
            }
            conn.inUse = true;
            conn.lastUsed = std::chrono::steady_clock::now();
            return conn.ctx;
        }

        if (connections_.size() < maxPoolSize_) {
            redisContext* ctx = createConnection();
            if (ctx) {
                connections_.push_back({ctx, std::chrono::steady_clock::now(), true});
                return ctx;
            }
        }
        return nullptr;
    }

    void release(redisContext* ctx) {
        if (!ctx) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& conn : connections_) {
                if (conn.ctx == ctx) {
                    conn.inUse = false;
                    conn.lastUsed = std::chrono::steady_clock::now();
                    break;
                }
            }
        }
        cv_.notify_one();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            for (auto& conn : connections_) {
                if (conn.ctx) {
                    redisFree(conn.ctx);
                    conn.ctx = nullptr;
                }
            }
            connections_.clear();
        }
        cv_.notify_all();
    }
};

// Returns the context to the pool on scope exit
class PooledContext {
public:
    PooledContext(RedisConnectionPool& pool, redisContext* ctx) : pool_(pool), ctx_(ctx) {}
    ~PooledContext() { pool_.release(ctx_); }

    PooledContext(const PooledContext&) = delete;
    PooledContext& operator=(const PooledContext&) = delete;

    [[nodiscard]] redisContext* get() const { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    RedisConnectionPool& pool_;
    redisContext* ctx_;
};

// Frees the reply on scope exit
struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) freeReplyObject(reply);
    }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

// ============================================================================
// Internal Implementation Structure
// ============================================================================

struct RedisInternal {
    RedisConnectionPool pool;
    std::string host;
    uint16_t port{6379};
    std::atomic<bool> connected{false};

    // Latency tracking
    std::queue<float> latencySamples;
    std::mutex latencyMutex;
    static constexpr size_t MAX_LATENCY_SAMPLES = 100;

    // Metrics
    std::atomic<uint64_t> commandsSent{0};
    std::atomic<uint64_t> commandsCompleted{0};
    std::atomic<uint64_t> commandsFailed{0};

    void recordLatency(std::chrono::steady_clock::time_point start) {
        float latencyMs = std::chrono::duration<float, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        std::lock_guard<std::mutex> lock(latencyMutex);
        latencySamples.push(latencyMs);
        if (latencySamples.size() > MAX_LATENCY_SAMPLES) {
            latencySamples.pop();
        }
    }
};

// ============================================================================
// RedisManager Implementation
// ============================================================================

RedisManager::RedisManager()
    : internal_(std::make_unique<RedisInternal>()) {}

RedisManager::~RedisManager() {
    shutdown();
}

bool RedisManager::initialize(const std::string& host, uint16_t port) {
    internal_->host = host;
    internal_->port = port;

    std::cout << "[REDIS] Connecting to " << host << ":" << port << "..." << std::endl;

    if (!internal_->pool.initialize(host, port, Constants::REDIS_MIN_POOL_SIZE,
                                    Constants::REDIS_MAX_POOL_SIZE)) {
        std::cerr << "[REDIS] Failed to initialize connection pool" << std::endl;
        return false;
    }

    PooledContext ctx(internal_->pool, internal_->pool.acquire(std::chrono::milliseconds(1000)));
    if (!ctx) {
        std::cerr << "[REDIS] Failed to acquire connection from pool" << std::endl;
        return false;
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommand(ctx.get(), "PING")));
    if (!reply || reply->type != REDIS_REPLY_STATUS || std::string(reply->str) != "PONG") {
        std::cerr << "[REDIS] PING failed" << std::endl;
        return false;
    }

    internal_->connected = true;
    std::cout << "[REDIS] Connected" << std::endl;
    return true;
}

void RedisManager::shutdown() {
    if (!internal_->connected) return;

    std::cout << "[REDIS] Shutting down..." << std::endl;
    internal_->pool.shutdown();
    internal_->connected = false;
    std::cout << "[REDIS] Shutdown complete" << std::endl;
}

bool RedisManager::isConnected() const {
    return internal_->connected;
}

std::string RedisManager::encodeCoordinate(double degrees) {
    char buffer[32];
    const int written = std::snprintf(buffer, sizeof(buffer), "%.17g", degrees);
    return std::string(buffer, written > 0 ? static_cast<size_t>(written) : 0);
}

bool RedisManager::persistLocation(const UserId& userId, double lat, double lon, Timestamp at) {
    internal_->commandsSent += 2;

    if (!internal_->connected) {
        internal_->commandsFailed += 2;
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    PooledContext ctx(internal_->pool, internal_->pool.acquire());
    if (!ctx) {
        internal_->commandsFailed += 2;
        std::cerr << "[REDIS] No connection available for location write" << std::endl;
        return false;
    }

    const std::string setKey = RedisKeys::locationUsers();
    const std::string hashKey = RedisKeys::userLocation(userId);
    const std::string latStr = encodeCoordinate(lat);
    const std::string lonStr = encodeCoordinate(lon);
    const std::string atStr = std::to_string(toUnixMillis(at));

    // Pipeline: both commands go out before reading either reply
    redisAppendCommand(ctx.get(), "SADD %b %b",
                       setKey.data(), setKey.size(), userId.data(), userId.size());
    redisAppendCommand(ctx.get(), "HSET %b lat %b lon %b updated_at %b",
                       hashKey.data(), hashKey.size(),
                       latStr.data(), latStr.size(),
                       lonStr.data(), lonStr.size(),
                       atStr.data(), atStr.size());

    bool success = true;
    for (int i = 0; i < 2; ++i) {
        redisReply* raw = nullptr;
        if (redisGetReply(ctx.get(), reinterpret_cast<void**>(&raw)) != REDIS_OK) {
            success = false;
            break;  // Context is now in error state; the pool replaces it
        }
        ReplyPtr reply(raw);
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            success = false;
        }
    }

    internal_->recordLatency(start);
    if (success) {
        internal_->commandsCompleted += 2;
    } else {
        internal_->commandsFailed += 2;
        std::cerr << "[REDIS] Location write failed for " << userId << std::endl;
    }
    return success;
}

bool RedisManager::removeLocation(const UserId& userId) {
    internal_->commandsSent += 2;

    if (!internal_->connected) {
        internal_->commandsFailed += 2;
        return false;
    }

    PooledContext ctx(internal_->pool, internal_->pool.acquire());
    if (!ctx) {
        internal_->commandsFailed += 2;
        return false;
    }

    const std::string setKey = RedisKeys::locationUsers();
    const std::string hashKey = RedisKeys::userLocation(userId);

    redisAppendCommand(ctx.get(), "SREM %b %b",
                       setKey.data(), setKey.size(), userId.data(), userId.size());
    redisAppendCommand(ctx.get(), "DEL %b", hashKey.data(), hashKey.size());

    bool success = true;
    for (int i = 0; i < 2; ++i) {
        redisReply* raw = nullptr;
        if (redisGetReply(ctx.get(), reinterpret_cast<void**>(&raw)) != REDIS_OK) {
            success = false;
            break;
        }
        ReplyPtr reply(raw);
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            success = false;
        }
    }

    if (success) {
        internal_->commandsCompleted += 2;
    } else {
        internal_->commandsFailed += 2;
    }
    return success;
}

std::optional<LocationPoint> RedisManager::loadLocation(redisContext* ctx, const UserId& userId) {
    const std::string hashKey = RedisKeys::userLocation(userId);

    internal_->commandsSent++;
    ReplyPtr reply(static_cast<redisReply*>(
        redisCommand(ctx, "HMGET %b lat lon updated_at", hashKey.data(), hashKey.size())));

    if (!reply || reply->type != REDIS_REPLY_ARRAY || reply->elements != 3) {
        internal_->commandsFailed++;
        return std::nullopt;
    }
    internal_->commandsCompleted++;

    for (size_t i = 0; i < 3; ++i) {
        if (reply->element[i]->type != REDIS_REPLY_STRING) {
            return std::nullopt;  // Hash expired or partially written
        }
    }

    LocationPoint point;
    point.userId = userId;
    char* end = nullptr;
    point.latitude = std::strtod(reply->element[0]->str, &end);
    point.longitude = std::strtod(reply->element[1]->str, &end);
    point.updatedAt = fromUnixMillis(std::strtoll(reply->element[2]->str, &end, 10));
    return point;
}

std::vector<LocationPoint> RedisManager::loadLocations() {
    std::vector<LocationPoint> points;
    if (!internal_->connected) {
        return points;
    }

    PooledContext ctx(internal_->pool, internal_->pool.acquire(std::chrono::milliseconds(1000)));
    if (!ctx) {
        std::cerr << "[REDIS] No connection available to load locations" << std::endl;
        return points;
    }

    const std::string setKey = RedisKeys::locationUsers();
    internal_->commandsSent++;
    ReplyPtr members(static_cast<redisReply*>(
        redisCommand(ctx.get(), "SMEMBERS %b", setKey.data(), setKey.size())));

    if (!members || members->type != REDIS_REPLY_ARRAY) {
        internal_->commandsFailed++;
        std::cerr << "[REDIS] SMEMBERS failed while loading locations" << std::endl;
        return points;
    }
    internal_->commandsCompleted++;

    points.reserve(members->elements);
    size_t skipped = 0;
    for (size_t i = 0; i < members->elements; ++i) {
        const redisReply* member = members->element[i];
        if (member->type != REDIS_REPLY_STRING) continue;

        auto point = loadLocation(ctx.get(), UserId(member->str, member->len));
        if (point) {
            points.push_back(std::move(*point));
        } else {
            skipped++;
        }
    }

    std::cout << "[REDIS] Loaded " << points.size() << " locations";
    if (skipped > 0) {
        std::cout << " (" << skipped << " skipped)";
    }
    std::cout << std::endl;
    return points;
}

uint64_t RedisManager::getCommandsSent() const {
    return internal_->commandsSent.load();
}

uint64_t RedisManager::getCommandsCompleted() const {
    return internal_->commandsCompleted.load();
}

uint64_t RedisManager::getCommandsFailed() const {
    return internal_->commandsFailed.load();
}

float RedisManager::getAverageLatencyMs() const {
    std::lock_guard<std::mutex> lock(internal_->latencyMutex);
    if (internal_->latencySamples.empty()) {
        return 0.0f;
    }
    std::queue<float> samples = internal_->latencySamples;
    float sum = 0.0f;
    const size_t count = samples.size();
    while (!samples.empty()) {
        sum += samples.front();
        samples.pop();
    }
    return sum / static_cast<float>(count);
}

} // namespace NearbyConnect
