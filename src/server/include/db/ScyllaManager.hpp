#pragma once
#include "core/CoreTypes.hpp"
#include "db/ExternalStores.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace NearbyConnect {

// [DATABASE_AGENT] ScyllaDB connection manager
// Serves as the durable UserStore and MessageStore. Calls block on the driver
// future, so they must not be made while holding core locks.
class ScyllaManager : public UserStore, public MessageStore {
public:
    ScyllaManager();
    ~ScyllaManager() override;

    ScyllaManager(const ScyllaManager&) = delete;
    ScyllaManager& operator=(const ScyllaManager&) = delete;

    // Connect, create the keyspace/tables and prepare statements
    bool initialize(const std::string& host = "localhost",
                   uint16_t port = Constants::SCYLLA_DEFAULT_PORT);

    void shutdown();

    [[nodiscard]] bool isConnected() const;

    // === UserStore ===

    // Throws StoreUnavailableError when not connected or the read fails
    [[nodiscard]] std::optional<UserProfile> getUser(const UserId& userId) override;

    // Create or rename a user (account service writes, tests)
    bool upsertUser(const UserProfile& profile);

    // === MessageStore ===

    // Assigns a random v4 UUID; the row expires after MESSAGE_TTL_SECONDS
    [[nodiscard]] std::optional<MessageId> persistMessage(const OutboundMessage& message) override;

    // === Metrics ===

    [[nodiscard]] uint64_t getWritesQueued() const { return writesQueued_; }
    [[nodiscard]] uint64_t getWritesCompleted() const { return writesCompleted_; }
    [[nodiscard]] uint64_t getWritesFailed() const { return writesFailed_; }
    [[nodiscard]] uint64_t getReadsFailed() const { return readsFailed_; }

private:
    struct ScyllaInternal;
    std::unique_ptr<ScyllaInternal> internal_;

    std::atomic<bool> connected_{false};

    // Metrics
    std::atomic<uint64_t> writesQueued_{0};
    std::atomic<uint64_t> writesCompleted_{0};
    std::atomic<uint64_t> writesFailed_{0};
    std::atomic<uint64_t> readsFailed_{0};

    bool createSchema();
    bool prepareStatements();
    bool executeSimple(const char* query);
};

} // namespace NearbyConnect
