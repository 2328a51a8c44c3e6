// Full implementation of ScyllaManager using cassandra-cpp-driver
// [DATABASE_AGENT] ScyllaDB persistence layer for user profiles and messages

#include "db/ScyllaManager.hpp"
#include "Constants.hpp"
#include "core/Errors.hpp"
#include <cassandra.h>
#include <iostream>
#include <string>

namespace NearbyConnect {

// ============================================================================
// Internal Implementation Structure
// ============================================================================

struct ScyllaManager::ScyllaInternal {
    CassCluster* cluster{nullptr};
    CassSession* session{nullptr};
    CassUuidGen* uuidGen{nullptr};

    // Prepared statements
    const CassPrepared* selectUser{nullptr};
    const CassPrepared* upsertUser{nullptr};
    const CassPrepared* insertMessage{nullptr};

    ~ScyllaInternal() {
        cleanupPreparedStatements();
        if (uuidGen) {
            cass_uuid_gen_free(uuidGen);
            uuidGen = nullptr;
        }
    }

    void cleanupPreparedStatements() {
        if (selectUser) {
            cass_prepared_free(selectUser);
            selectUser = nullptr;
        }
        if (upsertUser) {
            cass_prepared_free(upsertUser);
            upsertUser = nullptr;
        }
        if (insertMessage) {
            cass_prepared_free(insertMessage);
            insertMessage = nullptr;
        }
    }
};

// ============================================================================
// Utility Functions
// ============================================================================

namespace {
    void logFutureError(const char* what, CassFuture* future) {
        const char* message;
        size_t messageLength;
        cass_future_error_message(future, &message, &messageLength);
        std::cerr << "[SCYLLA] " << what << ": " << std::string(message, messageLength) << std::endl;
    }

    const CassPrepared* prepare(CassSession* session, const char* query) {
        CassFuture* future = cass_session_prepare(session, query);
        cass_future_wait(future);
        if (cass_future_error_code(future) != CASS_OK) {
            logFutureError("Prepare failed", future);
            cass_future_free(future);
            return nullptr;
        }
        const CassPrepared* prepared = cass_future_get_prepared(future);
        cass_future_free(future);
        return prepared;
    }

    std::string uuidToString(CassUuid uuid) {
        char buffer[CASS_UUID_STRING_LENGTH];
        cass_uuid_string(uuid, buffer);
        return std::string(buffer);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ScyllaManager::ScyllaManager()
    : internal_(std::make_unique<ScyllaInternal>()) {}

ScyllaManager::~ScyllaManager() {
    shutdown();
}

// ============================================================================
// Initialization
// ============================================================================

bool ScyllaManager::initialize(const std::string& host, uint16_t port) {
    internal_->cluster = cass_cluster_new();
    internal_->session = cass_session_new();
    internal_->uuidGen = cass_uuid_gen_new();

    if (!internal_->cluster || !internal_->session || !internal_->uuidGen) {
        return false;
    }

    std::cout << "[SCYLLA] Connecting to " << host << ":" << port << "..." << std::endl;

    cass_cluster_set_contact_points(internal_->cluster, host.c_str());
    cass_cluster_set_port(internal_->cluster, port);

    cass_cluster_set_num_threads_io(internal_->cluster, 4);
    cass_cluster_set_queue_size_io(internal_->cluster, 10000);

    // Connection pooling
    cass_cluster_set_core_connections_per_host(internal_->cluster, 2);
    cass_cluster_set_max_connections_per_host(internal_->cluster, 8);

    cass_cluster_set_reconnect_wait_time(internal_->cluster, 1000);
    cass_cluster_set_request_timeout(internal_->cluster, Constants::SCYLLA_REQUEST_TIMEOUT_MS);

    // Messages must be durable before fan-out
    cass_cluster_set_consistency(internal_->cluster, CASS_CONSISTENCY_LOCAL_QUORUM);

    CassFuture* connectFuture = cass_session_connect(internal_->session, internal_->cluster);
    cass_future_wait(connectFuture);

    if (cass_future_error_code(connectFuture) != CASS_OK) {
        logFutureError("Connect failed", connectFuture);
        cass_future_free(connectFuture);
        return false;
    }
    cass_future_free(connectFuture);

    if (!createSchema()) {
        std::cerr << "[SCYLLA] Schema creation failed" << std::endl;
        return false;
    }

    if (!prepareStatements()) {
        std::cerr << "[SCYLLA] Statement preparation failed" << std::endl;
        return false;
    }

    connected_ = true;
    std::cout << "[SCYLLA] Connected" << std::endl;
    return true;
}

void ScyllaManager::shutdown() {
    if (!internal_->session) {
        return;
    }

    internal_->cleanupPreparedStatements();

    CassFuture* closeFuture = cass_session_close(internal_->session);
    cass_future_wait(closeFuture);
    cass_future_free(closeFuture);
    cass_session_free(internal_->session);
    internal_->session = nullptr;

    if (internal_->cluster) {
        cass_cluster_free(internal_->cluster);
        internal_->cluster = nullptr;
    }

    connected_ = false;
    std::cout << "[SCYLLA] Shutdown complete" << std::endl;
}

bool ScyllaManager::isConnected() const {
    return connected_ && internal_->session != nullptr;
}

// ============================================================================
// Schema Creation
// ============================================================================

bool ScyllaManager::executeSimple(const char* query) {
    CassStatement* stmt = cass_statement_new(query, 0);
    CassFuture* future = cass_session_execute(internal_->session, stmt);
    cass_future_wait(future);

    CassError rc = cass_future_error_code(future);
    if (rc != CASS_OK) {
        logFutureError("Schema statement failed", future);
    }
    cass_future_free(future);
    cass_statement_free(stmt);
    return rc == CASS_OK;
}

bool ScyllaManager::createSchema() {
    const char* createKeyspace =
        "CREATE KEYSPACE IF NOT EXISTS nearby "
        "WITH replication = {"
        "  'class': 'SimpleStrategy', "
        "  'replication_factor': 1 "
        "}";
    if (!executeSimple(createKeyspace)) {
        return false;
    }

    const char* createUsers =
        "CREATE TABLE IF NOT EXISTS nearby.users ("
        "  user_id text PRIMARY KEY, "
        "  name text "
        ")";
    if (!executeSimple(createUsers)) {
        return false;
    }

    const char* createMessages =
        "CREATE TABLE IF NOT EXISTS nearby.messages ("
        "  message_id uuid PRIMARY KEY, "
        "  sender_id text, "
        "  recipient_ids set<text>, "
        "  content text, "
        "  image_data text, "
        "  created_at timestamp "
        ") WITH default_time_to_live = 2592000";  // 30 days TTL

    return executeSimple(createMessages);
}

// ============================================================================
// Statement Preparation
// ============================================================================

bool ScyllaManager::prepareStatements() {
    internal_->selectUser = prepare(internal_->session,
        "SELECT user_id, name FROM nearby.users WHERE user_id = ?");
    if (!internal_->selectUser) return false;

    internal_->upsertUser = prepare(internal_->session,
        "INSERT INTO nearby.users (user_id, name) VALUES (?, ?)");
    if (!internal_->upsertUser) return false;

    internal_->insertMessage = prepare(internal_->session,
        "INSERT INTO nearby.messages "
        "(message_id, sender_id, recipient_ids, content, image_data, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?) USING TTL ?");
    return internal_->insertMessage != nullptr;
}

// ============================================================================
// Users
// ============================================================================

std::optional<UserProfile> ScyllaManager::getUser(const UserId& userId) {
    if (!isConnected() || !internal_->selectUser) {
        readsFailed_++;
        throw StoreUnavailableError("user store not connected");
    }

    CassStatement* statement = cass_prepared_bind(internal_->selectUser);
    cass_statement_bind_string_n(statement, 0, userId.data(), userId.size());

    CassFuture* future = cass_session_execute(internal_->session, statement);
    cass_future_wait(future);

    std::optional<UserProfile> profile;
    bool failed = false;
    if (cass_future_error_code(future) == CASS_OK) {
        const CassResult* result = cass_future_get_result(future);
        const CassRow* row = cass_result_first_row(result);
        if (row) {
            UserProfile found;
            found.userId = userId;

            const char* name;
            size_t nameLength;
            if (cass_value_get_string(cass_row_get_column(row, 1), &name, &nameLength) == CASS_OK) {
                found.name.assign(name, nameLength);
            }
            profile = std::move(found);
        }
        cass_result_free(result);
    } else {
        readsFailed_++;
        logFutureError("User lookup failed", future);
        failed = true;
    }

    cass_future_free(future);
    cass_statement_free(statement);

    if (failed) {
        throw StoreUnavailableError("user lookup failed for " + userId);
    }
    return profile;
}

bool ScyllaManager::upsertUser(const UserProfile& profile) {
    if (!isConnected() || !internal_->upsertUser) {
        writesFailed_++;
        return false;
    }

    writesQueued_++;
    CassStatement* statement = cass_prepared_bind(internal_->upsertUser);
    cass_statement_bind_string_n(statement, 0, profile.userId.data(), profile.userId.size());
    cass_statement_bind_string_n(statement, 1, profile.name.data(), profile.name.size());

    CassFuture* future = cass_session_execute(internal_->session, statement);
    cass_future_wait(future);

    const bool ok = cass_future_error_code(future) == CASS_OK;
    if (ok) {
        writesCompleted_++;
    } else {
        writesFailed_++;
        logFutureError("User upsert failed", future);
    }

    cass_future_free(future);
    cass_statement_free(statement);
    return ok;
}

// ============================================================================
// Messages
// ============================================================================

std::optional<MessageId> ScyllaManager::persistMessage(const OutboundMessage& message) {
    if (!isConnected() || !internal_->insertMessage) {
        writesFailed_++;
        return std::nullopt;
    }

    writesQueued_++;

    CassUuid messageUuid;
    cass_uuid_gen_random(internal_->uuidGen, &messageUuid);

    CassCollection* recipients = cass_collection_new(CASS_COLLECTION_TYPE_SET,
                                                     message.recipientIds.size());
    for (const auto& recipient : message.recipientIds) {
        cass_collection_append_string_n(recipients, recipient.data(), recipient.size());
    }

    CassStatement* statement = cass_prepared_bind(internal_->insertMessage);
    cass_statement_bind_uuid(statement, 0, messageUuid);
    cass_statement_bind_string_n(statement, 1, message.senderId.data(), message.senderId.size());
    cass_statement_bind_collection(statement, 2, recipients);
    cass_statement_bind_string_n(statement, 3, message.content.data(), message.content.size());
    if (message.imageData) {
        cass_statement_bind_string_n(statement, 4, message.imageData->data(),
                                     message.imageData->size());
    } else {
        cass_statement_bind_null(statement, 4);
    }
    cass_statement_bind_int64(statement, 5, static_cast<cass_int64_t>(toUnixMillis(message.createdAt)));
    cass_statement_bind_int32(statement, 6, static_cast<cass_int32_t>(Constants::MESSAGE_TTL_SECONDS));

    CassFuture* future = cass_session_execute(internal_->session, statement);
    cass_future_wait(future);

    std::optional<MessageId> messageId;
    if (cass_future_error_code(future) == CASS_OK) {
        writesCompleted_++;
        messageId = uuidToString(messageUuid);
    } else {
        writesFailed_++;
        logFutureError("Message insert failed", future);
    }

    cass_future_free(future);
    cass_statement_free(statement);
    cass_collection_free(recipients);
    return messageId;
}

} // namespace NearbyConnect
