#pragma once

#include "core/CoreTypes.hpp"
#include "db/ExternalStores.hpp"
#include "presence/PresenceRegistry.hpp"
#include "rooms/RoomRouter.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// [MESSAGING_AGENT] Validate -> persist -> fan out
// A message reaches live subscribers only after the store accepted it, so anything
// seen live can also be found in history; a failed write is never published.

namespace NearbyConnect {

class MessageDispatcher {
public:
    MessageDispatcher(UserStore& users, MessageStore& messages,
                      RoomRouter& router, PresenceRegistry& presence);

    // Returns the store-assigned message id.
    // Throws ValidationError, NotFoundError (recipient), StoreUnavailableError or PersistenceError.
    MessageId send(const UserId& senderId,
                   const std::vector<UserId>& recipientIds,
                   const std::string& content,
                   const std::optional<std::string>& imageData,
                   Timestamp now);

    // "new_message" event body
    [[nodiscard]] static nlohmann::json toEventPayload(const OutboundMessage& message);

    // Metrics
    [[nodiscard]] uint64_t getMessagesSent() const { return messagesSent_.load(); }
    [[nodiscard]] uint64_t getPersistFailures() const { return persistFailures_.load(); }

private:
    UserStore& users_;
    MessageStore& messages_;
    RoomRouter& router_;
    PresenceRegistry& presence_;

    std::atomic<uint64_t> messagesSent_{0};
    std::atomic<uint64_t> persistFailures_{0};

    static void validate(const std::vector<UserId>& recipientIds,
                         const std::string& content,
                         const std::optional<std::string>& imageData);
};

} // namespace NearbyConnect
