#include "messaging/MessageDispatcher.hpp"
#include "core/Errors.hpp"
#include <iostream>
#include <utility>

namespace NearbyConnect {

MessageDispatcher::MessageDispatcher(UserStore& users, MessageStore& messages,
                                     RoomRouter& router, PresenceRegistry& presence)
    : users_(users), messages_(messages), router_(router), presence_(presence) {}

void MessageDispatcher::validate(const std::vector<UserId>& recipientIds,
                                 const std::string& content,
                                 const std::optional<std::string>& imageData) {
    if (recipientIds.empty()) {
        throw ValidationError("recipient_ids must not be empty");
    }
    if (recipientIds.size() > Constants::MAX_RECIPIENTS) {
        throw ValidationError("Too many recipients (max " +
                              std::to_string(Constants::MAX_RECIPIENTS) + ")");
    }
    for (const auto& recipient : recipientIds) {
        if (recipient.empty()) {
            throw ValidationError("recipient_ids must not contain empty ids");
        }
    }
    if (content.empty() && (!imageData || imageData->empty())) {
        throw ValidationError("Message needs content or an image");
    }
    if (content.size() > Constants::MAX_MESSAGE_CONTENT_BYTES) {
        throw ValidationError("Message content exceeds " +
                              std::to_string(Constants::MAX_MESSAGE_CONTENT_BYTES) + " bytes");
    }
}

MessageId MessageDispatcher::send(const UserId& senderId,
                                  const std::vector<UserId>& recipientIds,
                                  const std::string& content,
                                  const std::optional<std::string>& imageData,
                                  Timestamp now) {
    validate(recipientIds, content, imageData);

    OutboundMessage message;
    message.senderId = senderId;
    message.recipientIds.insert(recipientIds.begin(), recipientIds.end());
    message.content = content;
    message.imageData = imageData;
    message.createdAt = now;

    for (const auto& recipient : message.recipientIds) {
        if (!users_.getUser(recipient)) {
            throw NotFoundError("Unknown recipient: " + recipient);
        }
    }

    auto messageId = messages_.persistMessage(message);
    if (!messageId) {
        persistFailures_++;
        std::cerr << "[MESSAGING] Failed to persist message from " << senderId
                  << "; not publishing" << std::endl;
        throw PersistenceError("Message could not be stored");
    }
    message.messageId = *messageId;

    presence_.touch(senderId, now);

    auto event = makeRoomEvent(RoomNames::messages(), Constants::EVENT_NEW_MESSAGE,
                               toEventPayload(message), now);
    PublishResult result = router_.publish(RoomNames::messages(), std::move(event));
    messagesSent_++;

    if (result.failed > 0) {
        std::cout << "[MESSAGING] Message " << message.messageId << " delivered to "
                  << result.delivered << " connections, " << result.failed << " failed" << std::endl;
    }

    return message.messageId;
}

nlohmann::json MessageDispatcher::toEventPayload(const OutboundMessage& message) {
    nlohmann::json payload = {
        {"id", message.messageId},
        {"sender_id", message.senderId},
        {"recipient_ids", message.recipientIds},
        {"content", message.content},
        {"timestamp", toIso8601(message.createdAt)}
    };
    if (message.imageData) {
        payload["image_data"] = *message.imageData;
    } else {
        payload["image_data"] = nullptr;
    }
    return payload;
}

} // namespace NearbyConnect
