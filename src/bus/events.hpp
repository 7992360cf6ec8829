#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/message_status.hpp"

namespace courier::bus {

enum class Channel {
    kWhatsApp,
    kTelegram,
    kInstagram,
    kInternal
};

const char* ToString(Channel channel);
std::optional<Channel> ParseChannel(const std::string& value);

struct MessageEvent {
    std::string message_id;
    std::string conversation_id;
    std::string sender_id;
    std::vector<std::string> recipient_ids;
    Channel channel = Channel::kInternal;
    std::string content;
    std::string content_type = "TEXT";
    MessageStatus status = MessageStatus::kPending;
    long long timestamp_ms = 0;
    std::unordered_map<std::string, std::string> metadata;

    const std::string& PartitionKey() const { return conversation_id; }
};

struct StatusUpdate {
    std::string message_id;
    MessageStatus status = MessageStatus::kPending;
    long long timestamp_ms = 0;
    std::string source;
    std::string error_message;
};

struct DeadLetterEvent {
    std::optional<MessageEvent> event;
    // Set instead of event when the original record could not be decoded.
    std::string raw_payload;
    std::string message_id;
    std::string reason;
    int attempts_made = 0;
    long long failed_at_ms = 0;
};

struct ExternalIdentity {
    Channel platform = Channel::kInternal;
    std::string platform_user_id;
    bool verified = false;
};

struct DeliveryAttempt {
    Channel channel = Channel::kInternal;
    std::string target_identity;
    int attempt_number = 0;
    std::string outcome;
};

}  // namespace courier::bus
