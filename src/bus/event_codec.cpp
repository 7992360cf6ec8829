#include "bus/event_codec.hpp"

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace courier::bus {
namespace {

std::string RequireString(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string() || json[key].get<std::string>().empty()) {
        throw courier::ValidationError(std::string("missing field '") + key + "'");
    }
    return json[key].get<std::string>();
}

std::string OptionalString(const nlohmann::json& json, const char* key) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return {};
}

// Accepts epoch milliseconds; anything else falls back to now.
long long ReadTimestamp(const nlohmann::json& json, const char* key) {
    if (json.contains(key) && json[key].is_number_integer()) {
        return json[key].get<long long>();
    }
    return courier::utils::NowMs();
}

nlohmann::json ParsePayload(const std::string& payload) {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw courier::ValidationError("payload is not a JSON object");
    }
    return json;
}

}  // namespace

nlohmann::json ToJson(const MessageEvent& event) {
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : event.metadata) {
        metadata[key] = value;
    }
    return {
        {"messageId", event.message_id},
        {"conversationId", event.conversation_id},
        {"senderId", event.sender_id},
        {"recipientIds", event.recipient_ids},
        {"channel", ToString(event.channel)},
        {"content", event.content},
        {"contentType", event.content_type},
        {"status", ToString(event.status)},
        {"timestamp", event.timestamp_ms},
        {"metadata", metadata}
    };
}

MessageEvent MessageEventFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw courier::ValidationError("message event is not an object");
    }
    MessageEvent event{};
    event.message_id = RequireString(json, "messageId");
    event.conversation_id = RequireString(json, "conversationId");
    event.sender_id = RequireString(json, "senderId");

    const auto channel_name = RequireString(json, "channel");
    const auto channel = ParseChannel(channel_name);
    if (!channel) {
        throw courier::ValidationError("unknown channel '" + channel_name + "'");
    }
    event.channel = *channel;

    if (json.contains("recipientIds")) {
        if (!json["recipientIds"].is_array()) {
            throw courier::ValidationError("recipientIds is not an array");
        }
        for (const auto& item : json["recipientIds"]) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                event.recipient_ids.push_back(item.get<std::string>());
            }
        }
    }

    event.content = OptionalString(json, "content");
    const auto content_type = OptionalString(json, "contentType");
    if (!content_type.empty()) {
        event.content_type = content_type;
    }

    const auto status_name = OptionalString(json, "status");
    if (!status_name.empty()) {
        const auto status = ParseMessageStatus(status_name);
        if (!status) {
            throw courier::ValidationError("unknown status '" + status_name + "'");
        }
        event.status = *status;
    }
    event.timestamp_ms = ReadTimestamp(json, "timestamp");

    if (json.contains("metadata") && json["metadata"].is_object()) {
        for (const auto& item : json["metadata"].items()) {
            if (item.value().is_string()) {
                event.metadata[item.key()] = item.value().get<std::string>();
            } else {
                event.metadata[item.key()] = item.value().dump();
            }
        }
    }
    return event;
}

std::string EncodeMessageEvent(const MessageEvent& event) {
    return ToJson(event).dump();
}

MessageEvent DecodeMessageEvent(const std::string& payload) {
    return MessageEventFromJson(ParsePayload(payload));
}

nlohmann::json ToJson(const StatusUpdate& update) {
    nlohmann::json json = {
        {"messageId", update.message_id},
        {"status", ToString(update.status)},
        {"timestamp", update.timestamp_ms},
        {"source", update.source}
    };
    if (!update.error_message.empty()) {
        json["errorMessage"] = update.error_message;
    }
    return json;
}

StatusUpdate StatusUpdateFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw courier::ValidationError("status update is not an object");
    }
    StatusUpdate update{};
    update.message_id = RequireString(json, "messageId");
    const auto status_name = RequireString(json, "status");
    const auto status = ParseMessageStatus(status_name);
    if (!status) {
        throw courier::ValidationError("unknown status '" + status_name + "'");
    }
    update.status = *status;
    update.timestamp_ms = ReadTimestamp(json, "timestamp");
    update.source = OptionalString(json, "source");
    if (update.source.empty()) {
        update.source = "system";
    }
    update.error_message = OptionalString(json, "errorMessage");
    return update;
}

std::string EncodeStatusUpdate(const StatusUpdate& update) {
    return ToJson(update).dump();
}

StatusUpdate DecodeStatusUpdate(const std::string& payload) {
    return StatusUpdateFromJson(ParsePayload(payload));
}

nlohmann::json ToJson(const DeadLetterEvent& dead_letter) {
    nlohmann::json json = nlohmann::json::object();
    if (dead_letter.event.has_value()) {
        json = ToJson(*dead_letter.event);
    } else {
        json["messageId"] = dead_letter.message_id;
        json["rawPayload"] = dead_letter.raw_payload;
    }
    json["reason"] = dead_letter.reason;
    json["attemptsMade"] = dead_letter.attempts_made;
    json["failedAt"] = dead_letter.failed_at_ms;
    return json;
}

std::string EncodeDeadLetter(const DeadLetterEvent& dead_letter) {
    return ToJson(dead_letter).dump();
}

nlohmann::json ToJson(const ExternalIdentity& identity) {
    return {
        {"platform", ToString(identity.platform)},
        {"platformUserId", identity.platform_user_id},
        {"verified", identity.verified}
    };
}

ExternalIdentity ExternalIdentityFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw courier::ValidationError("external identity is not an object");
    }
    ExternalIdentity identity{};
    const auto platform_name = RequireString(json, "platform");
    const auto platform = ParseChannel(platform_name);
    if (!platform) {
        throw courier::ValidationError("unknown platform '" + platform_name + "'");
    }
    identity.platform = *platform;
    identity.platform_user_id = RequireString(json, "platformUserId");
    identity.verified = json.contains("verified") && json["verified"].is_boolean()
        && json["verified"].get<bool>();
    return identity;
}

}  // namespace courier::bus
