#include "channels/http_channel_adapter.hpp"

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::channels {
namespace {

std::string Component(courier::bus::Channel channel) {
    return "connector:" + courier::utils::ToLower(courier::bus::ToString(channel));
}

}  // namespace

HttpChannelAdapter::HttpChannelAdapter(courier::bus::Channel channel,
                                       const courier::config::ConnectorConfig& config)
    : channel_(channel)
    , config_(config)
    , url_(courier::utils::ParseUrl(config.base_url)) {}

DeliveryOutcome HttpChannelAdapter::Send(const courier::bus::MessageEvent& message,
                                         const courier::bus::ExternalIdentity& target) {
    nlohmann::json payload = {
        {"messageId", message.message_id},
        {"recipient", target.platform_user_id},
        {"content", message.content}
    };
    if (!message.conversation_id.empty()) {
        payload["conversationId"] = message.conversation_id;
    }
    if (!message.sender_id.empty()) {
        payload["senderId"] = message.sender_id;
    }

    auto client = courier::utils::MakeHttpClient(url_, config_.timeout_s);
    const auto endpoint = url_.base_path + "/v1/messages";
    httplib::Headers headers{{"Accept", "application/json"}};
    auto response = client->Post(endpoint.c_str(), headers, payload.dump(), "application/json");
    if (!response) {
        const auto err_text = courier::utils::HttpErrorToString(response.error());
        throw courier::TransientError(
            std::string(courier::bus::ToString(channel_)) + " connector unreachable: " + err_text);
    }
    if (response->status < 200 || response->status >= 300) {
        const auto text = std::string(courier::bus::ToString(channel_)) + " connector returned HTTP "
            + std::to_string(response->status);
        if (courier::utils::IsRetryableHttpStatus(response->status)) {
            throw courier::TransientError(text);
        }
        throw courier::PermanentError(text + ": " + response->body);
    }

    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (!json.is_object()) {
        throw courier::PermanentError(
            std::string(courier::bus::ToString(channel_)) + " connector sent a malformed response");
    }

    DeliveryOutcome outcome{};
    outcome.message_id = message.message_id;
    if (json.contains("messageId") && json["messageId"].is_string()) {
        outcome.message_id = json["messageId"].get<std::string>();
    }
    if (json.contains("externalMessageId") && json["externalMessageId"].is_string()) {
        outcome.external_message_id = json["externalMessageId"].get<std::string>();
    }
    if (json.contains("status") && json["status"].is_string()) {
        auto status = courier::bus::ParseMessageStatus(json["status"].get<std::string>());
        if (status.has_value()) {
            outcome.status = *status;
        }
    }
    outcome.timestamp_ms = courier::utils::NowMs();
    if (json.contains("timestamp") && json["timestamp"].is_number_integer()) {
        outcome.timestamp_ms = json["timestamp"].get<long long>();
    }

    courier::utils::LogDebug(Component(channel_), "message accepted", {
        {"messageId", outcome.message_id},
        {"externalMessageId", outcome.external_message_id},
        {"status", courier::bus::ToString(outcome.status)}
    });
    return outcome;
}

ValidationResult HttpChannelAdapter::ValidateCredentials() {
    ValidationResult result{};
    auto client = courier::utils::MakeHttpClient(url_, config_.timeout_s);
    const auto endpoint = url_.base_path + "/v1/credentials";
    auto response = client->Get(endpoint.c_str());
    if (!response) {
        result.message = "connector unreachable";
        result.errors.push_back(courier::utils::HttpErrorToString(response.error()));
        return result;
    }
    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (response->status != 200 || !json.is_object()) {
        result.message = "credential check failed";
        result.errors.push_back("HTTP " + std::to_string(response->status));
        return result;
    }
    if (json.contains("valid") && json["valid"].is_boolean()) {
        result.valid = json["valid"].get<bool>();
    }
    if (json.contains("message") && json["message"].is_string()) {
        result.message = json["message"].get<std::string>();
    }
    if (json.contains("errors") && json["errors"].is_array()) {
        for (const auto& error : json["errors"]) {
            if (error.is_string()) {
                result.errors.push_back(error.get<std::string>());
            }
        }
    }
    if (json.contains("platformInfo") && json["platformInfo"].is_object()) {
        for (const auto& item : json["platformInfo"].items()) {
            if (item.value().is_string()) {
                result.platform_info[item.key()] = item.value().get<std::string>();
            } else {
                result.platform_info[item.key()] = item.value().dump();
            }
        }
    }
    return result;
}

}  // namespace courier::channels
