#include "identity/user_directory.hpp"

#include "bus/event_codec.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::identity {

UserRecord UserRecordFromJson(const nlohmann::json& json) {
    UserRecord user{};
    if (!json.is_object()) {
        throw courier::PermanentError("user directory sent a malformed user record");
    }
    if (json.contains("id") && json["id"].is_string()) {
        user.id = json["id"].get<std::string>();
    }
    if (json.contains("displayName") && json["displayName"].is_string()) {
        user.display_name = json["displayName"].get<std::string>();
    }
    if (json.contains("externalIdentities") && json["externalIdentities"].is_array()) {
        for (const auto& entry : json["externalIdentities"]) {
            try {
                user.external_identities.push_back(courier::bus::ExternalIdentityFromJson(entry));
            } catch (const courier::ValidationError& ex) {
                courier::utils::LogWarn("identity", "skipping unusable identity", {
                    {"userId", user.id},
                    {"error", ex.what()}
                });
            }
        }
    }
    return user;
}

HttpUserDirectory::HttpUserDirectory(const courier::config::ResolverConfig& config)
    : config_(config)
    , url_(courier::utils::ParseUrl(config.base_url)) {}

std::optional<UserRecord> HttpUserDirectory::FetchUser(const std::string& user_id) {
    auto client = courier::utils::MakeHttpClient(url_, config_.timeout_s);
    const auto endpoint = url_.base_path + "/users/" + user_id;
    httplib::Headers headers{{"Accept", "application/json"}};
    auto response = client->Get(endpoint.c_str(), headers);
    if (!response) {
        throw courier::TransientError(
            "user directory unreachable: " + courier::utils::HttpErrorToString(response.error()));
    }
    if (response->status == 404) {
        return std::nullopt;
    }
    if (response->status != 200) {
        const auto text = "user directory returned HTTP " + std::to_string(response->status);
        if (courier::utils::IsRetryableHttpStatus(response->status)) {
            throw courier::TransientError(text);
        }
        throw courier::PermanentError(text);
    }
    auto json = nlohmann::json::parse(response->body, nullptr, false);
    return UserRecordFromJson(json);
}

}  // namespace courier::identity
