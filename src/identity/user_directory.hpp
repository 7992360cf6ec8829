#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "utils/http_client.hpp"

namespace courier::identity {

struct UserRecord {
    std::string id;
    std::string display_name;
    std::vector<courier::bus::ExternalIdentity> external_identities;
};

// Lookup of internal users and their linked platform accounts.
// FetchUser returns nullopt for unknown users and throws TransientError when
// the directory cannot answer.
class UserDirectory {
public:
    virtual ~UserDirectory() = default;
    virtual std::optional<UserRecord> FetchUser(const std::string& user_id) = 0;
};

// GET {base_url}/users/{id}
class HttpUserDirectory : public UserDirectory {
public:
    explicit HttpUserDirectory(const courier::config::ResolverConfig& config);

    std::optional<UserRecord> FetchUser(const std::string& user_id) override;

private:
    courier::config::ResolverConfig config_;
    courier::utils::ParsedUrl url_;
};

UserRecord UserRecordFromJson(const nlohmann::json& json);

}  // namespace courier::identity
