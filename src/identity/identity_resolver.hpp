#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "config/config_schema.hpp"
#include "identity/user_directory.hpp"

namespace courier::identity {

// UUID-shaped recipients name internal users.
bool IsInternalReference(const std::string& recipient);

class IdentityResolver {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    IdentityResolver(UserDirectory& directory,
                     const courier::config::ResolverConfig& config,
                     Sleeper sleeper = {});

    // Internal references resolve to every linked platform account of the
    // user; anything else is a direct identity on the given channel.
    // Throws ResolutionNotFoundError for unknown users or users without a
    // linked account, TransientError once the directory lookups are spent.
    std::vector<courier::bus::ExternalIdentity> Resolve(const std::string& recipient,
                                                        courier::bus::Channel channel);

private:
    UserRecord Lookup(const std::string& user_id);

    UserDirectory& directory_;
    courier::config::ResolverConfig config_;
    Sleeper sleeper_;
};

}  // namespace courier::identity
