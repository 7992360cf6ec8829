#include "identity/identity_resolver.hpp"

#include <algorithm>
#include <thread>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::identity {

bool IsInternalReference(const std::string& recipient) {
    return courier::utils::IsUuid(recipient);
}

IdentityResolver::IdentityResolver(UserDirectory& directory,
                                   const courier::config::ResolverConfig& config,
                                   Sleeper sleeper)
    : directory_(directory)
    , config_(config)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

std::vector<courier::bus::ExternalIdentity> IdentityResolver::Resolve(const std::string& recipient,
                                                                      courier::bus::Channel channel) {
    if (!IsInternalReference(recipient)) {
        return {courier::bus::ExternalIdentity{channel, recipient, true}};
    }

    auto user = Lookup(recipient);
    if (user.external_identities.empty()) {
        throw courier::ResolutionNotFoundError("no linked identity for user " + recipient);
    }
    courier::utils::LogDebug("identity", "resolved internal reference", {
        {"userId", recipient},
        {"identities", std::to_string(user.external_identities.size())}
    });
    return user.external_identities;
}

UserRecord IdentityResolver::Lookup(const std::string& user_id) {
    const int max_attempts = std::max(1, config_.max_attempts);
    for (int attempts = 1;; ++attempts) {
        try {
            auto user = directory_.FetchUser(user_id);
            if (!user.has_value()) {
                throw courier::ResolutionNotFoundError("no linked identity: user " + user_id + " not found");
            }
            return *user;
        } catch (const courier::TransientError& ex) {
            if (attempts >= max_attempts) {
                throw courier::TransientError("user directory unavailable after "
                    + std::to_string(attempts) + " attempts: " + ex.what());
            }
            courier::utils::LogWarn("identity", "user directory lookup failed, retrying", {
                {"userId", user_id},
                {"attempt", std::to_string(attempts)},
                {"error", ex.what()}
            });
            sleeper_(std::chrono::milliseconds(config_.backoff_ms));
        }
    }
}

}  // namespace courier::identity
