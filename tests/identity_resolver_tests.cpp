#include <catch2/catch.hpp>

#include "identity/identity_resolver.hpp"
#include "test_support.hpp"

using courier::bus::Channel;
using courier::bus::ExternalIdentity;

namespace {

const std::string kUserId = "3f2b8c1e-9a4d-4e21-8b7f-0c5d6e7f8a9b";

}  // namespace

TEST_CASE("Only UUID-shaped recipients are internal references", "[identity]") {
    REQUIRE(courier::identity::IsInternalReference(kUserId));
    REQUIRE(courier::identity::IsInternalReference("3F2B8C1E-9A4D-4E21-8B7F-0C5D6E7F8A9B"));
    REQUIRE_FALSE(courier::identity::IsInternalReference("+15551234567"));
    REQUIRE_FALSE(courier::identity::IsInternalReference("3f2b8c1e9a4d4e218b7f0c5d6e7f8a9b"));
    REQUIRE_FALSE(courier::identity::IsInternalReference("3f2b8c1e-9a4d-4e21-8b7f-0c5d6e7f8a9z"));
}

TEST_CASE("Direct identities resolve to the event channel without a lookup", "[identity]") {
    courier::testing::FakeDirectory directory;
    courier::identity::IdentityResolver resolver(directory, courier::config::ResolverConfig{});

    const auto targets = resolver.Resolve("+15551234567", Channel::kWhatsApp);
    REQUIRE(targets.size() == 1);
    REQUIRE(targets[0].platform == Channel::kWhatsApp);
    REQUIRE(targets[0].platform_user_id == "+15551234567");
    REQUIRE(directory.Lookups() == 0);
}

TEST_CASE("Internal references expand to every linked identity", "[identity]") {
    courier::testing::FakeDirectory directory;
    directory.AddUser(kUserId, {
        ExternalIdentity{Channel::kWhatsApp, "+1555000", true},
        ExternalIdentity{Channel::kTelegram, "tg-42", true},
        ExternalIdentity{Channel::kInstagram, "ig.user", false}
    });
    courier::identity::IdentityResolver resolver(directory, courier::config::ResolverConfig{});

    const auto targets = resolver.Resolve(kUserId, Channel::kWhatsApp);
    REQUIRE(targets.size() == 3);
    REQUIRE(targets[1].platform == Channel::kTelegram);
}

TEST_CASE("Unknown users and users without identities cannot be resolved", "[identity]") {
    courier::testing::FakeDirectory directory;
    directory.AddUser(kUserId, {});
    courier::identity::IdentityResolver resolver(directory, courier::config::ResolverConfig{});

    REQUIRE_THROWS_AS(resolver.Resolve(kUserId, Channel::kTelegram), courier::ResolutionNotFoundError);
    REQUIRE_THROWS_AS(resolver.Resolve("00000000-0000-0000-0000-000000000000", Channel::kTelegram),
                      courier::ResolutionNotFoundError);
    // a missing user is not retried
    REQUIRE(directory.Lookups() == 2);
}

TEST_CASE("Directory outages are retried once with backoff", "[identity]") {
    courier::testing::FakeDirectory directory;
    directory.SetUnavailable(true);
    courier::testing::RecordingSleeper sleeper;
    courier::identity::IdentityResolver resolver(directory, courier::config::ResolverConfig{}, sleeper.Fn());

    REQUIRE_THROWS_AS(resolver.Resolve(kUserId, Channel::kTelegram), courier::TransientError);
    REQUIRE(directory.Lookups() == 2);
    REQUIRE(*sleeper.delays == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(500)});
}

TEST_CASE("User records decode from the directory shape", "[identity]") {
    const auto json = nlohmann::json::parse(R"({
        "id": "u1",
        "displayName": "Ada",
        "externalIdentities": [
            {"platform": "TELEGRAM", "platformUserId": "tg-1", "verified": true},
            {"platform": "PAGER", "platformUserId": "p-1"}
        ]
    })");
    const auto user = courier::identity::UserRecordFromJson(json);
    REQUIRE(user.display_name == "Ada");
    REQUIRE(user.external_identities.size() == 1);
    REQUIRE(user.external_identities[0].verified);
}
