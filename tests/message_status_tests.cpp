#include <catch2/catch.hpp>

#include "bus/events.hpp"
#include "bus/message_status.hpp"

using courier::bus::CanTransition;
using courier::bus::MessageStatus;

TEST_CASE("Forward progression follows rank order", "[status]") {
    REQUIRE(CanTransition(MessageStatus::kPending, MessageStatus::kSent));
    REQUIRE(CanTransition(MessageStatus::kSent, MessageStatus::kDelivered));
    REQUIRE(CanTransition(MessageStatus::kDelivered, MessageStatus::kRead));
    REQUIRE(CanTransition(MessageStatus::kPending, MessageStatus::kRead));

    REQUIRE_FALSE(CanTransition(MessageStatus::kDelivered, MessageStatus::kSent));
    REQUIRE_FALSE(CanTransition(MessageStatus::kSent, MessageStatus::kSent));
    REQUIRE_FALSE(CanTransition(MessageStatus::kSent, MessageStatus::kPending));
}

TEST_CASE("FAILED is reachable from every non-terminal state", "[status]") {
    REQUIRE(CanTransition(MessageStatus::kPending, MessageStatus::kFailed));
    REQUIRE(CanTransition(MessageStatus::kSent, MessageStatus::kFailed));
    REQUIRE(CanTransition(MessageStatus::kDelivered, MessageStatus::kFailed));
}

TEST_CASE("Terminal states accept nothing", "[status]") {
    for (auto terminal : {MessageStatus::kRead, MessageStatus::kReceived, MessageStatus::kFailed}) {
        REQUIRE(courier::bus::IsTerminal(terminal));
        for (auto target : {MessageStatus::kPending, MessageStatus::kReceived, MessageStatus::kSent,
                            MessageStatus::kDelivered, MessageStatus::kRead, MessageStatus::kFailed}) {
            REQUIRE_FALSE(CanTransition(terminal, target));
        }
    }
    REQUIRE_FALSE(courier::bus::IsTerminal(MessageStatus::kDelivered));
}

TEST_CASE("Status and channel names parse case-insensitively", "[status]") {
    REQUIRE(courier::bus::ParseMessageStatus("delivered") == MessageStatus::kDelivered);
    REQUIRE(courier::bus::ParseMessageStatus("READ") == MessageStatus::kRead);
    REQUIRE_FALSE(courier::bus::ParseMessageStatus("PARTIALLY_DELIVERED").has_value());

    REQUIRE(courier::bus::ParseChannel("whatsapp") == courier::bus::Channel::kWhatsApp);
    REQUIRE(courier::bus::ParseChannel("TELEGRAM") == courier::bus::Channel::kTelegram);
    REQUIRE_FALSE(courier::bus::ParseChannel("sms").has_value());
    REQUIRE(std::string(courier::bus::ToString(courier::bus::Channel::kInstagram)) == "INSTAGRAM");
}
