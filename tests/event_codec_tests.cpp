#include <catch2/catch.hpp>

#include "bus/event_codec.hpp"
#include "utils/errors.hpp"

TEST_CASE("Message event decodes the wire shape", "[codec]") {
    const std::string payload = R"({
        "messageId": "m1",
        "conversationId": "c1",
        "senderId": "u1",
        "recipientIds": ["+15550001", "+15550002"],
        "channel": "WHATSAPP",
        "content": "hi",
        "status": "PENDING",
        "timestamp": 1700000000000,
        "metadata": {"priority": "high", "attempt": 2}
    })";
    const auto event = courier::bus::DecodeMessageEvent(payload);
    REQUIRE(event.message_id == "m1");
    REQUIRE(event.PartitionKey() == "c1");
    REQUIRE(event.recipient_ids.size() == 2);
    REQUIRE(event.channel == courier::bus::Channel::kWhatsApp);
    REQUIRE(event.content_type == "TEXT");
    REQUIRE(event.timestamp_ms == 1700000000000LL);
    REQUIRE(event.metadata.at("priority") == "high");
    REQUIRE(event.metadata.at("attempt") == "2");
}

TEST_CASE("Malformed message events are validation failures", "[codec]") {
    REQUIRE_THROWS_AS(courier::bus::DecodeMessageEvent("not json"), courier::ValidationError);
    REQUIRE_THROWS_AS(courier::bus::DecodeMessageEvent(R"({"messageId":"m1"})"), courier::ValidationError);
    REQUIRE_THROWS_AS(courier::bus::DecodeMessageEvent(
        R"({"messageId":"m1","conversationId":"c1","senderId":"u1","channel":"FAX"})"),
        courier::ValidationError);
}

TEST_CASE("Status update carries optional error text", "[codec]") {
    courier::bus::StatusUpdate update{};
    update.message_id = "m1";
    update.status = courier::bus::MessageStatus::kFailed;
    update.timestamp_ms = 42;
    update.source = "router";
    update.error_message = "retries exhausted";
    const auto json = nlohmann::json::parse(courier::bus::EncodeStatusUpdate(update));
    REQUIRE(json["status"] == "FAILED");
    REQUIRE(json["errorMessage"] == "retries exhausted");

    const auto decoded = courier::bus::DecodeStatusUpdate(R"({"messageId":"m2","status":"read"})");
    REQUIRE(decoded.status == courier::bus::MessageStatus::kRead);
    REQUIRE(decoded.source == "system");
    REQUIRE(decoded.error_message.empty());
}

TEST_CASE("Dead letter keeps the event and the failure context", "[codec]") {
    courier::bus::MessageEvent event{};
    event.message_id = "m1";
    event.conversation_id = "c1";
    event.sender_id = "u1";
    event.channel = courier::bus::Channel::kTelegram;

    courier::bus::DeadLetterEvent dead_letter{};
    dead_letter.event = event;
    dead_letter.message_id = "m1";
    dead_letter.reason = "retries exhausted: timeout";
    dead_letter.attempts_made = 3;
    dead_letter.failed_at_ms = 99;

    const auto json = nlohmann::json::parse(courier::bus::EncodeDeadLetter(dead_letter));
    REQUIRE(json["messageId"] == "m1");
    REQUIRE(json["channel"] == "TELEGRAM");
    REQUIRE(json["reason"] == "retries exhausted: timeout");
    REQUIRE(json["attemptsMade"] == 3);
    REQUIRE(json["failedAt"] == 99);
}
