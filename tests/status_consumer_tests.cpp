#include <catch2/catch.hpp>

#include "bus/event_codec.hpp"
#include "pipeline/status_consumer.hpp"
#include "test_support.hpp"

using courier::bus::Channel;
using courier::bus::MessageStatus;
using courier::testing::MakeEvent;

namespace {

struct StatusFixture {
    courier::pipeline::PipelineMetrics metrics;
    courier::bus::InMemoryEventLog statuses{"status-updates", 2};
    courier::storage::StatusRepository repository{":memory:"};
    courier::live::LiveNotifier notifier;
    courier::pipeline::StatusConsumer consumer{statuses, repository, &notifier, &metrics, std::chrono::milliseconds(0)};

    void Accept(const courier::bus::MessageEvent& event) {
        repository.Insert(courier::storage::RecordFromEvent(event));
    }

    void Publish(const std::string& message_id, MessageStatus status, const std::string& source) {
        courier::bus::StatusUpdate update{};
        update.message_id = message_id;
        update.status = status;
        update.source = source;
        update.timestamp_ms = courier::utils::NowMs();
        statuses.Append(message_id, courier::bus::EncodeStatusUpdate(update));
    }

    MessageStatus StatusOf(const std::string& message_id) {
        auto record = repository.Get(message_id);
        REQUIRE(record.has_value());
        return record->status;
    }
};

}  // namespace

TEST_CASE("Webhook receipt moves a sent message to delivered", "[status]") {
    StatusFixture fixture;
    fixture.Accept(MakeEvent("m1", "c1", Channel::kWhatsApp, {"+15551234567"}));
    fixture.Publish("m1", MessageStatus::kSent, "router");
    fixture.Publish("m1", MessageStatus::kDelivered, "whatsapp");

    REQUIRE(fixture.consumer.RunUntilIdle() == 2);

    REQUIRE(fixture.StatusOf("m1") == MessageStatus::kDelivered);
    const auto history = fixture.repository.History("m1");
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].from == MessageStatus::kPending);
    REQUIRE(history[0].to == MessageStatus::kSent);
    REQUIRE(history[1].to == MessageStatus::kDelivered);
    REQUIRE(history[1].changed_by == "whatsapp");
    REQUIRE(fixture.metrics.status_applied.load() == 2);
}

TEST_CASE("READ is terminal", "[status]") {
    StatusFixture fixture;
    fixture.Accept(MakeEvent("m-read", "c1", Channel::kTelegram, {"tg-1"}));
    fixture.Publish("m-read", MessageStatus::kRead, "telegram");
    fixture.Publish("m-read", MessageStatus::kDelivered, "telegram");
    fixture.Publish("m-read", MessageStatus::kFailed, "router");

    REQUIRE(fixture.consumer.RunUntilIdle() == 3);

    REQUIRE(fixture.StatusOf("m-read") == MessageStatus::kRead);
    REQUIRE(fixture.repository.History("m-read").size() == 1);
    REQUIRE(fixture.metrics.status_rejected.load() == 2);
}

TEST_CASE("Replayed status update is a no-op", "[status]") {
    StatusFixture fixture;
    fixture.Accept(MakeEvent("m-replay", "c1", Channel::kWhatsApp, {"+1"}));
    fixture.Publish("m-replay", MessageStatus::kSent, "router");
    fixture.Publish("m-replay", MessageStatus::kSent, "router");

    REQUIRE(fixture.consumer.RunUntilIdle() == 2);

    REQUIRE(fixture.repository.History("m-replay").size() == 1);
    REQUIRE(fixture.metrics.status_rejected.load() == 1);
}

TEST_CASE("Non-terminal messages can always fail", "[status]") {
    StatusFixture fixture;
    fixture.Accept(MakeEvent("m-fail", "c1", Channel::kWhatsApp, {"+1"}));
    fixture.Publish("m-fail", MessageStatus::kDelivered, "router");
    fixture.Publish("m-fail", MessageStatus::kFailed, "whatsapp");

    fixture.consumer.RunUntilIdle();

    REQUIRE(fixture.StatusOf("m-fail") == MessageStatus::kFailed);
}

TEST_CASE("Updates for unknown or malformed messages are dropped", "[status]") {
    StatusFixture fixture;
    fixture.Publish("m-ghost", MessageStatus::kDelivered, "instagram");
    fixture.statuses.Append("junk", "[1, 2, 3]");

    REQUIRE(fixture.consumer.RunUntilIdle() == 2);

    REQUIRE_FALSE(fixture.repository.Get("m-ghost").has_value());
    REQUIRE(fixture.metrics.status_unknown.load() == 1);
}

TEST_CASE("Applied updates reach sender and recipients once each", "[status]") {
    StatusFixture fixture;
    fixture.Accept(MakeEvent("m-live", "c1", Channel::kInternal, {"u-1", "sender-1"}));
    auto sender = fixture.notifier.Register("sender-1");
    auto recipient = fixture.notifier.Register("u-1");
    auto bystander = fixture.notifier.Register("u-9");

    fixture.Publish("m-live", MessageStatus::kDelivered, "router");
    fixture.consumer.RunUntilIdle();

    REQUIRE(sender->Buffered() == 1);
    REQUIRE(recipient->Buffered() == 1);
    REQUIRE(bystander->Buffered() == 0);

    std::string payload;
    REQUIRE(recipient->TryNext(payload));
    const auto json = nlohmann::json::parse(payload);
    REQUIRE(json["type"] == "status");
    REQUIRE(json["messageId"] == "m-live");
    REQUIRE(json["status"] == "DELIVERED");
}

TEST_CASE("StatusPayload tags the update for live streams", "[status]") {
    courier::bus::StatusUpdate update{};
    update.message_id = "m-x";
    update.status = MessageStatus::kFailed;
    update.source = "router";
    update.error_message = "no linked identity";

    const auto json = nlohmann::json::parse(courier::pipeline::StatusPayload(update));
    REQUIRE(json["type"] == "status");
    REQUIRE(json["errorMessage"] == "no linked identity");
}
