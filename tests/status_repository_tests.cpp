#include <catch2/catch.hpp>

#include <filesystem>

#include "storage/status_repository.hpp"
#include "test_support.hpp"

using courier::bus::Channel;
using courier::bus::MessageStatus;
using courier::storage::StatusRepository;
using courier::storage::TransitionResult;

namespace {

courier::bus::StatusUpdate Update(const std::string& id, MessageStatus status, const std::string& source = "") {
    courier::bus::StatusUpdate update{};
    update.message_id = id;
    update.status = status;
    update.source = source;
    update.timestamp_ms = courier::utils::NowMs();
    return update;
}

}  // namespace

TEST_CASE("Accepted record round-trips through storage", "[storage]") {
    StatusRepository repository(":memory:");
    const auto event = courier::testing::MakeEvent("m1", "c1", Channel::kWhatsApp, {"+1555", "u-2"});

    REQUIRE(repository.Insert(courier::storage::RecordFromEvent(event)));
    REQUIRE_FALSE(repository.Insert(courier::storage::RecordFromEvent(event)));
    REQUIRE(repository.Count() == 1);

    auto record = repository.Get("m1");
    REQUIRE(record.has_value());
    REQUIRE(record->conversation_id == "c1");
    REQUIRE(record->sender_id == "sender-1");
    REQUIRE(record->recipient_ids == std::vector<std::string>{"+1555", "u-2"});
    REQUIRE(record->channel == Channel::kWhatsApp);
    REQUIRE(record->status == MessageStatus::kPending);
    REQUIRE(record->updated_by == "system");
    REQUIRE_FALSE(repository.Get("m-missing").has_value());
}

TEST_CASE("Transitions follow the status order", "[storage]") {
    StatusRepository repository(":memory:");
    repository.Insert(courier::storage::RecordFromEvent(
        courier::testing::MakeEvent("m1", "c1", Channel::kTelegram, {"tg-1"})));

    courier::storage::MessageRecord updated;
    REQUIRE(repository.ApplyTransition(Update("m1", MessageStatus::kSent, "router"), &updated)
            == TransitionResult::kApplied);
    REQUIRE(updated.status == MessageStatus::kSent);
    REQUIRE(updated.updated_by == "router");

    REQUIRE(repository.ApplyTransition(Update("m1", MessageStatus::kPending)) == TransitionResult::kIllegalTransition);
    REQUIRE(repository.ApplyTransition(Update("m1", MessageStatus::kRead, "telegram")) == TransitionResult::kApplied);
    REQUIRE(repository.ApplyTransition(Update("m1", MessageStatus::kFailed)) == TransitionResult::kIllegalTransition);
    REQUIRE(repository.ApplyTransition(Update("m-none", MessageStatus::kSent)) == TransitionResult::kUnknownMessage);

    const auto history = repository.History("m1");
    REQUIRE(history.size() == 2);
    REQUIRE(history[1].from == MessageStatus::kSent);
    REQUIRE(history[1].to == MessageStatus::kRead);
    REQUIRE(history[1].changed_by == "telegram");
    REQUIRE(repository.Get("m1")->status == MessageStatus::kRead);
}

TEST_CASE("Failure text is stored with the transition", "[storage]") {
    StatusRepository repository(":memory:");
    repository.Insert(courier::storage::RecordFromEvent(
        courier::testing::MakeEvent("m2", "c1", Channel::kTelegram, {"tg-1"})));
    auto update = Update("m2", MessageStatus::kFailed, "router");
    update.error_message = "retries exhausted: connector timed out";

    REQUIRE(repository.ApplyTransition(update) == TransitionResult::kApplied);
    const auto record = repository.Get("m2");
    REQUIRE(record->error_message == "retries exhausted: connector timed out");
    REQUIRE(repository.History("m2").front().error_message == "retries exhausted: connector timed out");
    REQUIRE(repository.History("m2").front().changed_by == "router");
}

TEST_CASE("Missing source is recorded as system", "[storage]") {
    StatusRepository repository(":memory:");
    repository.Insert(courier::storage::RecordFromEvent(
        courier::testing::MakeEvent("m3", "c1", Channel::kInstagram, {"ig"})));
    REQUIRE(repository.ApplyTransition(Update("m3", MessageStatus::kSent)) == TransitionResult::kApplied);
    REQUIRE(repository.History("m3").front().changed_by == "system");
}

TEST_CASE("File-backed repository survives reopening", "[storage]") {
    const auto dir = std::filesystem::temp_directory_path() / "courier-storage-tests";
    std::filesystem::remove_all(dir);
    const auto path = (dir / "courier.db").string();
    {
        StatusRepository repository(path);
        repository.Insert(courier::storage::RecordFromEvent(
            courier::testing::MakeEvent("m-disk", "c1", Channel::kWhatsApp, {"+1"})));
        repository.ApplyTransition(Update("m-disk", MessageStatus::kDelivered, "whatsapp"));
    }
    StatusRepository reopened(path);
    auto record = reopened.Get("m-disk");
    REQUIRE(record.has_value());
    REQUIRE(record->status == MessageStatus::kDelivered);
    REQUIRE(std::string(courier::storage::ToString(TransitionResult::kUnknownMessage)) == "unknown_message");
}
