#include <catch2/catch.hpp>

#include <filesystem>
#include <stdexcept>
#include <thread>

#include "bus/event_codec.hpp"
#include "pipeline/event_dispatcher.hpp"
#include "store/memory_kv_store.hpp"
#include "test_support.hpp"

using courier::bus::Channel;
using courier::bus::MessageStatus;
using courier::testing::FakeAdapter;
using courier::testing::MakeEvent;

namespace {

const std::string kUserId = "7c9e6679-7425-40de-944b-e07fc1f90ae7";

// Fails the first lookup with an error the router does not handle.
class FlakyDirectory : public courier::identity::UserDirectory {
public:
    std::optional<courier::identity::UserRecord> FetchUser(const std::string& user_id) override {
        if (calls_++ == 0) {
            throw std::runtime_error("directory response truncated");
        }
        return courier::identity::UserRecord{
            user_id, "Flaky", {courier::bus::ExternalIdentity{Channel::kWhatsApp, "+1555777", true}}};
    }

private:
    int calls_ = 0;
};

struct DispatcherFixture {
    courier::pipeline::PipelineMetrics metrics;
    std::unique_ptr<courier::store::KeyValueStore> store;
    courier::bus::InMemoryEventLog events{"message-events", 4};
    courier::bus::InMemoryEventLog statuses{"status-updates", 4};
    courier::bus::InMemoryEventLog dlq{"message-events-dlq", 2};
    courier::pipeline::StatusPublisher publisher{statuses, &metrics};
    courier::pipeline::DeadLetterHandler dead_letters{
        dlq, std::filesystem::temp_directory_path() / "courier-dispatcher-tests" / "dlq.jsonl", &metrics};
    std::unique_ptr<courier::pipeline::DedupStore> dedup;
    courier::channels::ChannelRegistry registry;
    FakeAdapter* whatsapp = nullptr;
    FakeAdapter* telegram = nullptr;
    std::unique_ptr<courier::identity::UserDirectory> directory;
    courier::testing::RecordingSleeper sleeper;
    std::unique_ptr<courier::identity::IdentityResolver> resolver;
    std::unique_ptr<courier::pipeline::RetryExecutor> retry;
    std::unique_ptr<courier::pipeline::Router> router;
    std::unique_ptr<courier::pipeline::EventDispatcher> dispatcher;

    explicit DispatcherFixture(std::unique_ptr<courier::store::KeyValueStore> kv = nullptr,
                               std::unique_ptr<courier::identity::UserDirectory> users = nullptr)
        : store(kv ? std::move(kv) : std::make_unique<courier::store::MemoryKeyValueStore>())
        , directory(users ? std::move(users) : std::make_unique<courier::testing::FakeDirectory>()) {
        dedup = std::make_unique<courier::pipeline::DedupStore>(*store, courier::config::DedupConfig{});
        auto wa = std::make_unique<FakeAdapter>(Channel::kWhatsApp);
        auto tg = std::make_unique<FakeAdapter>(Channel::kTelegram);
        whatsapp = wa.get();
        telegram = tg.get();
        registry.Register(std::move(wa));
        registry.Register(std::move(tg));
        resolver = std::make_unique<courier::identity::IdentityResolver>(
            *directory, courier::config::ResolverConfig{}, sleeper.Fn());
        retry = std::make_unique<courier::pipeline::RetryExecutor>(
            courier::pipeline::RetryPolicy{}, sleeper.Fn(), &metrics);
        router = std::make_unique<courier::pipeline::Router>(registry, *resolver, *retry, nullptr, 2, &metrics);
        dispatcher = std::make_unique<courier::pipeline::EventDispatcher>(
            events, *dedup, *router, dead_letters, publisher, &metrics, std::chrono::milliseconds(0));
    }

    void Submit(const courier::bus::MessageEvent& event) {
        events.Append(event.PartitionKey(), courier::bus::EncodeMessageEvent(event));
    }

    std::vector<courier::bus::StatusUpdate> PublishedStatuses() const {
        std::vector<courier::bus::StatusUpdate> updates;
        for (const auto& record : statuses.Snapshot()) {
            updates.push_back(courier::bus::DecodeStatusUpdate(record.payload));
        }
        return updates;
    }

    // Message ids of published statuses whose id starts with prefix, in emission order.
    std::vector<std::string> StatusOrderFor(const std::string& prefix) const {
        std::vector<std::string> ids;
        for (const auto& update : PublishedStatuses()) {
            if (update.message_id.rfind(prefix, 0) == 0) {
                ids.push_back(update.message_id);
            }
        }
        return ids;
    }
};

}  // namespace

TEST_CASE("Delivered event publishes the connector status and is marked processed", "[dispatcher]") {
    DispatcherFixture fixture;
    fixture.Submit(MakeEvent("m1", "c1", Channel::kWhatsApp, {"+15551234567"}));

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 1);

    const auto updates = fixture.PublishedStatuses();
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].message_id == "m1");
    REQUIRE(updates[0].status == MessageStatus::kSent);
    REQUIRE(updates[0].source == "router");
    REQUIRE(fixture.dedup->IsDuplicate("m1"));
    REQUIRE(fixture.dlq.Snapshot().empty());
}

TEST_CASE("Redelivered duplicate is not sent twice", "[dispatcher]") {
    DispatcherFixture fixture;
    const auto event = MakeEvent("m-dup", "c1", Channel::kWhatsApp, {"+15550000001"});
    fixture.Submit(event);
    fixture.Submit(event);

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 2);

    REQUIRE(fixture.whatsapp->CallCount() == 1);
    REQUIRE(fixture.metrics.duplicates_skipped.load() == 1);
    REQUIRE(fixture.PublishedStatuses().size() == 1);
}

TEST_CASE("Exhausted delivery publishes FAILED and dead-letters the event", "[dispatcher]") {
    DispatcherFixture fixture;
    fixture.telegram->ForTarget("tg-1", courier::testing::AlwaysTimeout());
    fixture.Submit(MakeEvent("m2", "c1", Channel::kTelegram, {"tg-1"}));

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 1);

    const auto updates = fixture.PublishedStatuses();
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].status == MessageStatus::kFailed);
    REQUIRE(updates[0].error_message == "retries exhausted: connector timed out");

    const auto dead = fixture.dlq.Snapshot();
    REQUIRE(dead.size() == 1);
    REQUIRE(dead[0].key == "m2");
    const auto json = nlohmann::json::parse(dead[0].payload);
    REQUIRE(json["messageId"] == "m2");
    REQUIRE(json["attemptsMade"] == 3);
    REQUIRE(json["reason"] == "retries exhausted: connector timed out");
    REQUIRE(fixture.dedup->IsDuplicate("m2"));
}

TEST_CASE("Events of one conversation are delivered in submission order", "[dispatcher]") {
    DispatcherFixture fixture;
    fixture.Submit(MakeEvent("a1", "conv-a", Channel::kWhatsApp, {"a-first"}));
    fixture.Submit(MakeEvent("b1", "conv-b", Channel::kWhatsApp, {"b-first"}));
    fixture.Submit(MakeEvent("a2", "conv-a", Channel::kWhatsApp, {"a-second"}));
    fixture.Submit(MakeEvent("a3", "conv-a", Channel::kWhatsApp, {"a-third"}));
    fixture.Submit(MakeEvent("b2", "conv-b", Channel::kWhatsApp, {"b-second"}));

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 5);

    std::vector<std::string> conv_a;
    std::vector<std::string> conv_b;
    for (const auto& target : fixture.whatsapp->Calls()) {
        (target.rfind("a-", 0) == 0 ? conv_a : conv_b).push_back(target);
    }
    REQUIRE(conv_a == std::vector<std::string>{"a-first", "a-second", "a-third"});
    REQUIRE(conv_b == std::vector<std::string>{"b-first", "b-second"});
    REQUIRE(fixture.StatusOrderFor("a") == std::vector<std::string>{"a1", "a2", "a3"});
    REQUIRE(fixture.StatusOrderFor("b") == std::vector<std::string>{"b1", "b2"});
}

TEST_CASE("Partition workers publish statuses in consumption order", "[dispatcher][threads]") {
    DispatcherFixture fixture;
    for (int i = 1; i <= 20; ++i) {
        fixture.Submit(MakeEvent("a" + std::to_string(i), "conv-a", Channel::kWhatsApp, {"a-" + std::to_string(i)}));
        fixture.Submit(MakeEvent("b" + std::to_string(i), "conv-b", Channel::kTelegram, {"b-" + std::to_string(i)}));
    }

    fixture.dispatcher->Start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fixture.statuses.Snapshot().size() < 40 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    fixture.dispatcher->Stop();

    REQUIRE(fixture.statuses.Snapshot().size() == 40);
    std::vector<std::string> expected_a;
    std::vector<std::string> expected_b;
    std::vector<std::string> sent_a;
    for (int i = 1; i <= 20; ++i) {
        expected_a.push_back("a" + std::to_string(i));
        expected_b.push_back("b" + std::to_string(i));
        sent_a.push_back("a-" + std::to_string(i));
    }
    REQUIRE(fixture.StatusOrderFor("a") == expected_a);
    REQUIRE(fixture.StatusOrderFor("b") == expected_b);
    REQUIRE(fixture.whatsapp->Calls() == sent_a);
    REQUIRE(fixture.events.CommittedOffset(fixture.events.PartitionFor("conv-a")) > 0);
}

TEST_CASE("Non-retryable directory error dead-letters instead of blocking the partition", "[dispatcher]") {
    auto users = std::make_unique<courier::testing::FakeDirectory>();
    users->RejectWith("user directory returned HTTP 403");
    DispatcherFixture fixture(nullptr, std::move(users));
    fixture.Submit(MakeEvent("m-403", "c403", Channel::kWhatsApp, {kUserId}));
    fixture.Submit(MakeEvent("m-next", "c403", Channel::kWhatsApp, {"+15550000403"}));
    const int partition = fixture.events.PartitionFor("c403");

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 2);
    REQUIRE(fixture.events.CommittedOffset(partition) == 2);
    REQUIRE(fixture.metrics.redeliveries.load() == 0);

    const auto dead = fixture.dlq.Snapshot();
    REQUIRE(dead.size() == 1);
    const auto json = nlohmann::json::parse(dead[0].payload);
    REQUIRE(json["messageId"] == "m-403");
    REQUIRE(json["reason"] == "identity resolution failed: user directory returned HTTP 403");

    const auto updates = fixture.PublishedStatuses();
    REQUIRE(updates.size() == 2);
    REQUIRE(updates[0].message_id == "m-403");
    REQUIRE(updates[0].status == MessageStatus::kFailed);
    REQUIRE(updates[1].message_id == "m-next");
    REQUIRE(updates[1].status == MessageStatus::kSent);
    REQUIRE(fixture.whatsapp->Calls() == std::vector<std::string>{"+15550000403"});
}

TEST_CASE("Unexpected routing failure leaves the offset uncommitted", "[dispatcher]") {
    DispatcherFixture fixture(nullptr, std::make_unique<FlakyDirectory>());
    fixture.Submit(MakeEvent("m-flaky", "c9", Channel::kWhatsApp, {kUserId}));
    const int partition = fixture.events.PartitionFor("c9");

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 0);
    REQUIRE(fixture.events.CommittedOffset(partition) == 0);
    REQUIRE(fixture.metrics.redeliveries.load() == 1);
    REQUIRE_FALSE(fixture.dedup->IsDuplicate("m-flaky"));
    REQUIRE(fixture.PublishedStatuses().empty());

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 1);
    REQUIRE(fixture.events.CommittedOffset(partition) == 1);
    REQUIRE(fixture.whatsapp->Calls() == std::vector<std::string>{"+1555777"});
}

TEST_CASE("Dedup store outage fails open", "[dispatcher]") {
    DispatcherFixture fixture(std::make_unique<courier::testing::UnavailableStore>());
    const auto event = MakeEvent("m-open", "c1", Channel::kWhatsApp, {"+15550000002"});
    fixture.Submit(event);
    fixture.Submit(event);

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 2);
    REQUIRE(fixture.whatsapp->CallCount() == 2);
}

TEST_CASE("Undecodable records are dead-lettered raw and committed", "[dispatcher]") {
    DispatcherFixture fixture;
    fixture.events.Append("c1", "{not json");
    fixture.events.Append("c1", R"({"messageId":"m-bad","conversationId":"c1","senderId":"s","channel":"PIGEON"})");

    REQUIRE(fixture.dispatcher->RunUntilIdle() == 2);
    REQUIRE(fixture.metrics.undecodable_events.load() == 2);

    const auto dead = fixture.dlq.Snapshot();
    REQUIRE(dead.size() == 2);
    std::size_t raw_unknown = 0;
    for (const auto& record : dead) {
        const auto json = nlohmann::json::parse(record.payload);
        REQUIRE(json.contains("rawPayload"));
        REQUIRE(json["reason"].get<std::string>().rfind("validation failed:", 0) == 0);
        if (record.key == "unknown") {
            raw_unknown++;
            REQUIRE(json["rawPayload"] == "{not json");
        }
    }
    REQUIRE(raw_unknown == 1);

    const auto updates = fixture.PublishedStatuses();
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].message_id == "m-bad");
    REQUIRE(updates[0].status == MessageStatus::kFailed);
}
