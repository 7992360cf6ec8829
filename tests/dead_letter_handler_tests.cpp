#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "pipeline/dead_letter_handler.hpp"
#include "test_support.hpp"

using courier::pipeline::DeadLetterHandler;
using courier::pipeline::DeadLetterOutcome;

namespace {

std::filesystem::path ScratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "courier-dlq-tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::vector<nlohmann::json> ReadLines(const std::filesystem::path& path) {
    std::vector<nlohmann::json> lines;
    std::ifstream input(path);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty()) {
            lines.push_back(nlohmann::json::parse(line));
        }
    }
    return lines;
}

}  // namespace

TEST_CASE("Dead letters are published keyed by message id", "[dlq]") {
    courier::pipeline::PipelineMetrics metrics;
    courier::bus::InMemoryEventLog log("message-events-dlq", 2);
    DeadLetterHandler handler(log, ScratchDir("published") / "dlq.jsonl", &metrics);
    const auto event = courier::testing::MakeEvent("m2", "c1", courier::bus::Channel::kTelegram, {"tg-1"});

    REQUIRE(handler.SendToDlq(event, "retries exhausted: connector timed out", 3) == DeadLetterOutcome::kPublished);

    const auto records = log.Snapshot();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].key == "m2");
    const auto json = nlohmann::json::parse(records[0].payload);
    REQUIRE(json["conversationId"] == "c1");
    REQUIRE(json["channel"] == "TELEGRAM");
    REQUIRE(json["attemptsMade"] == 3);
    REQUIRE(json.contains("failedAt"));
    REQUIRE(metrics.dead_lettered.load() == 1);
    REQUIRE_FALSE(std::filesystem::exists(handler.FallbackPath()));
}

TEST_CASE("Broker outage falls back to the local file", "[dlq]") {
    courier::pipeline::PipelineMetrics metrics;
    courier::testing::BrokenLog<courier::bus::InMemoryEventLog> log("message-events-dlq", 2);
    const auto path = ScratchDir("fallback") / "nested" / "dlq.jsonl";
    DeadLetterHandler handler(log, path, &metrics);
    const auto event = courier::testing::MakeEvent("m-out", "c1", courier::bus::Channel::kWhatsApp, {"+1"});

    REQUIRE(handler.SendToDlq(event, "delivery failed: rejected", 1) == DeadLetterOutcome::kWrittenToFallback);
    REQUIRE(handler.SendRawToDlq("{broken", "", "validation failed: payload is not a JSON object")
            == DeadLetterOutcome::kWrittenToFallback);

    const auto lines = ReadLines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["messageId"] == "m-out");
    REQUIRE(lines[0]["requiresManualIntervention"] == true);
    REQUIRE(lines[1]["rawPayload"] == "{broken");
    REQUIRE(lines[1]["requiresManualIntervention"] == true);
    REQUIRE(metrics.dead_letter_fallbacks.load() == 2);
}

TEST_CASE("Unwritable fallback leaves only the log line", "[dlq]") {
    courier::testing::BrokenLog<courier::bus::InMemoryEventLog> log("message-events-dlq", 1);
    const auto dir = ScratchDir("unwritable");
    const auto blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";
    DeadLetterHandler handler(log, blocker / "dlq.jsonl");
    const auto event = courier::testing::MakeEvent("m-lost", "c1", courier::bus::Channel::kWhatsApp, {"+1"});

    REQUIRE(handler.SendToDlq(event, "delivery failed: rejected", 1) == DeadLetterOutcome::kLoggedOnly);
}

TEST_CASE("Dead-letter outcomes have stable names", "[dlq]") {
    REQUIRE(std::string(courier::pipeline::ToString(DeadLetterOutcome::kPublished)) == "published");
    REQUIRE(std::string(courier::pipeline::ToString(DeadLetterOutcome::kWrittenToFallback)) == "fallback_file");
    REQUIRE(std::string(courier::pipeline::ToString(DeadLetterOutcome::kLoggedOnly)) == "logged_only");
}
