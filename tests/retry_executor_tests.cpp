#include <catch2/catch.hpp>

#include "pipeline/retry_executor.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

TEST_CASE("Delay before attempt n doubles from the initial delay up to the cap", "[retry]") {
    courier::pipeline::RetryPolicy policy{};
    REQUIRE(policy.DelayBeforeAttempt(1) == 0ms);
    REQUIRE(policy.DelayBeforeAttempt(2) == 1000ms);
    REQUIRE(policy.DelayBeforeAttempt(3) == 2000ms);
    REQUIRE(policy.DelayBeforeAttempt(4) == 4000ms);
    REQUIRE(policy.DelayBeforeAttempt(5) == 8000ms);
    REQUIRE(policy.DelayBeforeAttempt(6) == 10000ms);
    REQUIRE(policy.DelayBeforeAttempt(12) == 10000ms);
}

TEST_CASE("Transient failures use every attempt and no more", "[retry]") {
    courier::testing::RecordingSleeper sleeper;
    courier::pipeline::PipelineMetrics metrics;
    courier::pipeline::RetryExecutor executor(courier::pipeline::RetryPolicy{}, sleeper.Fn(), &metrics);

    int calls = 0;
    const auto result = executor.Execute("m2->WHATSAPP:+1", [&](int) {
        calls++;
        throw courier::TransientError("timeout");
    });

    REQUIRE(calls == 3);
    REQUIRE_FALSE(result.succeeded);
    REQUIRE(result.exhausted);
    REQUIRE(result.attempts == 3);
    REQUIRE(result.last_error == "timeout");
    REQUIRE(*sleeper.delays == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
    REQUIRE(metrics.retries.load() == 2);
    REQUIRE(metrics.retries_exhausted.load() == 1);
}

TEST_CASE("Non-retryable failure aborts immediately", "[retry]") {
    courier::testing::RecordingSleeper sleeper;
    courier::pipeline::RetryExecutor executor(courier::pipeline::RetryPolicy{}, sleeper.Fn());

    int calls = 0;
    const auto result = executor.Execute("target", [&](int) {
        calls++;
        throw courier::ValidationError("recipient format rejected");
    });

    REQUIRE(calls == 1);
    REQUIRE_FALSE(result.succeeded);
    REQUIRE_FALSE(result.exhausted);
    REQUIRE_FALSE(result.retryable);
    REQUIRE(sleeper.delays->empty());
}

TEST_CASE("Success on a later attempt stops retrying", "[retry]") {
    courier::testing::RecordingSleeper sleeper;
    courier::pipeline::RetryExecutor executor(courier::pipeline::RetryPolicy{}, sleeper.Fn());

    std::vector<int> attempts;
    const auto result = executor.Execute("target", [&](int attempt) {
        attempts.push_back(attempt);
        if (attempt < 2) {
            throw courier::TransientError("HTTP 503");
        }
    });

    REQUIRE(result.succeeded);
    REQUIRE(result.attempts == 2);
    REQUIRE(attempts == std::vector<int>{1, 2});
    REQUIRE(sleeper.delays->size() == 1);
}

TEST_CASE("Policy comes from configuration", "[retry]") {
    courier::config::RetryConfig config{};
    config.max_attempts = 5;
    config.initial_delay_ms = 200;
    config.multiplier = 3.0;
    config.max_delay_ms = 1000;
    const auto policy = courier::pipeline::RetryPolicy::FromConfig(config);
    REQUIRE(policy.max_attempts == 5);
    REQUIRE(policy.DelayBeforeAttempt(2) == 200ms);
    REQUIRE(policy.DelayBeforeAttempt(3) == 600ms);
    REQUIRE(policy.DelayBeforeAttempt(4) == 1000ms);
}
