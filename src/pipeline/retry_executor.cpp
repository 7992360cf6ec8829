#include "pipeline/retry_executor.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {

RetryPolicy RetryPolicy::FromConfig(const courier::config::RetryConfig& config) {
    RetryPolicy policy{};
    policy.max_attempts = std::max(1, config.max_attempts);
    policy.initial_delay = std::chrono::milliseconds(config.initial_delay_ms);
    policy.multiplier = config.multiplier;
    policy.max_delay = std::chrono::milliseconds(config.max_delay_ms);
    return policy;
}

std::chrono::milliseconds RetryPolicy::DelayBeforeAttempt(int attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds(0);
    }
    const double scaled = static_cast<double>(initial_delay.count()) * std::pow(multiplier, attempt - 2);
    const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

RetryExecutor::RetryExecutor(RetryPolicy policy, Sleeper sleeper, PipelineMetrics* metrics)
    : policy_(policy)
    , sleeper_(std::move(sleeper))
    , metrics_(metrics) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

RetryResult RetryExecutor::Execute(const std::string& label, const Operation& operation) const {
    RetryResult result{};
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        const auto delay = policy_.DelayBeforeAttempt(attempt);
        if (attempt > 1) {
            if (metrics_) {
                metrics_->retries++;
            }
            courier::utils::LogWarn("retry", "retrying delivery", {
                {"target", label},
                {"attempt", std::to_string(attempt)},
                {"delayMs", std::to_string(delay.count())},
                {"lastError", result.last_error}
            });
            sleeper_(delay);
        }
        result.attempts = attempt;
        try {
            operation(attempt);
            result.succeeded = true;
            result.retryable = false;
            courier::utils::LogDebug("retry", "delivery succeeded", {
                {"target", label},
                {"attempts", std::to_string(attempt)}
            });
            return result;
        } catch (const courier::DeliveryError& ex) {
            result.last_error = ex.what();
            result.retryable = ex.Retryable();
            if (!ex.Retryable()) {
                courier::utils::LogWarn("retry", "non-retryable failure", {
                    {"target", label},
                    {"attempt", std::to_string(attempt)},
                    {"error", ex.what()}
                });
                return result;
            }
        } catch (const std::exception& ex) {
            result.last_error = ex.what();
            result.retryable = true;
        }
    }
    result.exhausted = true;
    if (metrics_) {
        metrics_->retries_exhausted++;
    }
    courier::utils::LogError("retry", "retries exhausted", {
        {"target", label},
        {"attempts", std::to_string(result.attempts)},
        {"lastError", result.last_error}
    });
    return result;
}

}  // namespace courier::pipeline
