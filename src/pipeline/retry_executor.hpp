#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "config/config_schema.hpp"
#include "pipeline/pipeline_metrics.hpp"

namespace courier::pipeline {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{10000};

    static RetryPolicy FromConfig(const courier::config::RetryConfig& config);

    // Zero before the first attempt, then initial * multiplier^(n-2) capped at max_delay.
    std::chrono::milliseconds DelayBeforeAttempt(int attempt) const;
};

struct RetryResult {
    bool succeeded = false;
    int attempts = 0;
    // Every attempt was used.
    bool exhausted = false;
    // False when the last failure was not worth retrying.
    bool retryable = true;
    std::string last_error;
};

class RetryExecutor {
public:
    using Operation = std::function<void(int attempt)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryExecutor(RetryPolicy policy,
                           Sleeper sleeper = {},
                           PipelineMetrics* metrics = nullptr);

    // Runs operation until it returns normally, throws a non-retryable
    // DeliveryError, or the attempts run out.
    RetryResult Execute(const std::string& label, const Operation& operation) const;

    const RetryPolicy& Policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    PipelineMetrics* metrics_ = nullptr;
};

}  // namespace courier::pipeline
