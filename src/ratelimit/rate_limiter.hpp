#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "config/config_schema.hpp"
#include "pipeline/pipeline_metrics.hpp"
#include "store/kv_store.hpp"

namespace courier::ratelimit {

struct RateLimitDecision {
    bool allowed = true;
    std::string subject;
    long long limit = 0;
    long long remaining = 0;
    int retry_after_s = 0;
    bool used_fallback = false;
};

// "user:<token prefix>" for bearer tokens, otherwise "ip:<addr>".
std::string SubjectKeyFor(const std::string& authorization, const std::string& remote_addr);

// Fixed-window counters per subject plus one global window, kept in the
// shared store. When the store is down a process-local approximation takes
// over: per-subject windows and a token bucket for the global budget.
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    RateLimiter(courier::store::KeyValueStore& store,
                const courier::config::RateLimitConfig& config,
                courier::pipeline::PipelineMetrics* metrics = nullptr,
                Clock clock = {});

    RateLimitDecision Check(const std::string& subject);

private:
    struct LocalWindow {
        std::chrono::steady_clock::time_point started;
        long long count = 0;
    };

    RateLimitDecision CheckShared(const std::string& subject);
    RateLimitDecision CheckLocal(const std::string& subject);
    long long CountInWindow(const std::string& key);
    int RetryAfterSeconds(const std::string& key);
    std::chrono::steady_clock::time_point Now() const;

    courier::store::KeyValueStore& store_;
    courier::config::RateLimitConfig config_;
    courier::pipeline::PipelineMetrics* metrics_ = nullptr;
    Clock clock_;

    std::mutex local_mutex_;
    std::unordered_map<std::string, LocalWindow> local_windows_;
    double global_tokens_ = 0.0;
    std::chrono::steady_clock::time_point last_refill_;
};

}  // namespace courier::ratelimit
