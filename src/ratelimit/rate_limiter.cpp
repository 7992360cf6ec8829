#include "ratelimit/rate_limiter.hpp"

#include <algorithm>
#include <cmath>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::ratelimit {
namespace {

constexpr std::size_t kLocalPruneThreshold = 10000;

}  // namespace

std::string SubjectKeyFor(const std::string& authorization, const std::string& remote_addr) {
    const std::string bearer = "Bearer ";
    if (authorization.rfind(bearer, 0) == 0 && authorization.size() > bearer.size()) {
        const auto end = std::min<std::size_t>(20, authorization.size());
        return "user:" + authorization.substr(bearer.size(), end - bearer.size());
    }
    return "ip:" + (remote_addr.empty() ? std::string("unknown") : remote_addr);
}

RateLimiter::RateLimiter(courier::store::KeyValueStore& store,
                         const courier::config::RateLimitConfig& config,
                         courier::pipeline::PipelineMetrics* metrics,
                         Clock clock)
    : store_(store)
    , config_(config)
    , metrics_(metrics)
    , clock_(std::move(clock)) {
    global_tokens_ = static_cast<double>(config_.burst_capacity);
    last_refill_ = Now();
}

RateLimitDecision RateLimiter::Check(const std::string& subject) {
    if (!config_.enabled) {
        RateLimitDecision decision{};
        decision.subject = subject;
        decision.limit = config_.user_limit;
        decision.remaining = config_.user_limit;
        return decision;
    }
    RateLimitDecision decision;
    try {
        decision = CheckShared(subject);
    } catch (const courier::StoreUnavailableError& ex) {
        if (metrics_) {
            metrics_->rate_limit_fallbacks++;
        }
        courier::utils::LogWarn("ratelimit", "store unavailable, using local limits", {
            {"subject", subject},
            {"error", ex.what()}
        });
        decision = CheckLocal(subject);
    }
    if (!decision.allowed) {
        if (metrics_) {
            metrics_->rate_limited++;
        }
        courier::utils::LogWarn("ratelimit", "rate limit exceeded", {
            {"subject", subject},
            {"limit", std::to_string(decision.limit)},
            {"retryAfter", std::to_string(decision.retry_after_s)}
        });
    }
    return decision;
}

RateLimitDecision RateLimiter::CheckShared(const std::string& subject) {
    RateLimitDecision decision{};
    decision.subject = subject;
    decision.limit = config_.user_limit;

    const auto subject_key = config_.key_prefix + subject;
    const auto count = CountInWindow(subject_key);
    if (count > config_.user_limit) {
        decision.allowed = false;
        decision.retry_after_s = RetryAfterSeconds(subject_key);
        return decision;
    }
    decision.remaining = config_.user_limit - count;

    const auto global_key = config_.key_prefix + "global";
    const auto global_count = CountInWindow(global_key);
    if (global_count > config_.global_limit) {
        decision.allowed = false;
        decision.limit = config_.global_limit;
        decision.remaining = 0;
        decision.retry_after_s = RetryAfterSeconds(global_key);
    }
    return decision;
}

RateLimitDecision RateLimiter::CheckLocal(const std::string& subject) {
    std::lock_guard<std::mutex> lock(local_mutex_);
    RateLimitDecision decision{};
    decision.subject = subject;
    decision.limit = config_.user_limit;
    decision.used_fallback = true;

    const auto now = Now();
    const auto window = std::chrono::seconds(config_.window_s);
    if (local_windows_.size() > kLocalPruneThreshold) {
        for (auto it = local_windows_.begin(); it != local_windows_.end();) {
            if (now - it->second.started >= window) {
                it = local_windows_.erase(it);
            } else {
                ++it;
            }
        }
    }

    auto& entry = local_windows_[subject];
    if (entry.count == 0 || now - entry.started >= window) {
        entry.started = now;
        entry.count = 0;
    }
    entry.count++;
    if (entry.count > config_.user_limit) {
        const auto left = std::chrono::duration_cast<std::chrono::seconds>(entry.started + window - now);
        decision.allowed = false;
        decision.retry_after_s = std::max(1, static_cast<int>(left.count()));
        return decision;
    }
    decision.remaining = config_.user_limit - entry.count;

    const double capacity = static_cast<double>(config_.burst_capacity);
    const double refill_per_s = static_cast<double>(config_.global_limit) / std::max(1, config_.window_s);
    const double elapsed_s = std::chrono::duration<double>(now - last_refill_).count();
    global_tokens_ = std::min(capacity, global_tokens_ + elapsed_s * refill_per_s);
    last_refill_ = now;
    if (global_tokens_ < 1.0) {
        decision.allowed = false;
        decision.limit = config_.global_limit;
        decision.remaining = 0;
        decision.retry_after_s = std::max(1, static_cast<int>(std::ceil((1.0 - global_tokens_) / refill_per_s)));
        return decision;
    }
    global_tokens_ -= 1.0;
    return decision;
}

long long RateLimiter::CountInWindow(const std::string& key) {
    const auto count = store_.Increment(key);
    if (count == 1) {
        store_.Expire(key, std::chrono::seconds(config_.window_s));
    }
    return count;
}

int RateLimiter::RetryAfterSeconds(const std::string& key) {
    const auto ttl = store_.TimeToLive(key);
    if (!ttl.has_value()) {
        return config_.window_s;
    }
    const auto seconds = static_cast<int>((ttl->count() + 999) / 1000);
    return std::max(1, seconds);
}

std::chrono::steady_clock::time_point RateLimiter::Now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

}  // namespace courier::ratelimit
