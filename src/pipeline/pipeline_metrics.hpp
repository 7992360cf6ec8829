#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace courier::pipeline {

struct PipelineMetrics {
    std::atomic<std::uint64_t> events_consumed{0};
    std::atomic<std::uint64_t> events_routed{0};
    std::atomic<std::uint64_t> duplicates_skipped{0};
    std::atomic<std::uint64_t> undecodable_events{0};
    std::atomic<std::uint64_t> redeliveries{0};
    std::atomic<std::uint64_t> deliveries_succeeded{0};
    std::atomic<std::uint64_t> deliveries_failed{0};
    std::atomic<std::uint64_t> partial_deliveries{0};
    std::atomic<std::uint64_t> retries{0};
    std::atomic<std::uint64_t> retries_exhausted{0};
    std::atomic<std::uint64_t> dead_lettered{0};
    std::atomic<std::uint64_t> dead_letter_fallbacks{0};
    std::atomic<std::uint64_t> status_published{0};
    std::atomic<std::uint64_t> status_publish_failures{0};
    std::atomic<std::uint64_t> status_applied{0};
    std::atomic<std::uint64_t> status_rejected{0};
    std::atomic<std::uint64_t> status_unknown{0};
    std::atomic<std::uint64_t> live_pushes{0};
    std::atomic<std::uint64_t> rate_limited{0};
    std::atomic<std::uint64_t> rate_limit_fallbacks{0};

    // Prometheus text exposition format.
    std::string Render() const;
};

}  // namespace courier::pipeline
