#include "pipeline/pipeline_metrics.hpp"

#include <sstream>

namespace courier::pipeline {
namespace {

void WriteCounter(std::ostringstream& oss,
                  const char* name,
                  const char* help,
                  const std::atomic<std::uint64_t>& value) {
    oss << "# HELP courier_" << name << " " << help << "\n";
    oss << "# TYPE courier_" << name << " counter\n";
    oss << "courier_" << name << " " << value.load() << "\n";
}

}  // namespace

std::string PipelineMetrics::Render() const {
    std::ostringstream oss;
    WriteCounter(oss, "events_consumed_total", "Message events taken off the event log.", events_consumed);
    WriteCounter(oss, "events_routed_total", "Message events routed and committed.", events_routed);
    WriteCounter(oss, "duplicates_skipped_total", "Redelivered events dropped by deduplication.", duplicates_skipped);
    WriteCounter(oss, "undecodable_events_total", "Events that failed validation.", undecodable_events);
    WriteCounter(oss, "redeliveries_total", "Events left uncommitted for redelivery.", redeliveries);
    WriteCounter(oss, "deliveries_succeeded_total", "Per-target deliveries accepted by a connector.", deliveries_succeeded);
    WriteCounter(oss, "deliveries_failed_total", "Per-target deliveries that failed for good.", deliveries_failed);
    WriteCounter(oss, "partial_deliveries_total", "Fan-outs where some targets failed.", partial_deliveries);
    WriteCounter(oss, "retries_total", "Delivery retries scheduled.", retries);
    WriteCounter(oss, "retries_exhausted_total", "Deliveries that used every attempt.", retries_exhausted);
    WriteCounter(oss, "dead_lettered_total", "Messages quarantined in the dead-letter log.", dead_lettered);
    WriteCounter(oss, "dead_letter_fallbacks_total", "Dead letters written to the local fallback.", dead_letter_fallbacks);
    WriteCounter(oss, "status_published_total", "Status updates published.", status_published);
    WriteCounter(oss, "status_publish_failures_total", "Status updates that could not be published.", status_publish_failures);
    WriteCounter(oss, "status_applied_total", "Status transitions persisted.", status_applied);
    WriteCounter(oss, "status_rejected_total", "Illegal or replayed status transitions dropped.", status_rejected);
    WriteCounter(oss, "status_unknown_total", "Status updates for unknown messages.", status_unknown);
    WriteCounter(oss, "live_pushes_total", "Status updates pushed to live streams.", live_pushes);
    WriteCounter(oss, "rate_limited_total", "Ingress requests rejected by the rate limiter.", rate_limited);
    WriteCounter(oss, "rate_limit_fallbacks_total", "Rate limit checks served by the local fallback.", rate_limit_fallbacks);
    return oss.str();
}

}  // namespace courier::pipeline
