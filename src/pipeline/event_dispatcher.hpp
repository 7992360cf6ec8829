#pragma once

#include <chrono>
#include <cstddef>

#include "bus/consumer_group.hpp"
#include "bus/event_log.hpp"
#include "pipeline/dead_letter_handler.hpp"
#include "pipeline/dedup_store.hpp"
#include "pipeline/pipeline_metrics.hpp"
#include "pipeline/router.hpp"
#include "pipeline/status_publisher.hpp"

namespace courier::pipeline {

// Consumes message events per conversation partition: dedup, route, then
// mark processed before the offset is committed.
class EventDispatcher {
public:
    EventDispatcher(courier::bus::EventLog& events,
                    DedupStore& dedup,
                    Router& router,
                    DeadLetterHandler& dead_letters,
                    StatusPublisher& statuses,
                    PipelineMetrics* metrics = nullptr,
                    std::chrono::milliseconds redelivery_backoff = std::chrono::milliseconds(500));

    void Start();
    void Stop();
    std::size_t RunUntilIdle();

    // True when the record may be committed.
    bool HandleRecord(const courier::bus::LogRecord& record);

private:
    void HandleUndecodable(const courier::bus::LogRecord& record, const std::string& error);

    DedupStore& dedup_;
    Router& router_;
    DeadLetterHandler& dead_letters_;
    StatusPublisher& statuses_;
    PipelineMetrics* metrics_ = nullptr;
    courier::bus::ConsumerGroup consumers_;
};

}  // namespace courier::pipeline
