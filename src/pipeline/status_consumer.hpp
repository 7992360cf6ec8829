#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "bus/consumer_group.hpp"
#include "bus/event_log.hpp"
#include "live/live_notifier.hpp"
#include "pipeline/pipeline_metrics.hpp"
#include "storage/status_repository.hpp"

namespace courier::pipeline {

std::string StatusPayload(const courier::bus::StatusUpdate& update);

// Applies status updates to the persisted record and forwards the applied
// ones to the live streams of the sender and recipients.
class StatusConsumer {
public:
    StatusConsumer(courier::bus::EventLog& statuses,
                   courier::storage::StatusRepository& repository,
                   courier::live::LiveNotifier* notifier,
                   PipelineMetrics* metrics = nullptr,
                   std::chrono::milliseconds redelivery_backoff = std::chrono::milliseconds(500));

    void Start();
    void Stop();
    std::size_t RunUntilIdle();

    bool HandleRecord(const courier::bus::LogRecord& record);

private:
    void Forward(const courier::storage::MessageRecord& message, const courier::bus::StatusUpdate& update);

    courier::storage::StatusRepository& repository_;
    courier::live::LiveNotifier* notifier_ = nullptr;
    PipelineMetrics* metrics_ = nullptr;
    courier::bus::ConsumerGroup consumers_;
};

}  // namespace courier::pipeline
