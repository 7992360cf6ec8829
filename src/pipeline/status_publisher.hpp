#pragma once

#include <string>

#include "bus/event_log.hpp"
#include "bus/events.hpp"
#include "pipeline/pipeline_metrics.hpp"

namespace courier::pipeline {

// Fire-and-forget producer for status updates, keyed by message id so every
// update of one message lands on one partition. Failures are logged only.
class StatusPublisher {
public:
    explicit StatusPublisher(courier::bus::EventLog& status_log, PipelineMetrics* metrics = nullptr);

    bool Publish(const std::string& message_id,
                 courier::bus::MessageStatus status,
                 const std::string& source,
                 const std::string& error_message = "");
    bool Publish(courier::bus::StatusUpdate update);

private:
    courier::bus::EventLog& status_log_;
    PipelineMetrics* metrics_ = nullptr;
};

}  // namespace courier::pipeline
