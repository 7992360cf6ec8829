#include "pipeline/status_publisher.hpp"

#include "bus/event_codec.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {

StatusPublisher::StatusPublisher(courier::bus::EventLog& status_log, PipelineMetrics* metrics)
    : status_log_(status_log)
    , metrics_(metrics) {}

bool StatusPublisher::Publish(const std::string& message_id,
                              courier::bus::MessageStatus status,
                              const std::string& source,
                              const std::string& error_message) {
    courier::bus::StatusUpdate update{};
    update.message_id = message_id;
    update.status = status;
    update.source = source;
    update.error_message = error_message;
    return Publish(std::move(update));
}

bool StatusPublisher::Publish(courier::bus::StatusUpdate update) {
    if (update.timestamp_ms == 0) {
        update.timestamp_ms = courier::utils::NowMs();
    }
    if (update.source.empty()) {
        update.source = "system";
    }
    try {
        status_log_.Append(update.message_id, courier::bus::EncodeStatusUpdate(update));
    } catch (const courier::EventLogError& ex) {
        if (metrics_) {
            metrics_->status_publish_failures++;
        }
        courier::utils::LogError("status", "failed to publish status update", {
            {"messageId", update.message_id},
            {"status", courier::bus::ToString(update.status)},
            {"error", ex.what()}
        });
        return false;
    }
    if (metrics_) {
        metrics_->status_published++;
    }
    courier::utils::LogDebug("status", "status update published", {
        {"messageId", update.message_id},
        {"status", courier::bus::ToString(update.status)},
        {"source", update.source}
    });
    return true;
}

}  // namespace courier::pipeline
