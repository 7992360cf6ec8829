#include "pipeline/status_consumer.hpp"

#include <set>

#include "bus/event_codec.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {

std::string StatusPayload(const courier::bus::StatusUpdate& update) {
    auto json = courier::bus::ToJson(update);
    json["type"] = "status";
    return json.dump();
}

StatusConsumer::StatusConsumer(courier::bus::EventLog& statuses,
                               courier::storage::StatusRepository& repository,
                               courier::live::LiveNotifier* notifier,
                               PipelineMetrics* metrics,
                               std::chrono::milliseconds redelivery_backoff)
    : repository_(repository)
    , notifier_(notifier)
    , metrics_(metrics)
    , consumers_("status-consumer",
                 statuses,
                 [this](const courier::bus::LogRecord& record) { return HandleRecord(record); },
                 redelivery_backoff) {}

void StatusConsumer::Start() {
    consumers_.Start();
}

void StatusConsumer::Stop() {
    consumers_.Stop();
}

std::size_t StatusConsumer::RunUntilIdle() {
    return consumers_.RunUntilIdle();
}

bool StatusConsumer::HandleRecord(const courier::bus::LogRecord& record) {
    courier::bus::StatusUpdate update;
    try {
        update = courier::bus::DecodeStatusUpdate(record.payload);
    } catch (const courier::ValidationError& ex) {
        courier::utils::LogError("status-consumer", "dropping malformed status update", {
            {"key", record.key},
            {"offset", std::to_string(record.offset)},
            {"error", ex.what()}
        });
        return true;
    }

    courier::storage::MessageRecord message;
    const auto result = repository_.ApplyTransition(update, &message);
    switch (result) {
        case courier::storage::TransitionResult::kApplied:
            if (metrics_) {
                metrics_->status_applied++;
            }
            courier::utils::LogInfo("status-consumer", "status updated", {
                {"messageId", update.message_id},
                {"status", courier::bus::ToString(update.status)},
                {"source", update.source}
            });
            Forward(message, update);
            break;
        case courier::storage::TransitionResult::kUnknownMessage:
            if (metrics_) {
                metrics_->status_unknown++;
            }
            courier::utils::LogWarn("status-consumer", "status update for unknown message", {
                {"messageId", update.message_id},
                {"status", courier::bus::ToString(update.status)}
            });
            break;
        case courier::storage::TransitionResult::kIllegalTransition:
            if (metrics_) {
                metrics_->status_rejected++;
            }
            courier::utils::LogInfo("status-consumer", "ignoring illegal status transition", {
                {"messageId", update.message_id},
                {"status", courier::bus::ToString(update.status)},
                {"source", update.source}
            });
            break;
    }
    return true;
}

void StatusConsumer::Forward(const courier::storage::MessageRecord& message,
                             const courier::bus::StatusUpdate& update) {
    if (!notifier_) {
        return;
    }
    std::set<std::string> users(message.recipient_ids.begin(), message.recipient_ids.end());
    if (!message.sender_id.empty()) {
        users.insert(message.sender_id);
    }
    const auto payload = StatusPayload(update);
    for (const auto& user : users) {
        if (notifier_->DeliverToUser(user, payload) > 0 && metrics_) {
            metrics_->live_pushes++;
        }
    }
}

}  // namespace courier::pipeline
