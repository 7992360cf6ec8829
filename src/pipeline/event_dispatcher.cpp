#include "pipeline/event_dispatcher.hpp"

#include "bus/event_codec.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {

EventDispatcher::EventDispatcher(courier::bus::EventLog& events,
                                 DedupStore& dedup,
                                 Router& router,
                                 DeadLetterHandler& dead_letters,
                                 StatusPublisher& statuses,
                                 PipelineMetrics* metrics,
                                 std::chrono::milliseconds redelivery_backoff)
    : dedup_(dedup)
    , router_(router)
    , dead_letters_(dead_letters)
    , statuses_(statuses)
    , metrics_(metrics)
    , consumers_("dispatcher",
                 events,
                 [this](const courier::bus::LogRecord& record) { return HandleRecord(record); },
                 redelivery_backoff) {}

void EventDispatcher::Start() {
    consumers_.Start();
}

void EventDispatcher::Stop() {
    consumers_.Stop();
}

std::size_t EventDispatcher::RunUntilIdle() {
    return consumers_.RunUntilIdle();
}

bool EventDispatcher::HandleRecord(const courier::bus::LogRecord& record) {
    if (metrics_) {
        metrics_->events_consumed++;
    }

    courier::bus::MessageEvent event;
    try {
        event = courier::bus::DecodeMessageEvent(record.payload);
    } catch (const courier::ValidationError& ex) {
        HandleUndecodable(record, ex.what());
        return true;
    }

    if (dedup_.IsDuplicate(event.message_id)) {
        if (metrics_) {
            metrics_->duplicates_skipped++;
        }
        courier::utils::LogInfo("dispatcher", "duplicate event skipped", {
            {"messageId", event.message_id},
            {"partition", std::to_string(record.partition)},
            {"offset", std::to_string(record.offset)}
        });
        return true;
    }

    RoutingResult result;
    try {
        result = router_.Route(event);
    } catch (const std::exception&) {
        if (metrics_) {
            metrics_->redeliveries++;
        }
        throw;
    }

    if (result.delivered) {
        statuses_.Publish(event.message_id, result.final_status, "router", result.error_message);
    } else {
        statuses_.Publish(event.message_id, courier::bus::MessageStatus::kFailed, "router", result.failure_reason);
        dead_letters_.SendToDlq(event, result.failure_reason, result.attempts_made);
    }

    dedup_.MarkProcessed(event.message_id);
    if (metrics_) {
        metrics_->events_routed++;
    }
    courier::utils::LogInfo("dispatcher", "event processed", {
        {"messageId", event.message_id},
        {"conversationId", event.conversation_id},
        {"channel", courier::bus::ToString(event.channel)},
        {"status", result.delivered ? courier::bus::ToString(result.final_status) : "FAILED"},
        {"targets", std::to_string(result.targets)},
        {"succeeded", std::to_string(result.succeeded)},
        {"attempts", std::to_string(result.attempts_made)}
    });
    return true;
}

void EventDispatcher::HandleUndecodable(const courier::bus::LogRecord& record, const std::string& error) {
    if (metrics_) {
        metrics_->undecodable_events++;
    }
    std::string message_id;
    auto json = nlohmann::json::parse(record.payload, nullptr, false);
    if (json.is_object() && json.contains("messageId") && json["messageId"].is_string()) {
        message_id = json["messageId"].get<std::string>();
    }
    courier::utils::LogError("dispatcher", "undecodable event", {
        {"messageId", message_id},
        {"partition", std::to_string(record.partition)},
        {"offset", std::to_string(record.offset)},
        {"error", error}
    });
    const auto reason = "validation failed: " + error;
    if (!message_id.empty()) {
        statuses_.Publish(message_id, courier::bus::MessageStatus::kFailed, "router", reason);
    }
    dead_letters_.SendRawToDlq(record.payload, message_id, reason);
}

}  // namespace courier::pipeline
