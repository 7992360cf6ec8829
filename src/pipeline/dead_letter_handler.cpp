#include "pipeline/dead_letter_handler.hpp"

#include <fstream>

#include "bus/event_codec.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {

const char* ToString(DeadLetterOutcome outcome) {
    switch (outcome) {
        case DeadLetterOutcome::kPublished: return "published";
        case DeadLetterOutcome::kWrittenToFallback: return "fallback_file";
        case DeadLetterOutcome::kLoggedOnly: return "logged_only";
    }
    return "unknown";
}

DeadLetterHandler::DeadLetterHandler(courier::bus::EventLog& dead_letter_log,
                                     std::filesystem::path fallback_path,
                                     PipelineMetrics* metrics)
    : dead_letter_log_(dead_letter_log)
    , fallback_path_(std::move(fallback_path))
    , metrics_(metrics) {}

DeadLetterOutcome DeadLetterHandler::SendToDlq(const courier::bus::MessageEvent& message,
                                               const std::string& reason,
                                               int attempts_made) {
    courier::bus::DeadLetterEvent dead_letter{};
    dead_letter.event = message;
    dead_letter.message_id = message.message_id;
    dead_letter.reason = reason;
    dead_letter.attempts_made = attempts_made;
    dead_letter.failed_at_ms = courier::utils::NowMs();
    return Dispatch(dead_letter);
}

DeadLetterOutcome DeadLetterHandler::SendRawToDlq(const std::string& raw_payload,
                                                  const std::string& message_id,
                                                  const std::string& reason) {
    courier::bus::DeadLetterEvent dead_letter{};
    dead_letter.raw_payload = raw_payload;
    dead_letter.message_id = message_id;
    dead_letter.reason = reason;
    dead_letter.failed_at_ms = courier::utils::NowMs();
    return Dispatch(dead_letter);
}

DeadLetterOutcome DeadLetterHandler::Dispatch(const courier::bus::DeadLetterEvent& dead_letter) {
    if (metrics_) {
        metrics_->dead_lettered++;
    }
    const auto key = dead_letter.message_id.empty() ? std::string("unknown") : dead_letter.message_id;
    const auto payload = courier::bus::EncodeDeadLetter(dead_letter);
    try {
        const auto record = dead_letter_log_.Append(key, payload);
        courier::utils::LogWarn("dlq", "message dead-lettered", {
            {"messageId", dead_letter.message_id},
            {"reason", dead_letter.reason},
            {"attemptsMade", std::to_string(dead_letter.attempts_made)},
            {"partition", std::to_string(record.partition)},
            {"offset", std::to_string(record.offset)}
        });
        return DeadLetterOutcome::kPublished;
    } catch (const courier::EventLogError& ex) {
        courier::utils::LogError("dlq", "dead-letter publish failed, using fallback file", {
            {"messageId", dead_letter.message_id},
            {"error", ex.what()}
        });
    }

    if (metrics_) {
        metrics_->dead_letter_fallbacks++;
    }
    auto json = courier::bus::ToJson(dead_letter);
    json["requiresManualIntervention"] = true;
    const auto line = json.dump();
    if (AppendToFallback(line)) {
        return DeadLetterOutcome::kWrittenToFallback;
    }

    courier::utils::LogError("dlq", "!!! Manual intervention required: dead letter could not be stored", {
        {"messageId", dead_letter.message_id},
        {"record", line}
    });
    return DeadLetterOutcome::kLoggedOnly;
}

bool DeadLetterHandler::AppendToFallback(const std::string& line) {
    std::lock_guard<std::mutex> lock(fallback_mutex_);
    std::error_code ec;
    if (fallback_path_.has_parent_path()) {
        std::filesystem::create_directories(fallback_path_.parent_path(), ec);
    }
    std::ofstream out(fallback_path_, std::ios::app);
    if (!out) {
        return false;
    }
    out << line << "\n";
    out.flush();
    return static_cast<bool>(out);
}

}  // namespace courier::pipeline
