#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "bus/event_log.hpp"
#include "bus/events.hpp"
#include "pipeline/pipeline_metrics.hpp"

namespace courier::pipeline {

enum class DeadLetterOutcome {
    kPublished,
    kWrittenToFallback,
    kLoggedOnly
};

const char* ToString(DeadLetterOutcome outcome);

// Quarantines messages that cannot be delivered. Publishes to the dead-letter
// log keyed by message id; when that fails the record is appended to a local
// JSON-lines file, and when that fails too it is logged in full.
class DeadLetterHandler {
public:
    DeadLetterHandler(courier::bus::EventLog& dead_letter_log,
                      std::filesystem::path fallback_path,
                      PipelineMetrics* metrics = nullptr);

    DeadLetterOutcome SendToDlq(const courier::bus::MessageEvent& message,
                                const std::string& reason,
                                int attempts_made);
    // For records that never decoded into a MessageEvent.
    DeadLetterOutcome SendRawToDlq(const std::string& raw_payload,
                                   const std::string& message_id,
                                   const std::string& reason);

    const std::filesystem::path& FallbackPath() const { return fallback_path_; }

private:
    DeadLetterOutcome Dispatch(const courier::bus::DeadLetterEvent& dead_letter);
    bool AppendToFallback(const std::string& line);

    courier::bus::EventLog& dead_letter_log_;
    std::filesystem::path fallback_path_;
    PipelineMetrics* metrics_ = nullptr;
    std::mutex fallback_mutex_;
};

}  // namespace courier::pipeline
