#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "sqlite3.h"

namespace courier::storage {

struct MessageRecord {
    std::string message_id;
    std::string conversation_id;
    std::string sender_id;
    std::vector<std::string> recipient_ids;
    courier::bus::Channel channel = courier::bus::Channel::kInternal;
    courier::bus::MessageStatus status = courier::bus::MessageStatus::kPending;
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    std::string updated_by;
    std::string error_message;
};

struct StatusHistoryEntry {
    courier::bus::MessageStatus from = courier::bus::MessageStatus::kPending;
    courier::bus::MessageStatus to = courier::bus::MessageStatus::kPending;
    long long changed_at_ms = 0;
    std::string changed_by;
    std::string error_message;
};

enum class TransitionResult {
    kApplied,
    kUnknownMessage,
    kIllegalTransition
};

const char* ToString(TransitionResult result);

MessageRecord RecordFromEvent(const courier::bus::MessageEvent& event);

// Persisted message status plus one history row per applied transition.
// Throws StorageError when sqlite fails.
class StatusRepository {
public:
    // ":memory:" keeps everything in process.
    explicit StatusRepository(const std::string& database_path);
    ~StatusRepository();

    StatusRepository(const StatusRepository&) = delete;
    StatusRepository& operator=(const StatusRepository&) = delete;

    // False when a record with the same message id already exists.
    bool Insert(const MessageRecord& record);
    std::optional<MessageRecord> Get(const std::string& message_id);
    TransitionResult ApplyTransition(const courier::bus::StatusUpdate& update,
                                     MessageRecord* updated = nullptr);
    std::vector<StatusHistoryEntry> History(const std::string& message_id);
    std::size_t Count();

private:
    std::optional<MessageRecord> Load(const std::string& message_id) const;
    void EnsureSchema();
    void Exec(const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::string database_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace courier::storage
