#include "storage/status_repository.hpp"

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::storage {
namespace {

std::string SerializeRecipients(const std::vector<std::string>& recipients) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& recipient : recipients) {
        json.push_back(recipient);
    }
    return json.dump();
}

std::vector<std::string> ParseRecipients(const std::string& text) {
    std::vector<std::string> recipients;
    if (text.empty()) {
        return recipients;
    }
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (!json.is_array()) {
        return recipients;
    }
    for (const auto& entry : json) {
        if (entry.is_string()) {
            recipients.push_back(entry.get<std::string>());
        }
    }
    return recipients;
}

sqlite3_stmt* Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        const std::string error = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw courier::StorageError("sqlite prepare failed: " + error);
    }
    return stmt;
}

void StepDone(sqlite3* db, sqlite3_stmt* stmt) {
    const auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        const std::string error = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw courier::StorageError("sqlite step failed: " + error);
    }
}

courier::bus::MessageStatus StatusColumn(const unsigned char* text) {
    if (!text) {
        return courier::bus::MessageStatus::kPending;
    }
    auto parsed = courier::bus::ParseMessageStatus(reinterpret_cast<const char*>(text));
    return parsed.value_or(courier::bus::MessageStatus::kPending);
}

}  // namespace

const char* ToString(TransitionResult result) {
    switch (result) {
        case TransitionResult::kApplied: return "applied";
        case TransitionResult::kUnknownMessage: return "unknown_message";
        case TransitionResult::kIllegalTransition: return "illegal_transition";
    }
    return "unknown";
}

MessageRecord RecordFromEvent(const courier::bus::MessageEvent& event) {
    MessageRecord record{};
    record.message_id = event.message_id;
    record.conversation_id = event.conversation_id;
    record.sender_id = event.sender_id;
    record.recipient_ids = event.recipient_ids;
    record.channel = event.channel;
    record.status = event.status;
    record.created_at_ms = event.timestamp_ms;
    record.updated_at_ms = event.timestamp_ms;
    record.updated_by = "system";
    return record;
}

StatusRepository::StatusRepository(const std::string& database_path)
    : database_path_(database_path) {
    if (database_path_ != ":memory:") {
        const auto path = courier::utils::ExpandHome(database_path_);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        database_path_ = path.string();
    }
    EnsureSchema();
}

StatusRepository::~StatusRepository() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool StatusRepository::Insert(const MessageRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql =
        "INSERT OR IGNORE INTO messages(message_id, conversation_id, sender_id, recipient_ids, channel, "
        "status, created_at, updated_at, updated_by, error_message) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    auto* stmt = Prepare(db_, sql);
    const auto recipients = SerializeRecipients(record.recipient_ids);
    sqlite3_bind_text(stmt, 1, record.message_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.conversation_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.sender_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, recipients.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, courier::bus::ToString(record.channel), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, courier::bus::ToString(record.status), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, record.created_at_ms);
    sqlite3_bind_int64(stmt, 8, record.updated_at_ms);
    sqlite3_bind_text(stmt, 9, record.updated_by.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, record.error_message.c_str(), -1, SQLITE_TRANSIENT);
    StepDone(db_, stmt);
    sqlite3_finalize(stmt);
    return sqlite3_changes(db_) > 0;
}

std::optional<MessageRecord> StatusRepository::Get(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Load(message_id);
}

TransitionResult StatusRepository::ApplyTransition(const courier::bus::StatusUpdate& update,
                                                   MessageRecord* updated) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = Load(update.message_id);
    if (!current.has_value()) {
        return TransitionResult::kUnknownMessage;
    }
    if (!courier::bus::CanTransition(current->status, update.status)) {
        return TransitionResult::kIllegalTransition;
    }

    const auto previous = current->status;
    const auto changed_at = update.timestamp_ms > 0 ? update.timestamp_ms : courier::utils::NowMs();
    const auto changed_by = update.source.empty() ? std::string("system") : update.source;

    Exec("BEGIN TRANSACTION;");
    try {
        auto* stmt = Prepare(db_,
            "UPDATE messages SET status = ?, updated_at = ?, updated_by = ?, error_message = ? "
            "WHERE message_id = ?;");
        sqlite3_bind_text(stmt, 1, courier::bus::ToString(update.status), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, changed_at);
        sqlite3_bind_text(stmt, 3, changed_by.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, update.error_message.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, update.message_id.c_str(), -1, SQLITE_TRANSIENT);
        StepDone(db_, stmt);
        sqlite3_finalize(stmt);

        stmt = Prepare(db_,
            "INSERT INTO status_history(message_id, from_status, to_status, changed_at, changed_by, error_message) "
            "VALUES(?, ?, ?, ?, ?, ?);");
        sqlite3_bind_text(stmt, 1, update.message_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, courier::bus::ToString(previous), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, courier::bus::ToString(update.status), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, changed_at);
        sqlite3_bind_text(stmt, 5, changed_by.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, update.error_message.c_str(), -1, SQLITE_TRANSIENT);
        StepDone(db_, stmt);
        sqlite3_finalize(stmt);
        Exec("COMMIT;");
    } catch (const courier::StorageError&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    current->status = update.status;
    current->updated_at_ms = changed_at;
    current->updated_by = changed_by;
    current->error_message = update.error_message;
    if (updated) {
        *updated = *current;
    }
    return TransitionResult::kApplied;
}

std::vector<StatusHistoryEntry> StatusRepository::History(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StatusHistoryEntry> history;
    auto* stmt = Prepare(db_,
        "SELECT from_status, to_status, changed_at, changed_by, error_message "
        "FROM status_history WHERE message_id = ? ORDER BY id ASC;");
    sqlite3_bind_text(stmt, 1, message_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StatusHistoryEntry entry{};
        entry.from = StatusColumn(sqlite3_column_text(stmt, 0));
        entry.to = StatusColumn(sqlite3_column_text(stmt, 1));
        entry.changed_at_ms = sqlite3_column_int64(stmt, 2);
        entry.changed_by = SafeText(sqlite3_column_text(stmt, 3));
        entry.error_message = SafeText(sqlite3_column_text(stmt, 4));
        history.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);
    return history;
}

std::size_t StatusRepository::Count() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* stmt = Prepare(db_, "SELECT COUNT(*) FROM messages;");
    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

std::optional<MessageRecord> StatusRepository::Load(const std::string& message_id) const {
    auto* stmt = Prepare(db_,
        "SELECT conversation_id, sender_id, recipient_ids, channel, status, created_at, updated_at, "
        "updated_by, error_message FROM messages WHERE message_id = ?;");
    sqlite3_bind_text(stmt, 1, message_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    MessageRecord record{};
    record.message_id = message_id;
    record.conversation_id = SafeText(sqlite3_column_text(stmt, 0));
    record.sender_id = SafeText(sqlite3_column_text(stmt, 1));
    record.recipient_ids = ParseRecipients(SafeText(sqlite3_column_text(stmt, 2)));
    record.channel = courier::bus::ParseChannel(SafeText(sqlite3_column_text(stmt, 3)))
        .value_or(courier::bus::Channel::kInternal);
    record.status = StatusColumn(sqlite3_column_text(stmt, 4));
    record.created_at_ms = sqlite3_column_int64(stmt, 5);
    record.updated_at_ms = sqlite3_column_int64(stmt, 6);
    record.updated_by = SafeText(sqlite3_column_text(stmt, 7));
    record.error_message = SafeText(sqlite3_column_text(stmt, 8));
    sqlite3_finalize(stmt);
    return record;
}

void StatusRepository::EnsureSchema() {
    if (sqlite3_open(database_path_.c_str(), &db_) != SQLITE_OK) {
        const std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw courier::StorageError("failed to open sqlite db " + database_path_ + ": " + error);
    }
    if (database_path_ != ":memory:") {
        Exec("PRAGMA journal_mode=WAL;");
    }
    Exec("CREATE TABLE IF NOT EXISTS messages ("
         "message_id TEXT PRIMARY KEY,"
         "conversation_id TEXT,"
         "sender_id TEXT,"
         "recipient_ids TEXT,"
         "channel TEXT,"
         "status TEXT,"
         "created_at INTEGER,"
         "updated_at INTEGER,"
         "updated_by TEXT,"
         "error_message TEXT"
         ");");
    Exec("CREATE TABLE IF NOT EXISTS status_history ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "message_id TEXT,"
         "from_status TEXT,"
         "to_status TEXT,"
         "changed_at INTEGER,"
         "changed_by TEXT,"
         "error_message TEXT"
         ");");
    Exec("CREATE INDEX IF NOT EXISTS idx_history_message ON status_history(message_id);");
}

void StatusRepository::Exec(const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        if (err) {
            sqlite3_free(err);
        }
        courier::utils::LogError("storage", "sqlite exec error", {{"error", message}});
        throw courier::StorageError("sqlite exec failed: " + message);
    }
}

std::string StatusRepository::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace courier::storage
