#include "bus/event_log.hpp"

#include <algorithm>
#include <functional>

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace courier::bus {

InMemoryEventLog::InMemoryEventLog(std::string name, int partitions)
    : name_(std::move(name))
    , partitions_(static_cast<std::size_t>(std::max(1, partitions))) {}

int InMemoryEventLog::PartitionFor(const std::string& key) const {
    const auto hash = std::hash<std::string>{}(key);
    return static_cast<int>(hash % partitions_.size());
}

LogRecord InMemoryEventLog::Append(const std::string& key, const std::string& payload) {
    LogRecord record{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw courier::EventLogError("log '" + name_ + "' is closed");
        }
        record.key = key;
        record.payload = payload;
        record.partition = PartitionFor(key);
        auto& partition = At(record.partition);
        record.offset = static_cast<long long>(partition.records.size());
        record.sequence = next_sequence_++;
        record.appended_at_ms = courier::utils::NowMs();
        partition.records.push_back(record);
    }
    cv_.notify_all();
    return record;
}

std::optional<LogRecord> InMemoryEventLog::Poll(int partition, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& state = At(partition);
    const auto ready = [&state, this] {
        return closed_ || state.position < static_cast<long long>(state.records.size());
    };
    if (!cv_.wait_for(lock, timeout, ready) || closed_) {
        return std::nullopt;
    }
    auto record = state.records[static_cast<std::size_t>(state.position)];
    state.position += 1;
    return record;
}

void InMemoryEventLog::Commit(int partition, long long next_offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = At(partition);
    const auto end = static_cast<long long>(state.records.size());
    state.committed = std::clamp(std::max(state.committed, next_offset), 0LL, end);
}

void InMemoryEventLog::Rewind(int partition) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = At(partition);
    state.position = state.committed;
}

long long InMemoryEventLog::CommittedOffset(int partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return At(partition).committed;
}

long long InMemoryEventLog::EndOffset(int partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<long long>(At(partition).records.size());
}

std::vector<LogRecord> InMemoryEventLog::Snapshot() const {
    std::vector<LogRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& partition : partitions_) {
            records.insert(records.end(), partition.records.begin(), partition.records.end());
        }
    }
    std::sort(records.begin(), records.end(), [](const LogRecord& a, const LogRecord& b) {
        return a.sequence < b.sequence;
    });
    return records;
}

void InMemoryEventLog::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool InMemoryEventLog::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t InMemoryEventLog::Lag(int partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& state = At(partition);
    return state.records.size() - static_cast<std::size_t>(state.committed);
}

InMemoryEventLog::Partition& InMemoryEventLog::At(int partition) {
    if (partition < 0 || partition >= static_cast<int>(partitions_.size())) {
        throw courier::EventLogError("log '" + name_ + "' has no partition " + std::to_string(partition));
    }
    return partitions_[static_cast<std::size_t>(partition)];
}

const InMemoryEventLog::Partition& InMemoryEventLog::At(int partition) const {
    if (partition < 0 || partition >= static_cast<int>(partitions_.size())) {
        throw courier::EventLogError("log '" + name_ + "' has no partition " + std::to_string(partition));
    }
    return partitions_[static_cast<std::size_t>(partition)];
}

}  // namespace courier::bus
