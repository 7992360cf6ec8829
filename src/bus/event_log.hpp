#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier::bus {

struct LogRecord {
    std::string key;
    std::string payload;
    int partition = 0;
    long long offset = 0;
    std::uint64_t sequence = 0;
    long long appended_at_ms = 0;
};

// Partitioned, ordered log with one consumer position per partition.
// Records sharing a key always land in the same partition. Consumers read
// forward from their position and must Commit() explicitly; Rewind() moves
// the position back to the last commit so uncommitted records are redelivered.
class EventLog {
public:
    virtual ~EventLog() = default;

    virtual const std::string& Name() const = 0;
    virtual int PartitionCount() const = 0;
    virtual int PartitionFor(const std::string& key) const = 0;

    // Throws EventLogError when the record cannot be stored.
    virtual LogRecord Append(const std::string& key, const std::string& payload) = 0;
    virtual std::optional<LogRecord> Poll(int partition, std::chrono::milliseconds timeout) = 0;
    virtual void Commit(int partition, long long next_offset) = 0;
    virtual void Rewind(int partition) = 0;

    virtual long long CommittedOffset(int partition) const = 0;
    virtual long long EndOffset(int partition) const = 0;
    // Every stored record in append order.
    virtual std::vector<LogRecord> Snapshot() const = 0;
    // A closed log rejects appends and Poll() returns nullopt immediately.
    virtual void Close() = 0;
    virtual bool IsClosed() const = 0;
};

class InMemoryEventLog : public EventLog {
public:
    InMemoryEventLog(std::string name, int partitions);

    const std::string& Name() const override { return name_; }
    int PartitionCount() const override { return static_cast<int>(partitions_.size()); }
    int PartitionFor(const std::string& key) const override;

    LogRecord Append(const std::string& key, const std::string& payload) override;
    std::optional<LogRecord> Poll(int partition, std::chrono::milliseconds timeout) override;
    void Commit(int partition, long long next_offset) override;
    void Rewind(int partition) override;

    long long CommittedOffset(int partition) const override;
    long long EndOffset(int partition) const override;
    std::vector<LogRecord> Snapshot() const override;
    void Close() override;
    bool IsClosed() const override;

    std::size_t Lag(int partition) const;

private:
    struct Partition {
        std::vector<LogRecord> records;
        long long position = 0;
        long long committed = 0;
    };

    Partition& At(int partition);
    const Partition& At(int partition) const;

    std::string name_;
    std::vector<Partition> partitions_;
    std::uint64_t next_sequence_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace courier::bus
