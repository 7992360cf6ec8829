#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "bus/event_log.hpp"

namespace courier::bus {

// Drives an EventLog with one thread per partition so a slow partition never
// stalls the others. The handler returns true to commit the record; returning
// false or throwing leaves the offset uncommitted and rewinds the partition so
// the record is redelivered after redelivery_backoff.
class ConsumerGroup {
public:
    using Handler = std::function<bool(const LogRecord&)>;

    ConsumerGroup(std::string name,
                  EventLog& log,
                  Handler handler,
                  std::chrono::milliseconds redelivery_backoff = std::chrono::milliseconds(500),
                  std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(1000));
    ~ConsumerGroup();

    void Start();
    void Stop();

    // Synchronously consumes every partition until it is empty or a record
    // fails. Returns the number of committed records.
    std::size_t RunUntilIdle();

    const std::string& Name() const { return name_; }
    // Partition threads still consuming. Threads exit on Stop() or once the
    // log is closed.
    int ActiveWorkers() const { return active_workers_; }

private:
    void RunPartition(int partition);
    bool HandleOne(const LogRecord& record);

    std::string name_;
    EventLog& log_;
    Handler handler_;
    std::chrono::milliseconds redelivery_backoff_;
    std::chrono::milliseconds poll_timeout_;
    std::atomic<bool> running_{false};
    std::atomic<int> active_workers_{0};
    std::vector<std::thread> workers_;
};

}  // namespace courier::bus
