#include "bus/consumer_group.hpp"

#include <exception>

#include "utils/logging.hpp"

namespace courier::bus {

ConsumerGroup::ConsumerGroup(std::string name,
                             EventLog& log,
                             Handler handler,
                             std::chrono::milliseconds redelivery_backoff,
                             std::chrono::milliseconds poll_timeout)
    : name_(std::move(name))
    , log_(log)
    , handler_(std::move(handler))
    , redelivery_backoff_(redelivery_backoff)
    , poll_timeout_(poll_timeout) {}

ConsumerGroup::~ConsumerGroup() {
    Stop();
}

void ConsumerGroup::Start() {
    if (running_.exchange(true)) {
        return;
    }
    const int partitions = log_.PartitionCount();
    workers_.reserve(static_cast<std::size_t>(partitions));
    active_workers_ = partitions;
    for (int partition = 0; partition < partitions; ++partition) {
        workers_.emplace_back([this, partition] { RunPartition(partition); });
    }
    courier::utils::LogInfo(name_, "consumer group started", {
        {"log", log_.Name()},
        {"partitions", std::to_string(partitions)}
    });
}

void ConsumerGroup::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    courier::utils::LogInfo(name_, "consumer group stopped", {{"log", log_.Name()}});
}

std::size_t ConsumerGroup::RunUntilIdle() {
    std::size_t committed = 0;
    for (int partition = 0; partition < log_.PartitionCount(); ++partition) {
        while (true) {
            auto record = log_.Poll(partition, std::chrono::milliseconds(0));
            if (!record) {
                break;
            }
            if (!HandleOne(*record)) {
                log_.Rewind(partition);
                break;
            }
            log_.Commit(partition, record->offset + 1);
            committed += 1;
        }
    }
    return committed;
}

void ConsumerGroup::RunPartition(int partition) {
    while (running_) {
        auto record = log_.Poll(partition, poll_timeout_);
        if (!record) {
            if (log_.IsClosed()) {
                courier::utils::LogInfo(name_, "log closed, partition worker exiting", {
                    {"log", log_.Name()},
                    {"partition", std::to_string(partition)}
                });
                break;
            }
            continue;
        }
        if (HandleOne(*record)) {
            log_.Commit(partition, record->offset + 1);
            continue;
        }
        log_.Rewind(partition);
        std::this_thread::sleep_for(redelivery_backoff_);
    }
    active_workers_--;
}

bool ConsumerGroup::HandleOne(const LogRecord& record) {
    try {
        return handler_(record);
    } catch (const std::exception& ex) {
        courier::utils::LogError(name_, "record handling failed, leaving offset uncommitted", {
            {"partition", std::to_string(record.partition)},
            {"offset", std::to_string(record.offset)},
            {"key", record.key},
            {"error", ex.what()}
        });
        return false;
    }
}

}  // namespace courier::bus
