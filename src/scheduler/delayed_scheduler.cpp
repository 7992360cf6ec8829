#include "scheduler/delayed_scheduler.hpp"

#include "utils/logging.hpp"

namespace courier::scheduler {

DelayedScheduler::DelayedScheduler() = default;

DelayedScheduler::~DelayedScheduler() {
    Stop();
}

void DelayedScheduler::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    io_.restart();
    work_.emplace(boost::asio::make_work_guard(io_));
    running_ = true;
    runner_ = std::thread([this]() {
        io_.run();
    });
}

void DelayedScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (auto& [id, pending] : pending_) {
            pending.timer->cancel();
        }
        pending_.clear();
        work_.reset();
    }
    io_.stop();
    if (runner_.joinable()) {
        runner_.join();
    }
}

std::optional<DelayedScheduler::TaskId> DelayedScheduler::Schedule(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return std::nullopt;
    }
    const auto id = next_id_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    pending_.emplace(id, Pending{timer, std::move(task)});
    timer->async_wait([this, id](const boost::system::error_code& error) {
        Fire(id, error);
    });
    return id;
}

bool DelayedScheduler::Cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    it->second.timer->cancel();
    pending_.erase(it);
    return true;
}

std::size_t DelayedScheduler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void DelayedScheduler::Fire(TaskId id, const boost::system::error_code& error) {
    if (error == boost::asio::error::operation_aborted) {
        return;
    }
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        task = std::move(it->second.task);
        pending_.erase(it);
    }
    try {
        task();
    } catch (const std::exception& ex) {
        courier::utils::LogError("scheduler", "delayed task failed", {
            {"task", std::to_string(id)},
            {"error", ex.what()}
        });
    }
}

}  // namespace courier::scheduler
