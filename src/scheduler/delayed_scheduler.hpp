#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace courier::scheduler {

// One-shot delayed tasks on a private io_context thread. Stop() cancels
// everything still pending; cancelled tasks never run.
class DelayedScheduler {
public:
    using Task = std::function<void()>;
    using TaskId = std::uint64_t;

    DelayedScheduler();
    ~DelayedScheduler();

    DelayedScheduler(const DelayedScheduler&) = delete;
    DelayedScheduler& operator=(const DelayedScheduler&) = delete;

    void Start();
    void Stop();

    // nullopt when the scheduler is stopped.
    std::optional<TaskId> Schedule(std::chrono::milliseconds delay, Task task);
    bool Cancel(TaskId id);
    std::size_t PendingCount() const;

private:
    void Fire(TaskId id, const boost::system::error_code& error);

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread runner_;
    bool running_ = false;
    TaskId next_id_ = 1;
    struct Pending {
        std::shared_ptr<boost::asio::steady_timer> timer;
        Task task;
    };
    std::unordered_map<TaskId, Pending> pending_;
    mutable std::mutex mutex_;
};

}  // namespace courier::scheduler
