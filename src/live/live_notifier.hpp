#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace courier::live {

// One connected client. Buffers without bound until the client reads.
class LiveSession {
public:
    LiveSession(std::string session_id, std::string user_id);

    const std::string& Id() const { return session_id_; }
    const std::string& UserId() const { return user_id_; }

    void Push(const std::string& payload);
    // nullopt on timeout or once the session is closed and drained.
    std::optional<std::string> Next(std::chrono::milliseconds timeout);
    bool TryNext(std::string& payload);
    void Close();
    bool IsClosed() const;
    std::size_t Buffered() const;

private:
    std::string session_id_;
    std::string user_id_;
    std::queue<std::string> pending_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// Per-user stream shared by all of the user's sessions. Registration,
// teardown and delivery are serialized on one lock.
class LiveNotifier {
public:
    std::shared_ptr<LiveSession> Register(const std::string& user_id);
    void Deregister(const std::shared_ptr<LiveSession>& session);
    // Returns the number of sessions reached; zero when the user has no stream.
    std::size_t DeliverToUser(const std::string& user_id, const std::string& payload);

    bool IsUserConnected(const std::string& user_id) const;
    std::size_t ActiveUsers() const;
    std::size_t ActiveSessions() const;
    void CloseAll();

private:
    struct UserStream {
        std::vector<std::shared_ptr<LiveSession>> sessions;
    };

    std::unordered_map<std::string, UserStream> streams_;
    std::size_t next_session_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace courier::live
