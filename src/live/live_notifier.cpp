#include "live/live_notifier.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace courier::live {

LiveSession::LiveSession(std::string session_id, std::string user_id)
    : session_id_(std::move(session_id))
    , user_id_(std::move(user_id)) {}

void LiveSession::Push(const std::string& payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        pending_.push(payload);
    }
    cv_.notify_one();
}

std::optional<std::string> LiveSession::Next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !pending_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    auto payload = std::move(pending_.front());
    pending_.pop();
    return payload;
}

bool LiveSession::TryNext(std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return false;
    }
    payload = std::move(pending_.front());
    pending_.pop();
    return true;
}

void LiveSession::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool LiveSession::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t LiveSession::Buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::shared_ptr<LiveSession> LiveNotifier::Register(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session = std::make_shared<LiveSession>("session-" + std::to_string(next_session_++), user_id);
    auto& stream = streams_[user_id];
    stream.sessions.push_back(session);
    courier::utils::LogInfo("live", "session registered", {
        {"userId", user_id},
        {"sessionId", session->Id()},
        {"sessions", std::to_string(stream.sessions.size())}
    });
    return session;
}

void LiveNotifier::Deregister(const std::shared_ptr<LiveSession>& session) {
    if (!session) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    session->Close();
    auto it = streams_.find(session->UserId());
    if (it == streams_.end()) {
        return;
    }
    auto& sessions = it->second.sessions;
    sessions.erase(std::remove(sessions.begin(), sessions.end(), session), sessions.end());
    if (sessions.empty()) {
        streams_.erase(it);
        courier::utils::LogInfo("live", "stream closed", {{"userId", session->UserId()}});
    }
}

std::size_t LiveNotifier::DeliverToUser(const std::string& user_id, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(user_id);
    if (it == streams_.end()) {
        return 0;
    }
    for (const auto& session : it->second.sessions) {
        session->Push(payload);
    }
    return it->second.sessions.size();
}

bool LiveNotifier::IsUserConnected(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.count(user_id) > 0;
}

std::size_t LiveNotifier::ActiveUsers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.size();
}

std::size_t LiveNotifier::ActiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [_, stream] : streams_) {
        total += stream.sessions.size();
    }
    return total;
}

void LiveNotifier::CloseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, stream] : streams_) {
        for (auto& session : stream.sessions) {
            session->Close();
        }
    }
    streams_.clear();
}

}  // namespace courier::live
