#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "store/kv_store.hpp"

namespace courier::store {

class MemoryKeyValueStore : public KeyValueStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::size_t kDefaultSweepThreshold = 4096;

    // Expired entries are reclaimed on lookup and by a sweep that runs once a
    // write finds the map at or above the sweep threshold. The threshold then
    // moves to twice the surviving size so sweeps stay amortized.
    explicit MemoryKeyValueStore(Clock clock = {}, std::size_t sweep_threshold = kDefaultSweepThreshold);

    bool Exists(const std::string& key) override;
    void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool SetIfAbsent(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    long long Increment(const std::string& key) override;
    bool Expire(const std::string& key, std::chrono::seconds ttl) override;
    std::optional<std::chrono::milliseconds> TimeToLive(const std::string& key) override;
    bool Remove(const std::string& key) override;

    std::size_t PurgeExpired();
    // Stored entries, including expired ones not reclaimed yet.
    std::size_t Size();

private:
    struct Entry {
        std::string value;
        std::optional<std::chrono::steady_clock::time_point> expires_at;
    };

    std::chrono::steady_clock::time_point Now() const;
    Entry* FindLive(const std::string& key);
    std::size_t PurgeExpiredLocked();
    void MaybeSweepLocked();

    Clock clock_;
    std::size_t sweep_threshold_;
    std::size_t next_sweep_at_;
    std::unordered_map<std::string, Entry> entries_;
    std::mutex mutex_;
};

}  // namespace courier::store
