#include "store/memory_kv_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/errors.hpp"

namespace courier::store {

MemoryKeyValueStore::MemoryKeyValueStore(Clock clock, std::size_t sweep_threshold)
    : clock_(std::move(clock))
    , sweep_threshold_(std::max<std::size_t>(1, sweep_threshold))
    , next_sweep_at_(sweep_threshold_) {}

bool MemoryKeyValueStore::Exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindLive(key) != nullptr;
}

void MemoryKeyValueStore::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry{value, std::nullopt};
    if (ttl.count() > 0) {
        entry.expires_at = Now() + ttl;
    }
    MaybeSweepLocked();
    entries_[key] = std::move(entry);
}

bool MemoryKeyValueStore::SetIfAbsent(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (FindLive(key) != nullptr) {
        return false;
    }
    Entry entry{value, std::nullopt};
    if (ttl.count() > 0) {
        entry.expires_at = Now() + ttl;
    }
    MaybeSweepLocked();
    entries_[key] = std::move(entry);
    return true;
}

long long MemoryKeyValueStore::Increment(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (entry == nullptr) {
        MaybeSweepLocked();
        entries_[key] = Entry{"1", std::nullopt};
        return 1;
    }
    long long value = 0;
    try {
        value = std::stoll(entry->value);
    } catch (const std::exception&) {
        throw courier::StoreUnavailableError("value at '" + key + "' is not an integer");
    }
    value += 1;
    entry->value = std::to_string(value);
    return value;
}

bool MemoryKeyValueStore::Expire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (entry == nullptr) {
        return false;
    }
    entry->expires_at = Now() + ttl;
    return true;
}

std::optional<std::chrono::milliseconds> MemoryKeyValueStore::TimeToLive(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (entry == nullptr || !entry->expires_at.has_value()) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*entry->expires_at - Now());
}

bool MemoryKeyValueStore::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

std::size_t MemoryKeyValueStore::PurgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return PurgeExpiredLocked();
}

std::size_t MemoryKeyValueStore::Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t MemoryKeyValueStore::PurgeExpiredLocked() {
    const auto now = Now();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at.has_value() && *it->second.expires_at <= now) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryKeyValueStore::MaybeSweepLocked() {
    if (entries_.size() < next_sweep_at_) {
        return;
    }
    PurgeExpiredLocked();
    next_sweep_at_ = std::max(sweep_threshold_, entries_.size() * 2);
}

std::chrono::steady_clock::time_point MemoryKeyValueStore::Now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

MemoryKeyValueStore::Entry* MemoryKeyValueStore::FindLive(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.expires_at.has_value() && *it->second.expires_at <= Now()) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

}  // namespace courier::store
