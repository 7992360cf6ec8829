#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace courier::store {

// Shared low-latency key-value store with per-key expiry. Every operation is
// atomic on its key; implementations throw StoreUnavailableError when the
// backing store cannot be reached.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual bool Exists(const std::string& key) = 0;
    virtual void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual bool SetIfAbsent(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual long long Increment(const std::string& key) = 0;
    virtual bool Expire(const std::string& key, std::chrono::seconds ttl) = 0;
    // nullopt when the key is missing or has no expiry.
    virtual std::optional<std::chrono::milliseconds> TimeToLive(const std::string& key) = 0;
    virtual bool Remove(const std::string& key) = 0;
};

}  // namespace courier::store
