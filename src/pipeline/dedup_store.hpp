#pragma once

#include <chrono>
#include <string>

#include "config/config_schema.hpp"
#include "store/kv_store.hpp"

namespace courier::pipeline {

// Remembers which message ids this consumer group already processed.
// Store outages fail open: the message is treated as new.
class DedupStore {
public:
    DedupStore(courier::store::KeyValueStore& store, const courier::config::DedupConfig& config);

    bool IsDuplicate(const std::string& message_id);
    void MarkProcessed(const std::string& message_id);
    // Drops the marker so the message can be processed again.
    bool Forget(const std::string& message_id);

    std::string KeyFor(const std::string& message_id) const;

private:
    courier::store::KeyValueStore& store_;
    std::string key_prefix_;
    std::chrono::seconds ttl_;
};

}  // namespace courier::pipeline
