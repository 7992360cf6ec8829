#include "pipeline/dedup_store.hpp"

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {

DedupStore::DedupStore(courier::store::KeyValueStore& store, const courier::config::DedupConfig& config)
    : store_(store)
    , key_prefix_(config.key_prefix)
    , ttl_(config.ttl_s) {}

bool DedupStore::IsDuplicate(const std::string& message_id) {
    try {
        return store_.Exists(KeyFor(message_id));
    } catch (const courier::StoreUnavailableError& ex) {
        courier::utils::LogWarn("dedup", "store unavailable, treating message as new", {
            {"messageId", message_id},
            {"error", ex.what()}
        });
        return false;
    }
}

void DedupStore::MarkProcessed(const std::string& message_id) {
    try {
        if (!store_.SetIfAbsent(KeyFor(message_id), "1", ttl_)) {
            courier::utils::LogDebug("dedup", "message already marked", {{"messageId", message_id}});
        }
    } catch (const courier::StoreUnavailableError& ex) {
        courier::utils::LogError("dedup", "failed to mark message processed", {
            {"messageId", message_id},
            {"error", ex.what()}
        });
    }
}

bool DedupStore::Forget(const std::string& message_id) {
    try {
        return store_.Remove(KeyFor(message_id));
    } catch (const courier::StoreUnavailableError& ex) {
        courier::utils::LogError("dedup", "failed to forget message", {
            {"messageId", message_id},
            {"error", ex.what()}
        });
        return false;
    }
}

std::string DedupStore::KeyFor(const std::string& message_id) const {
    return key_prefix_ + message_id;
}

}  // namespace courier::pipeline
