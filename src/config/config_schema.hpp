#pragma once

#include <string>

namespace courier::config {

struct PipelineConfig {
    int event_partitions = 8;
    int status_partitions = 8;
    int fanout_parallelism = 4;
    int redelivery_backoff_ms = 500;
};

struct DedupConfig {
    int ttl_s = 7 * 24 * 3600;
    std::string key_prefix = "courier:processed:";
};

struct RetryConfig {
    int max_attempts = 3;
    int initial_delay_ms = 1000;
    double multiplier = 2.0;
    int max_delay_ms = 10000;
};

struct ResolverConfig {
    std::string base_url = "http://localhost:8083";
    int timeout_s = 10;
    int max_attempts = 2;
    int backoff_ms = 500;
};

struct ConnectorConfig {
    bool enabled = true;
    // "http" talks to a connector service, "simulated" acknowledges locally.
    std::string mode = "http";
    std::string base_url;
    int timeout_s = 10;
    int receipt_delay_ms = 2000;
    std::string receipt_status = "READ";
};

struct ChannelsConfig {
    ConnectorConfig whatsapp{true, "http", "http://localhost:8091"};
    ConnectorConfig telegram{true, "http", "http://localhost:8092"};
    ConnectorConfig instagram{true, "http", "http://localhost:8093"};
};

struct DeadLetterConfig {
    int partitions = 4;
    std::string fallback_path = "~/.courier/dead_letters.jsonl";
};

struct StorageConfig {
    std::string database_path = "~/.courier/courier.db";
};

struct RateLimitConfig {
    bool enabled = true;
    int user_limit = 100;
    int global_limit = 1000;
    int burst_capacity = 200;
    int window_s = 60;
    std::string key_prefix = "courier:ratelimit:";
};

struct GatewayConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    PipelineConfig pipeline;
    DedupConfig dedup;
    RetryConfig retry;
    ResolverConfig resolver;
    ChannelsConfig channels;
    DeadLetterConfig dead_letter;
    StorageConfig storage;
    RateLimitConfig rate_limit;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace courier::config
