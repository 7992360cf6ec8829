#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace courier::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyConnectorConfig(ConnectorConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadBool(source, "enabled", target.enabled);
    ReadString(source, "mode", target.mode);
    ReadString(source, "baseUrl", target.base_url);
    ReadInt(source, "timeoutS", target.timeout_s);
    ReadInt(source, "receiptDelayMs", target.receipt_delay_ms);
    ReadString(source, "receiptStatus", target.receipt_status);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("pipeline") && data["pipeline"].is_object()) {
        const auto& pipeline = data["pipeline"];
        ReadInt(pipeline, "eventPartitions", config.pipeline.event_partitions);
        ReadInt(pipeline, "statusPartitions", config.pipeline.status_partitions);
        ReadInt(pipeline, "fanoutParallelism", config.pipeline.fanout_parallelism);
        ReadInt(pipeline, "redeliveryBackoffMs", config.pipeline.redelivery_backoff_ms);
    }

    if (data.contains("dedup") && data["dedup"].is_object()) {
        const auto& dedup = data["dedup"];
        ReadInt(dedup, "ttlS", config.dedup.ttl_s);
        ReadString(dedup, "keyPrefix", config.dedup.key_prefix);
    }

    if (data.contains("retry") && data["retry"].is_object()) {
        const auto& retry = data["retry"];
        ReadInt(retry, "maxAttempts", config.retry.max_attempts);
        ReadInt(retry, "initialDelayMs", config.retry.initial_delay_ms);
        ReadDouble(retry, "multiplier", config.retry.multiplier);
        ReadInt(retry, "maxDelayMs", config.retry.max_delay_ms);
    }

    if (data.contains("resolver") && data["resolver"].is_object()) {
        const auto& resolver = data["resolver"];
        ReadString(resolver, "baseUrl", config.resolver.base_url);
        ReadInt(resolver, "timeoutS", config.resolver.timeout_s);
        ReadInt(resolver, "maxAttempts", config.resolver.max_attempts);
        ReadInt(resolver, "backoffMs", config.resolver.backoff_ms);
    }

    if (data.contains("channels") && data["channels"].is_object()) {
        const auto& channels = data["channels"];
        if (channels.contains("whatsapp")) {
            ApplyConnectorConfig(config.channels.whatsapp, channels["whatsapp"]);
        }
        if (channels.contains("telegram")) {
            ApplyConnectorConfig(config.channels.telegram, channels["telegram"]);
        }
        if (channels.contains("instagram")) {
            ApplyConnectorConfig(config.channels.instagram, channels["instagram"]);
        }
    }

    if (data.contains("deadLetter") && data["deadLetter"].is_object()) {
        const auto& dead_letter = data["deadLetter"];
        ReadInt(dead_letter, "partitions", config.dead_letter.partitions);
        ReadString(dead_letter, "fallbackPath", config.dead_letter.fallback_path);
    }

    if (data.contains("storage") && data["storage"].is_object()) {
        ReadString(data["storage"], "databasePath", config.storage.database_path);
    }

    if (data.contains("rateLimit") && data["rateLimit"].is_object()) {
        const auto& rate_limit = data["rateLimit"];
        ReadBool(rate_limit, "enabled", config.rate_limit.enabled);
        ReadInt(rate_limit, "userLimit", config.rate_limit.user_limit);
        ReadInt(rate_limit, "globalLimit", config.rate_limit.global_limit);
        ReadInt(rate_limit, "burstCapacity", config.rate_limit.burst_capacity);
        ReadInt(rate_limit, "windowS", config.rate_limit.window_s);
        ReadString(rate_limit, "keyPrefix", config.rate_limit.key_prefix);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ReadString(gateway, "host", config.gateway.host);
        ReadInt(gateway, "port", config.gateway.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = courier::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyConnectorEnv(ConnectorConfig& target, const std::string& name) {
    const auto upper = courier::utils::ToUpper(name);
    const auto enabled = GetEnvFallback(
        ("COURIER_CHANNELS__" + upper + "__ENABLED").c_str(),
        ("COURIER_" + upper + "_ENABLED").c_str());
    if (!enabled.empty()) {
        target.enabled = ParseBool(enabled);
    }
    const auto mode = GetEnvFallback(
        ("COURIER_CHANNELS__" + upper + "__MODE").c_str(),
        ("COURIER_" + upper + "_MODE").c_str());
    if (!mode.empty()) {
        target.mode = mode;
    }
    const auto base_url = GetEnvFallback(
        ("COURIER_CHANNELS__" + upper + "__BASE_URL").c_str(),
        ("COURIER_" + upper + "_URL").c_str());
    if (!base_url.empty()) {
        target.base_url = base_url;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto event_partitions = GetEnvFallback(
        "COURIER_PIPELINE__EVENT_PARTITIONS",
        "COURIER_EVENT_PARTITIONS");
    if (!event_partitions.empty()) {
        config.pipeline.event_partitions = ParseInt(event_partitions, config.pipeline.event_partitions);
    }

    const auto status_partitions = GetEnvFallback(
        "COURIER_PIPELINE__STATUS_PARTITIONS",
        "COURIER_STATUS_PARTITIONS");
    if (!status_partitions.empty()) {
        config.pipeline.status_partitions = ParseInt(status_partitions, config.pipeline.status_partitions);
    }

    const auto fanout = GetEnvFallback(
        "COURIER_PIPELINE__FANOUT_PARALLELISM",
        "COURIER_FANOUT_PARALLELISM");
    if (!fanout.empty()) {
        config.pipeline.fanout_parallelism = ParseInt(fanout, config.pipeline.fanout_parallelism);
    }

    const auto dedup_ttl = GetEnvFallback("COURIER_DEDUP__TTL_S", "COURIER_DEDUP_TTL_S");
    if (!dedup_ttl.empty()) {
        config.dedup.ttl_s = ParseInt(dedup_ttl, config.dedup.ttl_s);
    }

    const auto max_attempts = GetEnvFallback("COURIER_RETRY__MAX_ATTEMPTS", "COURIER_RETRY_MAX_ATTEMPTS");
    if (!max_attempts.empty()) {
        config.retry.max_attempts = ParseInt(max_attempts, config.retry.max_attempts);
    }

    const auto initial_delay = GetEnvFallback(
        "COURIER_RETRY__INITIAL_DELAY_MS",
        "COURIER_RETRY_INITIAL_DELAY_MS");
    if (!initial_delay.empty()) {
        config.retry.initial_delay_ms = ParseInt(initial_delay, config.retry.initial_delay_ms);
    }

    const auto multiplier = GetEnvFallback("COURIER_RETRY__MULTIPLIER", "COURIER_RETRY_MULTIPLIER");
    if (!multiplier.empty()) {
        config.retry.multiplier = ParseDouble(multiplier, config.retry.multiplier);
    }

    const auto max_delay = GetEnvFallback("COURIER_RETRY__MAX_DELAY_MS", "COURIER_RETRY_MAX_DELAY_MS");
    if (!max_delay.empty()) {
        config.retry.max_delay_ms = ParseInt(max_delay, config.retry.max_delay_ms);
    }

    const auto resolver_url = GetEnvFallback("COURIER_RESOLVER__BASE_URL", "COURIER_USER_SERVICE_URL");
    if (!resolver_url.empty()) {
        config.resolver.base_url = resolver_url;
    }

    const auto resolver_timeout = GetEnvFallback("COURIER_RESOLVER__TIMEOUT_S", "COURIER_RESOLVER_TIMEOUT_S");
    if (!resolver_timeout.empty()) {
        config.resolver.timeout_s = ParseInt(resolver_timeout, config.resolver.timeout_s);
    }

    ApplyConnectorEnv(config.channels.whatsapp, "whatsapp");
    ApplyConnectorEnv(config.channels.telegram, "telegram");
    ApplyConnectorEnv(config.channels.instagram, "instagram");

    const auto fallback_path = GetEnvFallback(
        "COURIER_DEAD_LETTER__FALLBACK_PATH",
        "COURIER_DLQ_FALLBACK_PATH");
    if (!fallback_path.empty()) {
        config.dead_letter.fallback_path = fallback_path;
    }

    const auto database_path = GetEnvFallback("COURIER_STORAGE__DATABASE_PATH", "COURIER_DATABASE_PATH");
    if (!database_path.empty()) {
        config.storage.database_path = database_path;
    }

    const auto rate_limit_enabled = GetEnvFallback(
        "COURIER_RATE_LIMIT__ENABLED",
        "COURIER_RATE_LIMIT_ENABLED");
    if (!rate_limit_enabled.empty()) {
        config.rate_limit.enabled = ParseBool(rate_limit_enabled);
    }

    const auto user_limit = GetEnvFallback("COURIER_RATE_LIMIT__USER_LIMIT", "COURIER_RATE_LIMIT_USER");
    if (!user_limit.empty()) {
        config.rate_limit.user_limit = ParseInt(user_limit, config.rate_limit.user_limit);
    }

    const auto global_limit = GetEnvFallback("COURIER_RATE_LIMIT__GLOBAL_LIMIT", "COURIER_RATE_LIMIT_GLOBAL");
    if (!global_limit.empty()) {
        config.rate_limit.global_limit = ParseInt(global_limit, config.rate_limit.global_limit);
    }

    const auto gateway_host = GetEnvFallback("COURIER_GATEWAY__HOST", "COURIER_HOST");
    if (!gateway_host.empty()) {
        config.gateway.host = gateway_host;
    }

    const auto gateway_port = GetEnvFallback("COURIER_GATEWAY__PORT", "COURIER_PORT");
    if (!gateway_port.empty()) {
        config.gateway.port = ParseInt(gateway_port, config.gateway.port);
    }

    const auto log_level = GetEnvFallback("COURIER_LOGGING__LEVEL", "COURIER_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return courier::utils::GetHomePath() / ".courier" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            // Keep defaults on parse errors
            courier::utils::LogWarn("config", "ignoring unparsable config file", {
                {"path", config_path.string()}
            });
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

}  // namespace courier::config
