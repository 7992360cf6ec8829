#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace courier::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& value);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
    // Receives every emitted message in addition to stderr when set.
    std::function<void(const LogMessage&)> sink;
};

void ConfigureLogging(LogConfig config);
void Log(LogLevel level,
         const std::string& component,
         const std::string& message,
         const LogFields& fields = {});

inline void LogDebug(const std::string& component, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kDebug, component, message, fields);
}

inline void LogInfo(const std::string& component, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kInfo, component, message, fields);
}

inline void LogWarn(const std::string& component, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kWarn, component, message, fields);
}

inline void LogError(const std::string& component, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kError, component, message, fields);
}

}  // namespace courier::utils
