#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace courier::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& ActiveConfig() {
    static LogConfig config;
    return config;
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void ConfigureLogging(LogConfig config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    ActiveConfig() = std::move(config);
}

void Log(LogLevel level,
         const std::string& component,
         const std::string& message,
         const LogFields& fields) {
    std::lock_guard<std::mutex> lock(LogMutex());
    const auto& config = ActiveConfig();
    if (static_cast<int>(level) < static_cast<int>(config.min_level)) {
        return;
    }

    std::ostringstream line;
    line << "[" << component << "] " << ToString(level) << " " << message;
    for (const auto& [key, value] : fields) {
        line << " " << key << "=" << value;
    }
    std::cerr << line.str() << std::endl;

    if (config.sink) {
        config.sink(LogMessage{level, component, message, fields});
    }
}

}  // namespace courier::utils
