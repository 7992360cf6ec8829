#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace courier::utils {

inline long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

inline std::string FormatIso(long long epoch_ms) {
    const std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
        << std::setw(3) << std::setfill('0') << (epoch_ms % 1000) << "Z";
    return oss.str();
}

// 8-4-4-4-12 hexadecimal digits.
inline bool IsUuid(const std::string& value) {
    if (value.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
        if (dash_slot) {
            if (value[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string GenerateUuid() {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            id.push_back('-');
        } else if (i == 14) {
            id.push_back('4');
        } else {
            id.push_back(kChars[dist(gen)]);
        }
    }
    return id;
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

inline std::filesystem::path ExpandHome(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

}  // namespace courier::utils
