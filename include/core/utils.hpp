#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace xrayot::utils {

// ============================================================================
// Random Identifiers
// ============================================================================

/**
 * @brief Lowercase hex string of `bytes` random bytes (2 chars per byte)
 */
inline std::string random_hex(size_t bytes) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::string result;
    result.reserve(bytes * 2);

    size_t remaining = bytes;
    while (remaining > 0) {
        const uint64_t val = dis(gen);
        const size_t chunk = std::min(remaining, size_t(8));
        for (size_t i = 0; i < chunk; ++i) {
            result += std::format("{:02x}", static_cast<uint8_t>(val >> (i * 8)));
        }
        remaining -= chunk;
    }

    return result;
}

// ============================================================================
// Time Utilities
// ============================================================================

/// Trace timestamps are seconds since the UNIX epoch with a fractional part
inline double epoch_seconds_now() {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<double>(us) / 1000.0 / 1000.0;
}

inline double micros_to_epoch_seconds(int64_t microseconds) {
    return static_cast<double>(microseconds) / 1000.0 / 1000.0;
}

inline int64_t epoch_micros_now() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief ISO-8601 UTC rendering with millisecond resolution
 *
 * e.g. 1551016321123456 -> "2019-02-24T13:52:01.123Z"; a zero fraction is
 * left out: 1551016321000000 -> "2019-02-24T13:52:01Z"
 */
inline std::string format_iso8601_utc(int64_t epoch_micros) {
    int64_t secs = epoch_micros / 1000000;
    int64_t ms = (epoch_micros % 1000000) / 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    const auto time = static_cast<std::time_t>(secs);
    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    if (ms == 0) {
        return std::format("{}Z", time_buf);
    }
    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms));
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Split on a delimiter; a trailing empty token is not produced
 *
 * "a.b" -> ["a", "b"], "a..b" -> ["a", "", "b"], "a." -> ["a"], "" -> []
 */
inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

/// Unknown names fall back to INFO
[[nodiscard]] inline Level level_from_string(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "debug") return Level::DEBUG;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return Level::INFO;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace xrayot::utils
