/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for DIDAgent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "didagent/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <sodium.h>

#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <unistd.h>

namespace didagent {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        g_logger = std::make_shared<spdlog::logger>("didagent", sinks.begin(), sinks.end());
        g_logger->set_level(to_spdlog_level(level));
        g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        spdlog::set_default_logger(g_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(name);
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        logger = g_logger;
    }
    if (!logger) {
        initialize_logging();
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        logger = g_logger;
    }
    if (!logger) {
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    logger->debug(message); break;
        case LogLevel::INFO:     logger->info(message); break;
        case LogLevel::WARN:     logger->warn(message); break;
        case LogLevel::ERROR:    logger->error(message); break;
        case LogLevel::CRITICAL: logger->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

std::string excerpt(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length) + "...";
}

// ============================================================================
// TIME FUNCTIONS
// ============================================================================

std::string format_timestamp(uint64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

uint64_t current_unix_time() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

// ============================================================================
// BASE58
// ============================================================================

std::string base58_encode(const std::vector<uint8_t>& bytes) {
    // Leading zero bytes map to leading '1' characters
    size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::optional<std::vector<uint8_t>> base58_decode(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < text.size(); ++i) {
        const char* pos = std::strchr(BASE58_ALPHABET, text[i]);
        if (pos == nullptr || text[i] == '\0') {
            return std::nullopt;
        }

        int carry = static_cast<int>(pos - BASE58_ALPHABET);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result(zeros, 0);
    result.insert(result.end(), it, bytes.end());
    return result;
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

// ============================================================================
// ENVIRONMENT FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_hostname() {
    char hostname[256];

    if (gethostname(hostname, sizeof(hostname)) != 0) {
        return "localhost";
    }
    hostname[sizeof(hostname) - 1] = '\0';

    return std::string(hostname);
}

std::string generate_uuid() {
    uint32_t data[4];
    randombytes_buf(data, sizeof(data));

    // Set version (4) and variant bits according to RFC 4122
    data[1] = (data[1] & 0xFFFF0FFF) | 0x00004000; // Version 4
    data[2] = (data[2] & 0x3FFFFFFF) | 0x80000000; // Variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    oss << std::setw(8) << data[0] << "-";
    oss << std::setw(4) << (data[1] >> 16) << "-";
    oss << std::setw(4) << (data[1] & 0xFFFF) << "-";
    oss << std::setw(4) << (data[2] >> 16) << "-";
    oss << std::setw(4) << (data[2] & 0xFFFF);
    oss << std::setw(8) << data[3];

    return oss.str();
}

} // namespace utilities
} // namespace didagent
