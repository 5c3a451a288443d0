/**
 * @file utilities.hpp
 * @brief Common utility functions for DIDAgent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout DIDAgent:
 * - Logging and error reporting
 * - Time formatting
 * - Base58 text encoding for verkeys and DIDs
 * - String and environment helpers
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace didagent {
namespace utilities {

/**
 * @brief Log levels for DIDAgent logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);

/**
 * @brief Shorten text for inclusion in a log line
 * @param text Text to shorten (e.g. raw wire message)
 * @param max_length Maximum number of characters kept
 * @return Text, truncated with "..." when longer than max_length
 */
std::string excerpt(const std::string& text, size_t max_length = 160);

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp Unix timestamp (seconds since epoch)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Get current Unix time in seconds
 */
uint64_t current_unix_time();

// ============================================================================
// Text encodings
// ============================================================================

/**
 * @brief Encode bytes as base58 (Bitcoin alphabet), the verkey/DID text form
 */
std::string base58_encode(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode base58 text
 * @return Decoded bytes, or std::nullopt on a character outside the alphabet
 */
std::optional<std::vector<uint8_t>> base58_decode(const std::string& text);

// ============================================================================
// Strings and environment
// ============================================================================

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string ends with suffix
 */
bool ends_with(const std::string& str, const std::string& suffix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Get hostname of current machine
 * @return Hostname or "localhost" if unable to determine
 */
std::string get_hostname();

/**
 * @brief Generate UUID v4 string
 * @return UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid();

} // namespace utilities
} // namespace didagent
