/**
 * @file security_config.hpp
 * @brief Limits, timeouts, storage locations and input validation
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>

namespace didagent {
namespace security {

// ============================================================================
// Size Limits
// ============================================================================

/// Maximum wire message size (1MB) accepted by unpack and the HTTP listener
constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

/// Maximum identifier length (wallet name, agent name)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum length of a connection label
constexpr size_t MAX_LABEL_LENGTH = 256;

/// Maximum length of an HTTP request header block
constexpr size_t MAX_HTTP_HEADER_SIZE = 16 * 1024;

// ============================================================================
// Timeouts
// ============================================================================

/// TCP connection establishment timeout
constexpr auto CONNECTION_TIMEOUT = std::chrono::seconds(5);

/// Read timeout for network operations
constexpr auto READ_TIMEOUT = std::chrono::seconds(30);

/// Default wait for an expected handshake message
constexpr auto EXPECT_MESSAGE_TIMEOUT = std::chrono::seconds(30);

// ============================================================================
// Signed field freshness
// ============================================================================

/// Accept signed fields whose timestamp is within this window of now
constexpr auto SIGNATURE_FRESHNESS_WINDOW = std::chrono::seconds(300);

/// Signature replay cache cleanup interval
constexpr auto SIGNATURE_CACHE_CLEANUP = std::chrono::minutes(5);

// ============================================================================
// Identity Encoding
// ============================================================================

/// Number of verkey bytes that form an unqualified DID
constexpr size_t DID_SOURCE_BYTES = 16;

/// Size of the big-endian timestamp prefix of signed field data
constexpr size_t SIG_DATA_TIMESTAMP_SIZE = 8;

// ============================================================================
// Network Configuration
// ============================================================================

/// Default HTTP port for the agent endpoint
constexpr uint16_t DEFAULT_AGENT_PORT = 3000;

/// Media type of agent wire traffic
constexpr const char* WIRE_CONTENT_TYPE = "application/ssi-agent-wire";

/// HTTP status signalling an accepted delivery
constexpr int HTTP_ACCEPTED = 202;

// ============================================================================
// Storage Locations
// ============================================================================

/**
 * @brief Root of agent state: $DIDAGENT_DATA_DIR, else /var/lib/didagent
 *
 * Created on first use.
 * @throws std::filesystem::filesystem_error if it cannot be created
 */
std::filesystem::path get_data_directory();

/// "<data>/wallets", created on first use
std::filesystem::path get_wallet_directory();

/// "<data>/logs", created on first use
std::filesystem::path get_log_directory();

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Agent and wallet names: [A-Za-z0-9_-], 1..max_length characters
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Connection labels: non-empty, at most max_length, no control characters
 */
bool validate_label(const std::string& label, size_t max_length = MAX_LABEL_LENGTH);

/**
 * @brief Whether path resolves to a location inside base_dir
 *
 * Both sides are resolved with weakly_canonical, so ".." segments and
 * symlinks cannot escape the base.
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace security
} // namespace didagent
