/**
 * @file replay_protection.hpp
 * @brief Freshness window and replay cache for signed fields
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Timestamp window around now (default 300 seconds, 0 disables)
 * - SHA-256 signature IDs
 * - Deduplication cache with automatic cleanup
 * - Thread-safe implementation
 */

#pragma once

#include "didagent/errors.hpp"
#include "didagent/security_config.hpp"
#include "didagent/signed_field.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace didagent {

/**
 * @brief SignatureFreshness - rejects stale and replayed signed fields
 *
 * signed_field verification is a pure function of the field; this class is
 * the caller-side policy applied after a signature verified.
 */
class SignatureFreshness {
public:
    /**
     * @brief Construct with a time window
     * @param window_seconds Accepted distance between signature time and now;
     *        zero disables all checks
     */
    explicit SignatureFreshness(
        std::chrono::seconds window_seconds = security::SIGNATURE_FRESHNESS_WINDOW
    );

    ~SignatureFreshness() = default;

    SignatureFreshness(const SignatureFreshness&) = delete;
    SignatureFreshness& operator=(const SignatureFreshness&) = delete;

    /**
     * @brief Generate the cache ID of a signature
     * @param signer Signer verkey
     * @param signature base64url signature text
     * @return SHA-256 hex digest (64 characters)
     */
    static std::string signature_id(const std::string& signer, const std::string& signature);

    /**
     * @brief Accept a verified field once, if fresh
     * @param field Result of SignedField::verify
     * @return SignatureVerificationFailed if the timestamp is outside the
     *         window or the signature was already accepted
     */
    Status check(const VerifiedField& field);

    /**
     * @brief Check a timestamp against the window without recording anything
     */
    bool is_timestamp_fresh(uint64_t timestamp) const;

    /**
     * @brief Check if a signature ID has been accepted before
     */
    bool has_seen(const std::string& id) const;

    bool enabled() const { return time_window_.count() > 0; }

    std::chrono::seconds get_window() const { return time_window_; }

    size_t get_cache_size() const;

    /**
     * @brief Remove expired cache entries
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    void clear();

private:
    /// Time window for signature acceptance
    std::chrono::seconds time_window_;

    /// Accepted signature IDs with expiration times
    std::map<std::string, std::chrono::system_clock::time_point> signature_cache_;

    /// Last cleanup pass
    std::chrono::system_clock::time_point last_cleanup_;

    mutable std::mutex mutex_;

    /// Caller holds mutex_
    size_t cleanup_expired_locked();
};

} // namespace didagent
