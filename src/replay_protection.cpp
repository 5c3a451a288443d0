/**
 * @file replay_protection.cpp
 * @brief Implementation of signed-field freshness checks
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/replay_protection.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

// ============================================================================
// Constructor
// ============================================================================

SignatureFreshness::SignatureFreshness(std::chrono::seconds window_seconds)
    : time_window_(window_seconds.count() < 0 ? std::chrono::seconds(0) : window_seconds)
    , last_cleanup_(std::chrono::system_clock::now())
{
}

// ============================================================================
// Signature IDs
// ============================================================================

std::string SignatureFreshness::signature_id(const std::string& signer, const std::string& signature) {
    std::string input = signer + ":" + signature;
    return AgentCrypto::bytes_to_hex(AgentCrypto::sha256(std::vector<uint8_t>(input.begin(), input.end())));
}

// ============================================================================
// Validation
// ============================================================================

Status SignatureFreshness::check(const VerifiedField& field) {
    if (!enabled()) {
        return Status::success();
    }

    if (!is_timestamp_fresh(field.timestamp)) {
        return Error(ErrorKind::SignatureVerificationFailed,
                     "Signature timestamp " + utilities::format_timestamp(field.timestamp) +
                     " is outside the " + std::to_string(time_window_.count()) + "s window");
    }

    std::string id = signature_id(field.signer, field.signature);
    auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);

    if (signature_cache_.find(id) != signature_cache_.end()) {
        return Error(ErrorKind::SignatureVerificationFailed, "Signature by " + field.signer + " was replayed");
    }

    // Old enough entries fail the window check anyway; keep them one extra window
    signature_cache_[id] = now + 2 * time_window_;

    if (now - last_cleanup_ >= security::SIGNATURE_CACHE_CLEANUP) {
        cleanup_expired_locked();
        last_cleanup_ = now;
    }

    return Status::success();
}

bool SignatureFreshness::is_timestamp_fresh(uint64_t timestamp) const {
    if (!enabled()) {
        return true;
    }

    uint64_t now = utilities::current_unix_time();
    uint64_t window_seconds = static_cast<uint64_t>(time_window_.count());

    // Too old
    if (now > window_seconds && timestamp < now - window_seconds) {
        return false;
    }

    // Too far in the future (clock skew allowance is the same window)
    if (timestamp > now + window_seconds) {
        return false;
    }

    return true;
}

bool SignatureFreshness::has_seen(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signature_cache_.find(id) != signature_cache_.end();
}

// ============================================================================
// Cache Management
// ============================================================================

size_t SignatureFreshness::get_cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signature_cache_.size();
}

size_t SignatureFreshness::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanup_expired_locked();
}

size_t SignatureFreshness::cleanup_expired_locked() {
    auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    for (auto it = signature_cache_.begin(); it != signature_cache_.end(); ) {
        if (it->second < now) {
            it = signature_cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

void SignatureFreshness::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    signature_cache_.clear();
}

} // namespace didagent
