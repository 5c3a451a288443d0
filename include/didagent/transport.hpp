/**
 * @file transport.hpp
 * @brief Outbound transport capability and the in-process loopback
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/errors.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace didagent {

/// Receives raw wire bytes delivered to an endpoint
using DeliveryCallback = std::function<void(const std::string& wire_bytes)>;

/**
 * @brief Delivers wire bytes to a peer endpoint
 *
 * Success is HTTP 202. Any other status is returned as-is so callers can
 * observe delivery failures; TransportFailure means no status was obtained.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Send wire bytes to an endpoint
     * @param endpoint Endpoint URL
     * @param wire_bytes Packed message
     * @return HTTP-style status code, or TransportFailure
     */
    virtual Result<int> send(const std::string& endpoint, const std::string& wire_bytes) = 0;
};

/**
 * @brief In-process transport: endpoint URL -> delivery callback
 *
 * Answers 202 when a callback is attached to the endpoint and 404
 * otherwise. Callbacks run on the sender's thread.
 */
class LoopbackTransport : public Transport {
public:
    /**
     * @brief Route an endpoint to a callback (replaces any existing one)
     */
    void attach(const std::string& endpoint, DeliveryCallback callback);

    void detach(const std::string& endpoint);

    Result<int> send(const std::string& endpoint, const std::string& wire_bytes) override;

    /// Number of messages delivered (202) so far
    size_t delivered_count() const { return delivered_count_; }

private:
    std::map<std::string, DeliveryCallback> endpoints_;
    mutable std::mutex mutex_;
    std::atomic<size_t> delivered_count_{0};
};

} // namespace didagent
