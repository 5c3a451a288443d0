/**
 * @file loopback_transport.cpp
 * @brief Implementation of the in-process transport
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/transport.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

void LoopbackTransport::attach(const std::string& endpoint, DeliveryCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[endpoint] = std::move(callback);
}

void LoopbackTransport::detach(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.erase(endpoint);
}

Result<int> LoopbackTransport::send(const std::string& endpoint, const std::string& wire_bytes) {
    DeliveryCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(endpoint);
        if (it != endpoints_.end()) {
            callback = it->second;
        }
    }

    if (!callback) {
        utilities::log_debug("LoopbackTransport: No endpoint " + endpoint);
        return 404;
    }

    callback(wire_bytes);
    ++delivered_count_;

    return security::HTTP_ACCEPTED;
}

} // namespace didagent
