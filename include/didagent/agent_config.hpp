/**
 * @file agent_config.hpp
 * @brief Agent configuration and its environment loader
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/errors.hpp"
#include "didagent/security_config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace didagent {

/**
 * @brief Agent configuration
 *
 * Environment variables read by from_environment():
 *
 *   DIDAGENT_NAME               agent name (owner of the wallet)
 *   DIDAGENT_PASSPHRASE         wallet passphrase
 *   DIDAGENT_HOST               advertised host (default: hostname)
 *   DIDAGENT_PORT               listening port (default: 3000)
 *   DIDAGENT_EPHEMERAL          "1"/"true" recreates the wallet on connect
 *   DIDAGENT_LOG_LEVEL          debug, info, warn, error, critical
 *   DIDAGENT_LOG_FILE           optional rotating log file
 *   DIDAGENT_SIGNATURE_MAX_AGE  signature freshness window in seconds, 0 disables
 *   DIDAGENT_DATA_DIR           root of the wallet directory
 */
struct AgentConfig {
    std::string name = "didagent";
    std::string passphrase;
    std::string host = "localhost";
    uint16_t port = security::DEFAULT_AGENT_PORT;
    bool ephemeral = false;
    std::string log_level = "info";
    std::string log_file;
    std::chrono::seconds signature_max_age = security::SIGNATURE_FRESHNESS_WINDOW;

    /// Wallet directory; empty resolves to security::get_wallet_directory()
    std::filesystem::path storage_dir;

    /**
     * @brief Load a configuration from DIDAGENT_* variables
     * @return Configuration, or InvalidArgument for an unparsable value
     */
    static Result<AgentConfig> from_environment();

    /**
     * @brief Check name, host, passphrase and log level
     */
    Status validate() const;

    /// "<name>-wallet", or "<name>-ephemeral_wallet" for ephemeral agents
    std::string wallet_name() const;

    static std::string wallet_name_for(const std::string& agent_name, bool ephemeral);

    /// "http://<host>[:<port>]/indy"; the port is omitted when zero
    std::string endpoint() const;

    /// "http://<host>[:<port>]/offer"
    std::string offer_endpoint() const;

    std::filesystem::path wallet_directory() const;
};

} // namespace didagent
