/**
 * @file agent_config.cpp
 * @brief Implementation of the agent configuration
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/agent_config.hpp"
#include "didagent/utilities.hpp"

#include <optional>
#include <stdexcept>

namespace didagent {

using namespace didagent::utilities;

namespace {
    std::optional<long> parse_number(const std::string& text) {
        try {
            size_t consumed = 0;
            long value = std::stol(text, &consumed);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    std::string base_url(const std::string& host, uint16_t port) {
        std::string url = "http://" + host;
        if (port != 0) {
            url += ":" + std::to_string(port);
        }
        return url;
    }
}

Result<AgentConfig> AgentConfig::from_environment() {
    AgentConfig config;

    config.name = get_env("DIDAGENT_NAME", config.name);
    config.passphrase = get_env("DIDAGENT_PASSPHRASE");
    config.host = get_env("DIDAGENT_HOST", get_hostname());
    config.log_level = get_env("DIDAGENT_LOG_LEVEL", config.log_level);
    config.log_file = get_env("DIDAGENT_LOG_FILE");

    std::string port = get_env("DIDAGENT_PORT");
    if (!port.empty()) {
        auto value = parse_number(port);
        if (!value || *value < 0 || *value > 65535) {
            return Error(ErrorKind::InvalidArgument, "DIDAGENT_PORT is not a port: " + port);
        }
        config.port = static_cast<uint16_t>(*value);
    }

    std::string ephemeral = to_lowercase(get_env("DIDAGENT_EPHEMERAL"));
    config.ephemeral = (ephemeral == "1" || ephemeral == "true" || ephemeral == "yes");

    std::string max_age = get_env("DIDAGENT_SIGNATURE_MAX_AGE");
    if (!max_age.empty()) {
        auto value = parse_number(max_age);
        if (!value || *value < 0) {
            return Error(ErrorKind::InvalidArgument,
                         "DIDAGENT_SIGNATURE_MAX_AGE is not a number of seconds: " + max_age);
        }
        config.signature_max_age = std::chrono::seconds(*value);
    }

    auto status = config.validate();
    if (!status) {
        return status.error();
    }

    return config;
}

Status AgentConfig::validate() const {
    if (!security::validate_identifier(name)) {
        return Error(ErrorKind::InvalidArgument, "Invalid agent name: '" + name + "'");
    }
    if (!security::validate_identifier(wallet_name())) {
        return Error(ErrorKind::InvalidArgument, "Agent name too long for a wallet name: '" + name + "'");
    }
    if (host.empty()) {
        return Error(ErrorKind::InvalidArgument, "Empty host");
    }
    if (passphrase.empty()) {
        return Error(ErrorKind::InvalidArgument, "Empty wallet passphrase");
    }
    if (!parse_log_level(log_level)) {
        return Error(ErrorKind::InvalidArgument, "Unknown log level: '" + log_level + "'");
    }
    if (signature_max_age.count() < 0) {
        return Error(ErrorKind::InvalidArgument, "Negative signature max age");
    }
    return Status::success();
}

std::string AgentConfig::wallet_name() const {
    return wallet_name_for(name, ephemeral);
}

std::string AgentConfig::wallet_name_for(const std::string& agent_name, bool ephemeral) {
    return agent_name + (ephemeral ? "-ephemeral_wallet" : "-wallet");
}

std::string AgentConfig::endpoint() const {
    return base_url(host, port) + "/indy";
}

std::string AgentConfig::offer_endpoint() const {
    return base_url(host, port) + "/offer";
}

std::filesystem::path AgentConfig::wallet_directory() const {
    return storage_dir.empty() ? security::get_wallet_directory() : storage_dir;
}

} // namespace didagent
