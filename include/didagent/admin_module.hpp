/**
 * @file admin_module.hpp
 * @brief admin/1.0 family: agent state reports for the admin interface
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/family_router.hpp"
#include "didagent/message.hpp"

#include <memory>
#include <string>

namespace didagent {

class Agent;
class ConnectionModule;

namespace admin {

constexpr const char* FAMILY_NAME = "admin";
constexpr const char* FAMILY_VERSION = "1.0";

constexpr const char* STATE_REQUEST = "state_request";
constexpr const char* STATE = "state";

/// Notifications pushed by other modules
constexpr const char* CONNECTION_COMPLETED = "connection_completed";
constexpr const char* BASICMESSAGE_RECEIVED = "basicmessage_received";

std::string family();

/// Full @type of an admin message
std::string message_type(const std::string& message_name);

} // namespace admin

/**
 * @brief Answers state_request with a state message on the admin queue
 *
 * state content: {initialized, agent_name, invitations,
 * pairwise_connections}; only {initialized: false} without a wallet.
 */
class AdminModule : public Module {
public:
    /**
     * @param agent Owning agent
     * @param connections Source of pending invitations (optional)
     */
    explicit AdminModule(Agent& agent, std::shared_ptr<ConnectionModule> connections = nullptr);

    std::string family() const override;
    RouteResult route(const Message& msg) override;

    /**
     * @brief Build the current state message
     */
    Result<Message> build_state() const;

private:
    Agent& agent_;
    std::shared_ptr<ConnectionModule> connections_;
    SimpleRouter router_;

    RouteResult state_request(const Message& msg);
};

} // namespace didagent
