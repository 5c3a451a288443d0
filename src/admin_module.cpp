/**
 * @file admin_module.cpp
 * @brief Implementation of the admin family
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/admin_module.hpp"
#include "didagent/agent.hpp"
#include "didagent/connection_module.hpp"
#include "didagent/utilities.hpp"

#include <stdexcept>

namespace didagent {

namespace admin {

std::string family() {
    return MessageHelpers::family_identifier(FAMILY_NAME, FAMILY_VERSION);
}

std::string message_type(const std::string& message_name) {
    return MessageHelpers::message_type(family(), message_name);
}

} // namespace admin

AdminModule::AdminModule(Agent& agent, std::shared_ptr<ConnectionModule> connections)
    : agent_(agent)
    , connections_(std::move(connections))
{
    auto status = router_.register_handler(admin::message_type(admin::STATE_REQUEST),
                                           [this](const Message& msg) { return state_request(msg); });
    if (!status) {
        throw std::logic_error(status.error().to_string());
    }
}

std::string AdminModule::family() const {
    return admin::family();
}

RouteResult AdminModule::route(const Message& msg) {
    return router_.route(msg);
}

Result<Message> AdminModule::build_state() const {
    Json content = Json::object();
    content["initialized"] = agent_.initialized();

    if (agent_.initialized()) {
        auto pairwise = agent_.wallet().list_pairwise();
        if (!pairwise) {
            return pairwise.error();
        }

        Json connections = Json::array();
        for (const auto& info : *pairwise) {
            Json record = Json::object();
            record["their_did"] = info.their_did;
            record["my_did"] = info.my_did;
            record["metadata"] = {
                {"their_vk", info.their_verkey},
                {"their_endpoint", info.their_endpoint},
                {"label", info.label}
            };
            connections.push_back(record);
        }

        content["agent_name"] = agent_.owner();
        content["invitations"] = connections_ ? connections_->invitations() : Json::array();
        content["pairwise_connections"] = connections;
    }

    Message state = Message::create(admin::message_type(admin::STATE));
    state["content"] = content;
    return state;
}

RouteResult AdminModule::state_request(const Message&) {
    utilities::log_debug("AdminModule: Processing state_request");

    auto state = build_state();
    if (!state) {
        return state.error();
    }

    auto sent = agent_.send_admin_message(*state);
    if (!sent) {
        return sent.error();
    }

    return RouteResult(std::nullopt);
}

} // namespace didagent
