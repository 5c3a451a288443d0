/**
 * @file connection_module.cpp
 * @brief Implementation of the connections family module
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/connection_module.hpp"
#include "didagent/admin_module.hpp"
#include "didagent/agent.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

#include <stdexcept>

namespace didagent {

using namespace didagent::utilities;

ConnectionModule::ConnectionModule(Agent& agent)
    : agent_(agent)
{
    auto request = router_.register_handler(connections::request_type(),
                                            [this](const Message& msg) { return handle_request(msg); });
    auto response = router_.register_handler(connections::response_type(),
                                             [this](const Message& msg) { return handle_response(msg); });
    if (!request || !response) {
        throw std::logic_error("ConnectionModule: handler registration failed");
    }
}

std::string ConnectionModule::family() const {
    return connections::family();
}

RouteResult ConnectionModule::route(const Message& msg) {
    return router_.route(msg);
}

// ============================================================================
// Local API
// ============================================================================

Result<std::string> ConnectionModule::create_invite(const std::string& label) {
    if (!security::validate_label(label)) {
        return Error(ErrorKind::InvalidArgument, "Invalid invitation label");
    }

    auto inviter = std::make_shared<Inviter>(agent_.wallet(), agent_.envelope(), agent_.transport(),
                                             label, agent_.endpoint());

    auto url = inviter->issue_invite();
    if (!url) {
        return url.error();
    }

    PendingInvitation pending;
    pending.label = label;
    pending.connection_key = inviter->connection_key();
    pending.invite_url = *url;
    pending.inviter = inviter;

    std::lock_guard<std::mutex> lock(mutex_);
    invitations_[pending.connection_key] = pending;

    log_info("ConnectionModule: Invitation '" + label + "' created");
    return url;
}

Status ConnectionModule::receive_invite(const std::string& invite_url, const std::string& label) {
    if (!security::validate_label(label)) {
        return Error(ErrorKind::InvalidArgument, "Invalid request label");
    }

    auto invitee = std::make_shared<Invitee>(agent_.wallet(), agent_.envelope(), agent_.transport(),
                                             label, agent_.endpoint(), &agent_.freshness());

    auto received = invitee->receive_invite(invite_url);
    if (!received) {
        return received;
    }

    // Registered before sending so an immediate Response finds it
    std::string request_id = MessageHelpers::generate_message_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_[request_id] = invitee;
    }

    auto sent = invitee->send_request(request_id);
    if (!sent) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.erase(request_id);
        return sent;
    }

    return Status::success();
}

Json ConnectionModule::invitations() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Json list = Json::array();
    for (const auto& [key, pending] : invitations_) {
        Json entry = Json::object();
        entry["label"] = pending.label;
        entry["connection_key"] = key;
        entry["invitation"] = pending.invite_url;
        list.push_back(entry);
    }
    return list;
}

size_t ConnectionModule::pending_invitation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invitations_.size();
}

size_t ConnectionModule::pending_request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

// ============================================================================
// Handlers
// ============================================================================

RouteResult ConnectionModule::handle_request(const Message& msg) {
    std::string to_key = msg.has_context() ? msg.context().to_key : "";

    std::shared_ptr<Inviter> inviter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = invitations_.find(to_key);
        if (it != invitations_.end()) {
            inviter = it->second.inviter;
        }
    }

    if (!inviter) {
        return Error(ErrorKind::InvalidHandshakeMessage, "Request not addressed to a pending invitation");
    }

    auto answered = inviter->handle_request(msg);
    if (!answered) {
        // A validated Request spends the invitation even when the Response fails
        if (inviter->state() != InviterState::AwaitingRequest) {
            std::lock_guard<std::mutex> lock(mutex_);
            invitations_.erase(to_key);
            log_warn("ConnectionModule: Invitation " + to_key + " withdrawn: " + answered.error().message);
        }
        return answered.error();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        invitations_.erase(to_key);
    }

    auto theirs = *inviter->their_identity();
    auto stored = complete(*inviter->my_identity(), theirs, theirs.label);
    if (!stored) {
        return stored.error();
    }

    return RouteResult(std::nullopt);
}

RouteResult ConnectionModule::handle_response(const Message& msg) {
    std::shared_ptr<Invitee> invitee;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(msg.id());
        if (it != requests_.end()) {
            invitee = it->second;
        }
    }

    if (!invitee) {
        return Error(ErrorKind::InvalidHandshakeMessage, "Response to unknown request '" + msg.id() + "'");
    }

    auto verified = invitee->handle_response(msg);
    if (!verified) {
        return verified.error();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.erase(msg.id());
    }

    auto stored = complete(*invitee->my_identity(), *invitee->their_identity(),
                           invitee->invite()->at("label").get<std::string>());
    if (!stored) {
        return stored.error();
    }

    return RouteResult(std::nullopt);
}

Status ConnectionModule::complete(const LocalIdentity& mine,
                                  const connections::ConnectionTarget& theirs,
                                  const std::string& label) {
    PairwiseInfo info;
    info.their_did = theirs.did;
    info.their_verkey = theirs.verkey;
    info.my_did = mine.did;
    info.their_endpoint = theirs.endpoint;
    info.label = label;

    auto stored = agent_.wallet().store_pairwise(info);
    if (!stored) {
        log_error("ConnectionModule: Could not store pairwise " + theirs.did + ": " + stored.error().to_string());
        return stored;
    }

    log_info("ConnectionModule: Connected with '" + label + "' (" + theirs.did + ")");

    Message notice = Message::create(admin::message_type(admin::CONNECTION_COMPLETED));
    notice["content"] = {
        {"their_did", theirs.did},
        {"my_did", mine.did},
        {"label", label}
    };
    return agent_.send_admin_message(notice);
}

} // namespace didagent
