/**
 * @file connection_module.hpp
 * @brief connections/1.0 family: drives handshakes for the agent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Each invitation gets its own Inviter, found again by the key the Request
 * was encrypted to. Each accepted invitation gets its own Invitee, found
 * again by the @id the Response carries. Completed handshakes become
 * pairwise records in the wallet.
 */

#pragma once

#include "didagent/family_router.hpp"
#include "didagent/handshake.hpp"
#include "didagent/message.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace didagent {

class Agent;

/**
 * @brief Invitation waiting for its Request
 */
struct PendingInvitation {
    std::string label;
    std::string connection_key;
    std::string invite_url;
    std::shared_ptr<Inviter> inviter;
};

class ConnectionModule : public Module {
public:
    explicit ConnectionModule(Agent& agent);

    std::string family() const override;
    RouteResult route(const Message& msg) override;

    /**
     * @brief Issue an invitation to this agent's endpoint
     * @param label Label shown to the invitee
     * @return Invitation URL
     */
    Result<std::string> create_invite(const std::string& label);

    /**
     * @brief Accept an invitation: send a Request to the inviter
     * @param invite_url Out-of-band invitation
     * @param label Label presented to the inviter
     */
    Status receive_invite(const std::string& invite_url, const std::string& label);

    /// Pending invitations as [{label, connection_key, invitation}]
    Json invitations() const;

    size_t pending_invitation_count() const;
    size_t pending_request_count() const;

private:
    Agent& agent_;
    SimpleRouter router_;

    /// Keyed by invitation key
    std::map<std::string, PendingInvitation> invitations_;

    /// Keyed by request @id
    std::map<std::string, std::shared_ptr<Invitee>> requests_;

    mutable std::mutex mutex_;

    RouteResult handle_request(const Message& msg);
    RouteResult handle_response(const Message& msg);

    Status complete(const LocalIdentity& mine,
                    const connections::ConnectionTarget& theirs,
                    const std::string& label);
};

} // namespace didagent
