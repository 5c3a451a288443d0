/**
 * @file handshake.hpp
 * @brief Inviter and Invitee roles of the connection handshake
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Inviter: Idle -> InviteIssued -> AwaitingRequest -> RequestValidated -> ResponseSent
 * Invitee: Idle -> InviteParsed -> RequestSent -> AwaitingResponse -> ResponseVerified
 *
 * The roles share nothing but wire messages. An invalid Request is dropped
 * without any reply; an invalid Response is reported to the invitee.
 */

#pragma once

#include "didagent/connection.hpp"
#include "didagent/crypto_provider.hpp"
#include "didagent/errors.hpp"
#include "didagent/message.hpp"
#include "didagent/replay_protection.hpp"
#include "didagent/secure_envelope.hpp"
#include "didagent/transport.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace didagent {

enum class InviterState {
    Idle,
    InviteIssued,
    AwaitingRequest,
    RequestValidated,
    ResponseSent
};

enum class InviteeState {
    Idle,
    InviteParsed,
    RequestSent,
    AwaitingResponse,
    ResponseVerified
};

const char* inviter_state_to_string(InviterState state);
const char* invitee_state_to_string(InviteeState state);

// ============================================================================
// Inviter
// ============================================================================

/**
 * @brief Inviter role: issues a single-use invitation and answers one Request
 */
class Inviter {
public:
    /**
     * @param crypto Key owner (creates the invitation key and identity)
     * @param envelope Packs the Response
     * @param transport Sends the Response
     * @param label Label placed in the invitation
     * @param endpoint Endpoint the invitee should send its Request to
     */
    Inviter(CryptoProvider& crypto,
            SecureEnvelope& envelope,
            Transport& transport,
            std::string label,
            std::string endpoint);

    /**
     * @brief Create a fresh connection key and the invitation URL
     * @return Invitation URL, or the provider's error
     */
    Result<std::string> issue_invite();

    /**
     * @brief Validate a Request and answer it with a signed Response
     *
     * An invalid Request leaves the role in AwaitingRequest and nothing is
     * sent; the returned error is for local logging only. A failure after
     * validation leaves the role in RequestValidated for good.
     *
     * @param request Unpacked Request (context used when present)
     * @return InvalidHandshakeMessage, TransportFailure, or success once the
     *         Response was accepted by the peer
     */
    Status handle_request(const Message& request);

    InviterState state() const;

    /// Single-use key carried by the invitation
    std::string connection_key() const;

    std::optional<Message> invite() const;

    /// Local identity created for the relationship (after the Response)
    std::optional<LocalIdentity> my_identity() const;

    /// Requester DID, key and endpoint (after a valid Request)
    std::optional<connections::ConnectionTarget> their_identity() const;

private:
    CryptoProvider& crypto_;
    SecureEnvelope& envelope_;
    Transport& transport_;
    std::string label_;
    std::string endpoint_;

    InviterState state_ = InviterState::Idle;
    std::string connection_key_;
    std::optional<Message> invite_;
    std::optional<LocalIdentity> my_identity_;
    std::optional<connections::ConnectionTarget> their_identity_;

    mutable std::mutex mutex_;
};

// ============================================================================
// Invitee
// ============================================================================

/**
 * @brief Invitee role: answers an invitation and verifies the Response
 */
class Invitee {
public:
    /**
     * @param crypto Key owner (creates the invitee identity, verifies)
     * @param envelope Packs the Request
     * @param transport Sends the Request
     * @param label Label placed in the Request
     * @param endpoint Endpoint the inviter should send its Response to
     * @param freshness Optional freshness policy for the Response signature
     */
    Invitee(CryptoProvider& crypto,
            SecureEnvelope& envelope,
            Transport& transport,
            std::string label,
            std::string endpoint,
            SignatureFreshness* freshness = nullptr);

    /**
     * @brief Decode an invitation URL
     * @return InvalidHandshakeMessage for a bad invitation
     */
    Status receive_invite(const std::string& invite_url);

    /**
     * @brief Create a local identity and send a Request to the inviter
     * @param request_id @id to use instead of a generated one
     * @return Provider errors, or TransportFailure when the inviter did not
     *         accept the Request
     */
    Status send_request(const std::optional<std::string>& request_id = std::nullopt);

    /**
     * @brief Verify a Response and complete the handshake
     *
     * The Response must arrive in an envelope opened with this invitee's
     * key and sent by the key of the DIDDoc it carries.
     *
     * @return InvalidHandshakeMessage for an envelope, structural or @id problem,
     *         MalformedSignedField for an undecodable signature,
     *         SignatureVerificationFailed for a bad, foreign or stale
     *         signature; the role stays in AwaitingResponse on all of them
     */
    Status handle_response(const Message& response);

    InviteeState state() const;

    std::optional<Message> invite() const;
    std::optional<Message> request() const;

    /// Response with its connection restored (after ResponseVerified)
    std::optional<Message> response() const;

    std::optional<LocalIdentity> my_identity() const;

    /// Inviter DID, key and endpoint (after ResponseVerified)
    std::optional<connections::ConnectionTarget> their_identity() const;

private:
    CryptoProvider& crypto_;
    SecureEnvelope& envelope_;
    Transport& transport_;
    std::string label_;
    std::string endpoint_;
    SignatureFreshness* freshness_;

    InviteeState state_ = InviteeState::Idle;
    std::optional<Message> invite_;
    std::optional<Message> request_;
    std::optional<Message> response_;
    std::optional<LocalIdentity> my_identity_;
    std::optional<connections::ConnectionTarget> their_identity_;

    mutable std::mutex mutex_;
};

} // namespace didagent
