/**
 * @file conformance.hpp
 * @brief Conformance harness: bounded waits and suite-side handshake drivers
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The suite owns a wallet, an inbound queue fed by its own endpoint and a
 * transport towards the agent under test. It drives the connection
 * handshake from either side and checks what comes back on the wire.
 */

#pragma once

#include "didagent/connection.hpp"
#include "didagent/crypto_provider.hpp"
#include "didagent/errors.hpp"
#include "didagent/identity_store.hpp"
#include "didagent/message_queue.hpp"
#include "didagent/secure_envelope.hpp"
#include "didagent/security_config.hpp"
#include "didagent/transport.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace didagent {

/**
 * @brief Wait for the next inbound wire message
 * @param queue Inbound queue of the suite endpoint
 * @param timeout Maximum wait
 * @return Wire bytes, or Timeout once the wait elapsed
 */
Result<std::string> expect_message(MessageQueue<std::string>& queue, std::chrono::milliseconds timeout);

/**
 * @brief Assert that nothing arrives within a window
 * @return Success after a silent window, UnexpectedMessage otherwise
 */
Status expect_silence(MessageQueue<std::string>& queue, std::chrono::milliseconds timeout);

/**
 * @brief Relationship established by the suite
 */
struct SuiteConnection {
    std::string my_did;
    std::string my_verkey;
    std::string their_did;
    std::string their_verkey;
    std::string their_endpoint;
};

/**
 * @brief Drives the connection handshake against an agent under test
 */
class ConformanceDriver {
public:
    /**
     * @param crypto Suite wallet
     * @param identities Suite wallet
     * @param transport Path to the agent under test
     * @param inbound Queue receiving everything sent to endpoint
     * @param endpoint Suite endpoint advertised in invitations and DIDDocs
     * @param timeout Wait for each expected message
     */
    ConformanceDriver(CryptoProvider& crypto,
                      IdentityStore& identities,
                      Transport& transport,
                      MessageQueue<std::string>& inbound,
                      std::string endpoint,
                      std::chrono::milliseconds timeout = security::EXPECT_MESSAGE_TIMEOUT);

    /**
     * @brief The agent under test invited; the suite requests and verifies
     * @param invite_url Invitation produced by the agent under test
     * @param label Suite label
     * @return Established connection, or the first failure (Timeout,
     *         InvalidHandshakeMessage, SignatureVerificationFailed, ...)
     */
    Result<SuiteConnection> connect_as_invitee(const std::string& invite_url, const std::string& label);

    /**
     * @brief The suite invites; the agent under test requests
     * @param label Suite label
     * @param deliver_invite Hands the invitation URL to the agent under test
     * @return Established connection, or the first failure
     */
    Result<SuiteConnection> connect_as_inviter(const std::string& label,
                                               const std::function<void(const std::string&)>& deliver_invite);

    /**
     * @brief Send a Request without DIDDoc and expect no answer
     * @param invite_url Invitation produced by the agent under test
     * @return Success when the agent stayed silent for the whole window
     */
    Status bad_request_is_ignored(const std::string& invite_url);

private:
    CryptoProvider& crypto_;
    IdentityStore& identities_;
    Transport& transport_;
    MessageQueue<std::string>& inbound_;
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
    SecureEnvelope envelope_;

    /// Unpack and insist on the key the message had to be addressed to
    Result<Message> unpack_for(const std::string& wire_bytes, const std::string& expected_to_key);
};

} // namespace didagent
