/**
 * @file secure_envelope.hpp
 * @brief Wire bytes <-> Message with authenticated encryption
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/crypto_provider.hpp"
#include "didagent/errors.hpp"
#include "didagent/identity_store.hpp"
#include "didagent/message.hpp"

#include <optional>
#include <string>
#include <vector>

namespace didagent {

/**
 * @brief SecureEnvelope - plaintext-first unpack, authcrypt/anoncrypt pack
 *
 * Unpack first tries the bytes as a plaintext message (a JSON object with
 * "@type"); otherwise it opens them through the CryptoProvider and resolves
 * the sender and recipient keys to DIDs through the IdentityStore. Either
 * way the returned message carries a context.
 */
class SecureEnvelope {
public:
    SecureEnvelope(CryptoProvider& crypto, IdentityStore& identities);

    /**
     * @brief Turn inbound wire bytes into a message
     * @param wire_bytes Raw bytes as delivered by a transport
     * @return Message with context, or MalformedWireBytes when neither the
     *         plaintext nor the encrypted interpretation works
     */
    Result<Message> unpack(const std::string& wire_bytes);

    /**
     * @brief Serialize and encrypt a message
     * @param msg Message to send
     * @param recipient_verkeys Recipient keys
     * @param sender_verkey Sender key for an authenticated envelope;
     *        std::nullopt produces an anonymous one
     * @return Envelope bytes
     */
    Result<std::string> pack(const Message& msg,
                             const std::vector<std::string>& recipient_verkeys,
                             const std::optional<std::string>& sender_verkey = std::nullopt);

private:
    CryptoProvider& crypto_;
    IdentityStore& identities_;

    /// Resolve a key to a DID; unknown keys and lookup failures resolve to nullopt
    std::optional<std::string> resolve_did(const std::string& verkey);
};

} // namespace didagent
