/**
 * @file crypto_provider.hpp
 * @brief Crypto Provider capability consumed by the agent core
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The core never touches key material directly. Signing, envelope
 * packing and key creation go through this interface; Wallet is the
 * shipped implementation.
 */

#pragma once

#include "didagent/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace didagent {

/**
 * @brief Result of opening an envelope
 */
struct UnpackedEnvelope {
    std::string message;                        ///< Decrypted wire text
    std::string recipient_verkey;               ///< Local key the envelope was opened with
    std::optional<std::string> sender_verkey;   ///< Absent for anonymous envelopes
};

/**
 * @brief Freshly created DID and its verkey
 */
struct LocalIdentity {
    std::string did;
    std::string verkey;
};

/**
 * @brief Cryptographic operations keyed by verkey
 */
class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;

    /**
     * @brief Sign raw bytes with the secret key behind a verkey
     * @param verkey Base58 verkey owned by this provider
     * @param data Bytes to sign
     * @return Detached signature, or KeyNotFound / WalletUnavailable
     */
    virtual Result<std::vector<uint8_t>> sign(const std::string& verkey, const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Verify a detached signature
     * @return true only for a valid signature by verkey; never fails otherwise
     */
    virtual bool verify(const std::string& verkey,
                        const std::vector<uint8_t>& data,
                        const std::vector<uint8_t>& signature) = 0;

    /**
     * @brief Encrypt plaintext for one or more recipients
     * @param recipient_verkeys Recipient verkeys (at least one)
     * @param sender_verkey Sender key for an authenticated envelope, or
     *        std::nullopt for an anonymous one
     * @param plaintext Wire text to protect
     * @return Envelope bytes
     */
    virtual Result<std::string> pack_envelope(const std::vector<std::string>& recipient_verkeys,
                                              const std::optional<std::string>& sender_verkey,
                                              const std::string& plaintext) = 0;

    /**
     * @brief Open an envelope addressed to one of this provider's keys
     * @return Decrypted message and keys, or MalformedWireBytes
     */
    virtual Result<UnpackedEnvelope> unpack_envelope(const std::string& envelope) = 0;

    /**
     * @brief Create a new signing key
     * @return Base58 verkey
     */
    virtual Result<std::string> create_key() = 0;

    /**
     * @brief Create a new key and the DID derived from it
     */
    virtual Result<LocalIdentity> create_local_identity() = 0;
};

} // namespace didagent
