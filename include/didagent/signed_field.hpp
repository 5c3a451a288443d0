/**
 * @file signed_field.hpp
 * @brief Detached, timestamped signatures over message sub-documents
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A signed field replaces a message field "<name>" with "<name>~sig":
 *
 *   {"@type": SIGNATURE_TYPE, "signer": <verkey>,
 *    "sig_data": base64url(8-byte BE unix time ++ json(payload)),
 *    "signature": base64url(ed25519(sig_data bytes))}
 *
 * Verification does not judge timestamp freshness; see SignatureFreshness.
 */

#pragma once

#include "didagent/crypto_provider.hpp"
#include "didagent/errors.hpp"
#include "didagent/message.hpp"

#include <cstdint>
#include <string>

namespace didagent {

/**
 * @brief Outcome of verifying a signed field
 *
 * A false `verified` is a normal outcome; the payload must then not be
 * trusted.
 */
struct VerifiedField {
    Json payload;
    bool verified = false;
    uint64_t timestamp = 0;     ///< Unix time embedded by the signer
    std::string signer;         ///< Verkey declared in the field
    std::string signature;      ///< base64url signature text as received
};

/**
 * @brief Signed-field protocol operations
 */
class SignedField {
public:
    /// Signature algorithm URI carried in "@type"
    static constexpr const char* SIGNATURE_TYPE =
        "did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/signature/1.0/ed25519Sha512_single";

    /// Suffix of a message key carrying a signed field
    static constexpr const char* FIELD_SUFFIX = "~sig";

    /**
     * @brief Sign a payload with the current wall-clock time
     * @param crypto Provider holding the secret key
     * @param payload JSON value to sign
     * @param signer_verkey Signing verkey
     * @return Signed field object, or the provider's error
     */
    static Result<Json> sign(CryptoProvider& crypto, const Json& payload, const std::string& signer_verkey);

    /**
     * @brief Sign a payload with an explicit timestamp
     */
    static Result<Json> sign_at(CryptoProvider& crypto,
                                const Json& payload,
                                const std::string& signer_verkey,
                                uint64_t timestamp);

    /**
     * @brief Verify a signed field and recover its payload
     * @return VerifiedField, or MalformedSignedField if a field is missing,
     *         not base64url, shorter than the timestamp or not JSON
     */
    static Result<VerifiedField> verify(CryptoProvider& crypto, const Json& signed_field);

    /**
     * @brief Replace msg[field] by msg[field + "~sig"]
     * @return InvalidArgument if the field is absent, or the provider's error
     */
    static Status sign_message_field(CryptoProvider& crypto,
                                     Message& msg,
                                     const std::string& field,
                                     const std::string& signer_verkey);

    /**
     * @brief Verify msg[field + "~sig"] and restore msg[field] from it
     *
     * The "~sig" entry is removed and the plain field added whether or not
     * the signature verified; callers must check `verified`.
     *
     * @return VerifiedField, or MalformedSignedField
     */
    static Result<VerifiedField> unpack_message_field(CryptoProvider& crypto,
                                                      Message& msg,
                                                      const std::string& field);
};

} // namespace didagent
