/**
 * @file signed_field.cpp
 * @brief Implementation of the signed-field protocol
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/signed_field.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

namespace {
    Error malformed(const std::string& reason) {
        return Error(ErrorKind::MalformedSignedField, reason);
    }

    std::optional<std::string> string_member(const Json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }
}

// ============================================================================
// Signing
// ============================================================================

Result<Json> SignedField::sign(CryptoProvider& crypto, const Json& payload, const std::string& signer_verkey) {
    return sign_at(crypto, payload, signer_verkey, utilities::current_unix_time());
}

Result<Json> SignedField::sign_at(CryptoProvider& crypto,
                                  const Json& payload,
                                  const std::string& signer_verkey,
                                  uint64_t timestamp) {
    // 8-byte big-endian timestamp followed by the JSON text
    std::vector<uint8_t> sig_data(security::SIG_DATA_TIMESTAMP_SIZE);
    for (size_t i = 0; i < security::SIG_DATA_TIMESTAMP_SIZE; ++i) {
        sig_data[i] = static_cast<uint8_t>(timestamp >> (8 * (security::SIG_DATA_TIMESTAMP_SIZE - 1 - i)));
    }

    std::string payload_json = payload.dump();
    sig_data.insert(sig_data.end(), payload_json.begin(), payload_json.end());

    auto signature = crypto.sign(signer_verkey, sig_data);
    if (!signature) {
        return signature.error();
    }

    Json field = Json::object();
    field["@type"] = SIGNATURE_TYPE;
    field["signer"] = signer_verkey;
    field["sig_data"] = AgentCrypto::bytes_to_base64url(sig_data);
    field["signature"] = AgentCrypto::bytes_to_base64url(*signature);

    return field;
}

// ============================================================================
// Verification
// ============================================================================

Result<VerifiedField> SignedField::verify(CryptoProvider& crypto, const Json& signed_field) {
    if (!signed_field.is_object()) {
        return malformed("Signed field is not an object");
    }

    auto signer = string_member(signed_field, "signer");
    auto sig_data_text = string_member(signed_field, "sig_data");
    auto signature_text = string_member(signed_field, "signature");
    if (!signer || !sig_data_text || !signature_text) {
        return malformed("Signed field lacks signer, sig_data or signature");
    }

    auto sig_data = AgentCrypto::base64url_to_bytes(*sig_data_text);
    if (!sig_data) {
        return malformed("sig_data is not base64url");
    }

    auto signature = AgentCrypto::base64url_to_bytes(*signature_text);
    if (!signature) {
        return malformed("signature is not base64url");
    }

    if (sig_data->size() < security::SIG_DATA_TIMESTAMP_SIZE) {
        return malformed("sig_data shorter than its timestamp");
    }

    VerifiedField result;
    result.signer = *signer;
    result.signature = *signature_text;
    result.verified = crypto.verify(*signer, *sig_data, *signature);

    for (size_t i = 0; i < security::SIG_DATA_TIMESTAMP_SIZE; ++i) {
        result.timestamp = (result.timestamp << 8) | (*sig_data)[i];
    }

    try {
        result.payload = Json::parse(sig_data->begin() + security::SIG_DATA_TIMESTAMP_SIZE, sig_data->end());
    } catch (const Json::exception& e) {
        return malformed(std::string("Signed payload is not JSON: ") + e.what());
    }

    return result;
}

// ============================================================================
// Message Fields
// ============================================================================

Status SignedField::sign_message_field(CryptoProvider& crypto,
                                       Message& msg,
                                       const std::string& field,
                                       const std::string& signer_verkey) {
    if (!msg.contains(field)) {
        return Error(ErrorKind::InvalidArgument, "Message has no field '" + field + "' to sign");
    }

    auto signed_field = sign(crypto, msg.at(field), signer_verkey);
    if (!signed_field) {
        return signed_field.error();
    }

    msg[field + FIELD_SUFFIX] = *signed_field;
    msg.erase(field);

    return Status::success();
}

Result<VerifiedField> SignedField::unpack_message_field(CryptoProvider& crypto,
                                                        Message& msg,
                                                        const std::string& field) {
    std::string sig_key = field + FIELD_SUFFIX;
    if (!msg.contains(sig_key)) {
        return malformed("Message has no '" + sig_key + "'");
    }

    auto result = verify(crypto, msg.at(sig_key));
    if (!result) {
        return result;
    }

    msg[field] = result->payload;
    msg.erase(sig_key);

    return result;
}

} // namespace didagent
