/**
 * @file secure_envelope.cpp
 * @brief Implementation of envelope packing and unpacking
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/secure_envelope.hpp"
#include "didagent/serializer.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

SecureEnvelope::SecureEnvelope(CryptoProvider& crypto, IdentityStore& identities)
    : crypto_(crypto)
    , identities_(identities)
{
}

// ============================================================================
// Unpack
// ============================================================================

Result<Message> SecureEnvelope::unpack(const std::string& wire_bytes) {
    if (wire_bytes.size() > security::MAX_MESSAGE_SIZE) {
        return Error(ErrorKind::MalformedWireBytes,
                     "Wire message of " + std::to_string(wire_bytes.size()) + " bytes exceeds limit");
    }

    // Plaintext path: a JSON object carrying @type
    auto plain = JsonSerializer::deserialize(wire_bytes);
    if (plain && plain->has_type()) {
        Message msg = *plain;
        msg.set_context(MessageContext{});
        return msg;
    }

    utilities::log_debug("SecureEnvelope: Not plaintext, attempting to decrypt");

    auto opened = crypto_.unpack_envelope(wire_bytes);
    if (!opened) {
        return Error(ErrorKind::MalformedWireBytes,
                     "Failed to unpack message: " + opened.error().message);
    }

    auto inner = JsonSerializer::deserialize(opened->message);
    if (!inner) {
        return Error(ErrorKind::MalformedWireBytes,
                     "Decrypted payload is not a message: " + inner.error().message);
    }

    MessageContext context;
    context.to_key = opened->recipient_verkey;
    context.to_did = resolve_did(opened->recipient_verkey);
    if (opened->sender_verkey) {
        context.from_key = opened->sender_verkey;
        context.from_did = resolve_did(*opened->sender_verkey);
    }

    Message msg = *inner;
    msg.set_context(std::move(context));
    return msg;
}

std::optional<std::string> SecureEnvelope::resolve_did(const std::string& verkey) {
    auto did = identities_.verkey_to_did(verkey);
    if (!did) {
        utilities::log_warn("SecureEnvelope: DID lookup failed for " + verkey + ": " + did.error().message);
        return std::nullopt;
    }
    return *did;
}

// ============================================================================
// Pack
// ============================================================================

Result<std::string> SecureEnvelope::pack(const Message& msg,
                                         const std::vector<std::string>& recipient_verkeys,
                                         const std::optional<std::string>& sender_verkey) {
    return crypto_.pack_envelope(recipient_verkeys, sender_verkey, JsonSerializer::serialize(msg));
}

} // namespace didagent
