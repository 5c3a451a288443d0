/**
 * @file connection.hpp
 * @brief Connection protocol messages: Invite, Request, Response, DIDDoc
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Message shapes of the connections/1.0 family:
 *
 *   invitation  {@type, label, recipientKeys: [verkey], serviceEndpoint, @id}
 *   request     {@type, @id, label, connection: {DID, DIDDoc}}
 *   response    {@type, @id (= request @id), connection~sig}
 *
 * Invitations travel out of band as "<endpoint>?c_i=<base64url(json)>".
 */

#pragma once

#include "didagent/errors.hpp"
#include "didagent/message.hpp"

#include <string>

namespace didagent {
namespace connections {

// ============================================================================
// Identifiers
// ============================================================================

constexpr const char* FAMILY_NAME = "connections";
constexpr const char* FAMILY_VERSION = "1.0";

constexpr const char* INVITATION = "invitation";
constexpr const char* REQUEST = "request";
constexpr const char* RESPONSE = "response";

/// Message keys
constexpr const char* CONNECTION = "connection";
constexpr const char* DID = "DID";
constexpr const char* DID_DOC = "DIDDoc";

/// Query parameter carrying an encoded invitation
constexpr const char* INVITE_QUERY_PARAM = "c_i";

/// "did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/connections/1.0"
std::string family();

std::string invitation_type();
std::string request_type();
std::string response_type();

/**
 * @brief Peer identity carried by a DIDDoc
 */
struct ConnectionTarget {
    std::string did;
    std::string verkey;
    std::string endpoint;
    std::string label;          ///< Only set when parsed from a Request
};

// ============================================================================
// DIDDoc
// ============================================================================

class DIDDoc {
public:
    /**
     * @brief Build a DIDDoc binding a DID to a verkey and an endpoint
     */
    static Json build(const std::string& did, const std::string& verkey, const std::string& endpoint);

    /**
     * @brief Extract the DID, key and endpoint of a DIDDoc
     * @param doc DIDDoc object
     * @param did DID the document must describe
     * @return ConnectionTarget, or InvalidHandshakeMessage when the document
     *         is malformed or its DID, key and endpoint are inconsistent
     */
    static Result<ConnectionTarget> parse(const Json& doc, const std::string& did);
};

// ============================================================================
// Invite
// ============================================================================

class Invite {
public:
    /**
     * @brief Build an invitation message
     */
    static Message build_message(const std::string& label,
                                 const std::string& connection_key,
                                 const std::string& endpoint);

    /**
     * @brief Build an invitation and encode it as an out-of-band URL
     * @return "<endpoint>?c_i=<base64url(json)>"
     */
    static std::string build(const std::string& label,
                             const std::string& connection_key,
                             const std::string& endpoint);

    /**
     * @brief Encode an invitation message as a URL
     */
    static std::string encode(const Message& invite, const std::string& endpoint);

    /**
     * @brief Decode and validate an invitation URL
     * @return Invitation message, or InvalidHandshakeMessage
     */
    static Result<Message> parse(const std::string& url);

    static Status validate(const Message& invite);
};

// ============================================================================
// Request
// ============================================================================

class Request {
public:
    /**
     * @brief Build a connection request with a fresh @id
     */
    static Message build(const std::string& label,
                         const std::string& my_did,
                         const std::string& my_verkey,
                         const std::string& endpoint);

    /**
     * @brief Check type, label, connection.DID and a consistent DIDDoc
     * @return InvalidHandshakeMessage on any missing or mismatched field
     */
    static Status validate(const Message& request);

    /**
     * @brief Requester DID, key, endpoint and label of a valid request
     */
    static Result<ConnectionTarget> parse(const Message& request);
};

// ============================================================================
// Response
// ============================================================================

class Response {
public:
    /**
     * @brief Build a response carrying a cleartext connection field
     *
     * The caller signs "connection" into "connection~sig" before sending.
     */
    static Message build(const std::string& request_id,
                         const std::string& my_did,
                         const std::string& my_verkey,
                         const std::string& endpoint);

    /**
     * @brief Structural checks before signature verification
     * @param response Response as received
     * @param request_id @id of the request this answers
     * @return InvalidHandshakeMessage if the type is wrong, connection~sig
     *         is missing or malformed, or @id does not match
     */
    static Status validate_pre_sig(const Message& response, const std::string& request_id);

    /**
     * @brief Full validation of a response whose connection was restored
     */
    static Status validate(const Message& response, const std::string& request_id);

    /**
     * @brief Responder DID, key and endpoint of a validated response
     */
    static Result<ConnectionTarget> parse(const Message& response);
};

} // namespace connections
} // namespace didagent
