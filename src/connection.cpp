/**
 * @file connection.cpp
 * @brief Implementation of the connection protocol messages
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/connection.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/security_config.hpp"
#include "didagent/signed_field.hpp"

namespace didagent {
namespace connections {

namespace {
    Error invalid(const std::string& reason) {
        return Error(ErrorKind::InvalidHandshakeMessage, reason);
    }

    bool is_nonempty_string(const Json& object, const char* key) {
        auto it = object.find(key);
        return it != object.end() && it->is_string() && !it->get<std::string>().empty();
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::optional<std::string> percent_decode(const std::string& text) {
        std::string decoded;
        decoded.reserve(text.size());

        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '%') {
                if (i + 2 >= text.size()) {
                    return std::nullopt;
                }
                int high = hex_value(text[i + 1]);
                int low = hex_value(text[i + 2]);
                if (high < 0 || low < 0) {
                    return std::nullopt;
                }
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
            } else {
                decoded.push_back(text[i]);
            }
        }

        return decoded;
    }

    std::optional<std::string> query_parameter(const std::string& url, const std::string& name) {
        auto query_start = url.find('?');
        if (query_start == std::string::npos) {
            return std::nullopt;
        }

        std::string query = url.substr(query_start + 1, url.find('#', query_start) - query_start - 1);

        size_t pos = 0;
        while (pos <= query.size()) {
            size_t end = query.find('&', pos);
            if (end == std::string::npos) {
                end = query.size();
            }

            std::string pair = query.substr(pos, end - pos);
            auto eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == name) {
                return percent_decode(pair.substr(eq + 1));
            }

            pos = end + 1;
        }

        return std::nullopt;
    }

    Status validate_connection(const Message& msg) {
        if (!msg.contains(CONNECTION) || !msg.at(CONNECTION).is_object()) {
            return invalid("Missing connection");
        }

        const Json& connection = msg.at(CONNECTION);
        if (!is_nonempty_string(connection, DID)) {
            return invalid("Missing connection.DID");
        }
        if (!connection.contains(DID_DOC)) {
            return invalid("Missing connection.DIDDoc");
        }

        auto target = DIDDoc::parse(connection.at(DID_DOC), connection.at(DID).get<std::string>());
        if (!target) {
            return target.error();
        }

        return Status::success();
    }

    Result<ConnectionTarget> parse_connection(const Message& msg) {
        auto status = validate_connection(msg);
        if (!status) {
            return status.error();
        }

        const Json& connection = msg.at(CONNECTION);
        return DIDDoc::parse(connection.at(DID_DOC), connection.at(DID).get<std::string>());
    }
}

// ============================================================================
// Identifiers
// ============================================================================

std::string family() {
    return MessageHelpers::family_identifier(FAMILY_NAME, FAMILY_VERSION);
}

std::string invitation_type() {
    return MessageHelpers::message_type(family(), INVITATION);
}

std::string request_type() {
    return MessageHelpers::message_type(family(), REQUEST);
}

std::string response_type() {
    return MessageHelpers::message_type(family(), RESPONSE);
}

// ============================================================================
// DIDDoc
// ============================================================================

Json DIDDoc::build(const std::string& did, const std::string& verkey, const std::string& endpoint) {
    Json public_key = Json::object();
    public_key["id"] = did + "#keys-1";
    public_key["type"] = "Ed25519VerificationKey2018";
    public_key["controller"] = did;
    public_key["publicKeyBase58"] = verkey;

    Json service = Json::object();
    service["id"] = did + ";indy";
    service["type"] = "IndyAgent";
    service["recipientKeys"] = Json::array({verkey});
    service["routingKeys"] = Json::array();
    service["serviceEndpoint"] = endpoint;

    Json doc = Json::object();
    doc["@context"] = "https://w3id.org/did/v1";
    doc["id"] = did;
    doc["publicKey"] = Json::array({public_key});
    doc["service"] = Json::array({service});

    return doc;
}

Result<ConnectionTarget> DIDDoc::parse(const Json& doc, const std::string& did) {
    if (!doc.is_object()) {
        return invalid("DIDDoc is not an object");
    }
    if (!is_nonempty_string(doc, "id") || doc.at("id").get<std::string>() != did) {
        return invalid("DIDDoc id does not match DID " + did);
    }

    auto public_keys = doc.find("publicKey");
    if (public_keys == doc.end() || !public_keys->is_array() || public_keys->empty() ||
        !public_keys->at(0).is_object() || !is_nonempty_string(public_keys->at(0), "publicKeyBase58")) {
        return invalid("DIDDoc has no publicKey");
    }

    auto services = doc.find("service");
    if (services == doc.end() || !services->is_array() || services->empty() ||
        !services->at(0).is_object() || !is_nonempty_string(services->at(0), "serviceEndpoint")) {
        return invalid("DIDDoc has no service endpoint");
    }

    ConnectionTarget target;
    target.did = did;
    target.verkey = public_keys->at(0).at("publicKeyBase58").get<std::string>();
    target.endpoint = services->at(0).at("serviceEndpoint").get<std::string>();

    // Service recipient key must be the published key
    const Json& service = services->at(0);
    auto recipient_keys = service.find("recipientKeys");
    if (recipient_keys == service.end() || !recipient_keys->is_array() || recipient_keys->empty() ||
        !recipient_keys->at(0).is_string() || recipient_keys->at(0).get<std::string>() != target.verkey) {
        return invalid("DIDDoc service key does not match its publicKey");
    }

    return target;
}

// ============================================================================
// Invite
// ============================================================================

Message Invite::build_message(const std::string& label,
                             const std::string& connection_key,
                             const std::string& endpoint) {
    Json fields = Json::object();
    fields["@type"] = invitation_type();
    fields["label"] = label;
    fields["recipientKeys"] = Json::array({connection_key});
    fields["serviceEndpoint"] = endpoint;
    fields["@id"] = MessageHelpers::generate_message_id();

    return Message(std::move(fields));
}

std::string Invite::build(const std::string& label,
                          const std::string& connection_key,
                          const std::string& endpoint) {
    return encode(build_message(label, connection_key, endpoint), endpoint);
}

std::string Invite::encode(const Message& invite, const std::string& endpoint) {
    std::string json_text = invite.fields().dump();
    std::string blob = AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(json_text.begin(), json_text.end()));

    char separator = endpoint.find('?') == std::string::npos ? '?' : '&';
    return endpoint + separator + INVITE_QUERY_PARAM + "=" + blob;
}

Result<Message> Invite::parse(const std::string& url) {
    auto blob = query_parameter(url, INVITE_QUERY_PARAM);
    if (!blob) {
        return invalid("Invitation URL has no c_i parameter");
    }

    auto bytes = AgentCrypto::base64url_to_bytes(*blob);
    if (!bytes) {
        return invalid("Invitation is not base64url");
    }

    Json fields;
    try {
        fields = Json::parse(bytes->begin(), bytes->end());
    } catch (const Json::exception& e) {
        return invalid(std::string("Invitation is not JSON: ") + e.what());
    }

    if (!fields.is_object()) {
        return invalid("Invitation is not a JSON object");
    }

    Message invite(std::move(fields));
    auto status = validate(invite);
    if (!status) {
        return status.error();
    }

    return invite;
}

Status Invite::validate(const Message& invite) {
    if (invite.type() != invitation_type()) {
        return invalid("Not an invitation: '" + invite.type() + "'");
    }
    if (!is_nonempty_string(invite.fields(), "label")) {
        return invalid("Invitation has no label");
    }
    if (!is_nonempty_string(invite.fields(), "serviceEndpoint")) {
        return invalid("Invitation has no serviceEndpoint");
    }

    auto keys = invite.fields().find("recipientKeys");
    if (keys == invite.fields().end() || !keys->is_array() || keys->empty() || !keys->at(0).is_string()) {
        return invalid("Invitation has no recipientKeys");
    }

    return Status::success();
}

// ============================================================================
// Request
// ============================================================================

Message Request::build(const std::string& label,
                       const std::string& my_did,
                       const std::string& my_verkey,
                       const std::string& endpoint) {
    Message request = Message::create(request_type());
    request["label"] = label;

    Json connection = Json::object();
    connection[DID] = my_did;
    connection[DID_DOC] = DIDDoc::build(my_did, my_verkey, endpoint);
    request[CONNECTION] = connection;

    return request;
}

Status Request::validate(const Message& request) {
    if (request.type() != request_type()) {
        return invalid("Not a connection request: '" + request.type() + "'");
    }
    if (request.id().empty()) {
        return invalid("Request has no @id");
    }
    if (!is_nonempty_string(request.fields(), "label")) {
        return invalid("Request has no label");
    }
    if (request.at("label").get<std::string>().size() > security::MAX_LABEL_LENGTH) {
        return invalid("Request label too long");
    }

    return validate_connection(request);
}

Result<ConnectionTarget> Request::parse(const Message& request) {
    auto status = validate(request);
    if (!status) {
        return status.error();
    }

    auto target = parse_connection(request);
    if (target) {
        target->label = request.at("label").get<std::string>();
    }
    return target;
}

// ============================================================================
// Response
// ============================================================================

Message Response::build(const std::string& request_id,
                        const std::string& my_did,
                        const std::string& my_verkey,
                        const std::string& endpoint) {
    Message response;
    response["@type"] = response_type();
    response["@id"] = request_id;

    Json connection = Json::object();
    connection[DID] = my_did;
    connection[DID_DOC] = DIDDoc::build(my_did, my_verkey, endpoint);
    response[CONNECTION] = connection;

    return response;
}

Status Response::validate_pre_sig(const Message& response, const std::string& request_id) {
    if (response.type() != response_type()) {
        return invalid("Not a connection response: '" + response.type() + "'");
    }

    std::string sig_key = std::string(CONNECTION) + SignedField::FIELD_SUFFIX;
    if (!response.contains(sig_key) || !response.at(sig_key).is_object()) {
        return invalid("Response has no " + sig_key);
    }

    const Json& signed_field = response.at(sig_key);
    for (const char* key : {"@type", "signer", "sig_data", "signature"}) {
        if (!is_nonempty_string(signed_field, key)) {
            return invalid(sig_key + " has no " + key);
        }
    }
    if (signed_field.at("@type").get<std::string>() != SignedField::SIGNATURE_TYPE) {
        return invalid(sig_key + " uses an unsupported signature type");
    }

    if (response.id() != request_id) {
        return invalid("Response @id '" + response.id() + "' does not match request '" + request_id + "'");
    }

    return Status::success();
}

Status Response::validate(const Message& response, const std::string& request_id) {
    if (response.type() != response_type()) {
        return invalid("Not a connection response: '" + response.type() + "'");
    }
    if (response.id() != request_id) {
        return invalid("Response @id '" + response.id() + "' does not match request '" + request_id + "'");
    }

    return validate_connection(response);
}

Result<ConnectionTarget> Response::parse(const Message& response) {
    return parse_connection(response);
}

} // namespace connections
} // namespace didagent
