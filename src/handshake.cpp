/**
 * @file handshake.cpp
 * @brief Implementation of the connection handshake roles
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/handshake.hpp"
#include "didagent/security_config.hpp"
#include "didagent/signed_field.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

using namespace connections;

namespace {
    Status send_packed(SecureEnvelope& envelope,
                       Transport& transport,
                       const Message& msg,
                       const std::string& their_verkey,
                       const std::string& my_verkey,
                       const std::string& endpoint) {
        auto wire = envelope.pack(msg, {their_verkey}, my_verkey);
        if (!wire) {
            return wire.error();
        }

        auto status = transport.send(endpoint, *wire);
        if (!status) {
            return status.error();
        }
        if (*status != security::HTTP_ACCEPTED) {
            return Error(ErrorKind::TransportFailure,
                         endpoint + " answered " + std::to_string(*status));
        }

        return Status::success();
    }
}

const char* inviter_state_to_string(InviterState state) {
    switch (state) {
        case InviterState::Idle: return "Idle";
        case InviterState::InviteIssued: return "InviteIssued";
        case InviterState::AwaitingRequest: return "AwaitingRequest";
        case InviterState::RequestValidated: return "RequestValidated";
        case InviterState::ResponseSent: return "ResponseSent";
        default: return "Unknown";
    }
}

const char* invitee_state_to_string(InviteeState state) {
    switch (state) {
        case InviteeState::Idle: return "Idle";
        case InviteeState::InviteParsed: return "InviteParsed";
        case InviteeState::RequestSent: return "RequestSent";
        case InviteeState::AwaitingResponse: return "AwaitingResponse";
        case InviteeState::ResponseVerified: return "ResponseVerified";
        default: return "Unknown";
    }
}

// ============================================================================
// Inviter
// ============================================================================

Inviter::Inviter(CryptoProvider& crypto,
                 SecureEnvelope& envelope,
                 Transport& transport,
                 std::string label,
                 std::string endpoint)
    : crypto_(crypto)
    , envelope_(envelope)
    , transport_(transport)
    , label_(std::move(label))
    , endpoint_(std::move(endpoint))
{
}

Result<std::string> Inviter::issue_invite() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != InviterState::Idle) {
        return Error(ErrorKind::InvalidArgument, "Invitation already issued");
    }

    auto key = crypto_.create_key();
    if (!key) {
        return key.error();
    }

    connection_key_ = *key;
    invite_ = Invite::build_message(label_, connection_key_, endpoint_);
    state_ = InviterState::InviteIssued;

    utilities::log_info("Inviter: Issued invitation '" + label_ + "' with key " + connection_key_);
    return Invite::encode(*invite_, endpoint_);
}

Status Inviter::handle_request(const Message& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == InviterState::InviteIssued) {
        state_ = InviterState::AwaitingRequest;
    }
    if (state_ != InviterState::AwaitingRequest) {
        return Error(ErrorKind::InvalidHandshakeMessage,
                     std::string("Request not expected in state ") + inviter_state_to_string(state_));
    }

    auto drop = [&request](const std::string& reason) {
        utilities::log_warn("Inviter: Ignoring invalid request (" + reason + "): " +
                            utilities::excerpt(request.fields().dump()));
        return Error(ErrorKind::InvalidHandshakeMessage, reason);
    };

    if (request.has_context() && !request.context().to_key.empty() &&
        request.context().to_key != connection_key_) {
        return drop("addressed to " + request.context().to_key + ", not the invitation key");
    }

    auto requester = Request::parse(request);
    if (!requester) {
        return drop(requester.error().message);
    }

    if (request.has_context() && request.context().from_key &&
        *request.context().from_key != requester->verkey) {
        return drop("DIDDoc key does not match the envelope sender");
    }

    state_ = InviterState::RequestValidated;
    their_identity_ = *requester;

    auto identity = crypto_.create_local_identity();
    if (!identity) {
        return identity.error();
    }
    my_identity_ = *identity;

    Message response = Response::build(request.id(), identity->did, identity->verkey, endpoint_);

    auto signed_status = SignedField::sign_message_field(crypto_, response, CONNECTION, connection_key_);
    if (!signed_status) {
        return signed_status;
    }

    auto sent = send_packed(envelope_, transport_, response,
                            requester->verkey, identity->verkey, requester->endpoint);
    if (!sent) {
        utilities::log_error("Inviter: Response delivery failed: " + sent.error().message);
        return sent;
    }

    state_ = InviterState::ResponseSent;
    utilities::log_info("Inviter: Sent response to " + requester->did + " at " + requester->endpoint);
    return Status::success();
}

InviterState Inviter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Inviter::connection_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_key_;
}

std::optional<Message> Inviter::invite() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invite_;
}

std::optional<LocalIdentity> Inviter::my_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return my_identity_;
}

std::optional<ConnectionTarget> Inviter::their_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return their_identity_;
}

// ============================================================================
// Invitee
// ============================================================================

Invitee::Invitee(CryptoProvider& crypto,
                 SecureEnvelope& envelope,
                 Transport& transport,
                 std::string label,
                 std::string endpoint,
                 SignatureFreshness* freshness)
    : crypto_(crypto)
    , envelope_(envelope)
    , transport_(transport)
    , label_(std::move(label))
    , endpoint_(std::move(endpoint))
    , freshness_(freshness)
{
}

Status Invitee::receive_invite(const std::string& invite_url) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != InviteeState::Idle) {
        return Error(ErrorKind::InvalidArgument, "Invitation already received");
    }

    auto invite = Invite::parse(invite_url);
    if (!invite) {
        utilities::log_warn("Invitee: Bad invitation: " + invite.error().message);
        return invite.error();
    }

    invite_ = *invite;
    state_ = InviteeState::InviteParsed;

    utilities::log_info("Invitee: Parsed invitation '" + invite_->at("label").get<std::string>() + "'");
    return Status::success();
}

Status Invitee::send_request(const std::optional<std::string>& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != InviteeState::InviteParsed) {
        return Error(ErrorKind::InvalidArgument,
                     std::string("Cannot send a request in state ") + invitee_state_to_string(state_));
    }

    auto identity = crypto_.create_local_identity();
    if (!identity) {
        return identity.error();
    }

    Message request = Request::build(label_, identity->did, identity->verkey, endpoint_);
    if (request_id) {
        request["@id"] = *request_id;
    }

    std::string inviter_key = invite_->at("recipientKeys").at(0).get<std::string>();
    std::string inviter_endpoint = invite_->at("serviceEndpoint").get<std::string>();

    my_identity_ = *identity;
    request_ = request;

    auto sent = send_packed(envelope_, transport_, request, inviter_key, identity->verkey, inviter_endpoint);
    if (!sent) {
        utilities::log_error("Invitee: Request delivery failed: " + sent.error().message);
        return sent;
    }

    state_ = InviteeState::RequestSent;
    utilities::log_info("Invitee: Sent request " + request.id() + " to " + inviter_endpoint);

    state_ = InviteeState::AwaitingResponse;
    return Status::success();
}

Status Invitee::handle_response(const Message& response) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != InviteeState::AwaitingResponse) {
        return Error(ErrorKind::InvalidHandshakeMessage,
                     std::string("Response not expected in state ") + invitee_state_to_string(state_));
    }

    auto reject = [&response](const Error& error) {
        utilities::log_warn("Invitee: Rejected response (" + error.to_string() + "): " +
                            utilities::excerpt(response.fields().dump()));
        return error;
    };

    // Only an envelope opened with the key sent in the Request counts
    const std::string& my_verkey = my_identity_->verkey;
    if (!response.has_context() || response.context().to_key.empty()) {
        return reject(Error(ErrorKind::InvalidHandshakeMessage, "Response was not encrypted"));
    }
    if (response.context().to_key != my_verkey) {
        return reject(Error(ErrorKind::InvalidHandshakeMessage,
                            "Response addressed to " + response.context().to_key + ", not " + my_verkey));
    }

    // Shape and thread before touching the signature
    auto shape = Response::validate_pre_sig(response, request_->id());
    if (!shape) {
        return reject(shape.error());
    }

    Message restored = response;
    auto field = SignedField::unpack_message_field(crypto_, restored, CONNECTION);
    if (!field) {
        return reject(field.error());
    }

    if (!field->verified) {
        return reject(Error(ErrorKind::SignatureVerificationFailed, "connection~sig did not verify"));
    }

    std::string invitation_key = invite_->at("recipientKeys").at(0).get<std::string>();
    if (field->signer != invitation_key) {
        return reject(Error(ErrorKind::SignatureVerificationFailed,
                            "connection~sig signed by " + field->signer + ", not the invitation key"));
    }

    auto full = Response::validate(restored, request_->id());
    if (!full) {
        return reject(full.error());
    }

    auto inviter = Response::parse(restored);
    if (!inviter) {
        return reject(inviter.error());
    }

    const auto& sender = response.context().from_key;
    if (!sender || *sender != inviter->verkey) {
        return reject(Error(ErrorKind::InvalidHandshakeMessage, "DIDDoc key does not match the envelope sender"));
    }

    // Records the signature as seen, so it runs last
    if (freshness_) {
        auto fresh = freshness_->check(*field);
        if (!fresh) {
            return reject(fresh.error());
        }
    }

    response_ = restored;
    their_identity_ = *inviter;
    state_ = InviteeState::ResponseVerified;

    utilities::log_info("Invitee: Connection with " + inviter->did + " verified");
    return Status::success();
}

InviteeState Invitee::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Message> Invitee::invite() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invite_;
}

std::optional<Message> Invitee::request() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_;
}

std::optional<Message> Invitee::response() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_;
}

std::optional<LocalIdentity> Invitee::my_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return my_identity_;
}

std::optional<ConnectionTarget> Invitee::their_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return their_identity_;
}

} // namespace didagent
