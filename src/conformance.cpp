/**
 * @file conformance.cpp
 * @brief Implementation of the conformance harness
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/conformance.hpp"
#include "didagent/handshake.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

using namespace connections;

// ============================================================================
// Bounded waits
// ============================================================================

Result<std::string> expect_message(MessageQueue<std::string>& queue, std::chrono::milliseconds timeout) {
    auto wire = queue.wait_for(timeout);
    if (!wire) {
        return Error(ErrorKind::Timeout,
                     "No message within " + std::to_string(timeout.count()) + " ms");
    }
    return *wire;
}

Status expect_silence(MessageQueue<std::string>& queue, std::chrono::milliseconds timeout) {
    auto wire = queue.wait_for(timeout);
    if (wire) {
        utilities::log_warn("Conformance: Expected silence, got: " + utilities::excerpt(*wire));
        return Error(ErrorKind::UnexpectedMessage,
                     "Message arrived within " + std::to_string(timeout.count()) + " ms");
    }
    return Status::success();
}

// ============================================================================
// ConformanceDriver
// ============================================================================

ConformanceDriver::ConformanceDriver(CryptoProvider& crypto,
                                     IdentityStore& identities,
                                     Transport& transport,
                                     MessageQueue<std::string>& inbound,
                                     std::string endpoint,
                                     std::chrono::milliseconds timeout)
    : crypto_(crypto)
    , identities_(identities)
    , transport_(transport)
    , inbound_(inbound)
    , endpoint_(std::move(endpoint))
    , timeout_(timeout)
    , envelope_(crypto, identities)
{
}

Result<Message> ConformanceDriver::unpack_for(const std::string& wire_bytes, const std::string& expected_to_key) {
    auto msg = envelope_.unpack(wire_bytes);
    if (!msg) {
        return msg.error();
    }

    if (msg->context().to_key != expected_to_key) {
        return Error(ErrorKind::InvalidHandshakeMessage,
                     "Message not encrypted to " + expected_to_key);
    }

    return msg;
}

Result<SuiteConnection> ConformanceDriver::connect_as_invitee(const std::string& invite_url,
                                                              const std::string& label) {
    Invitee invitee(crypto_, envelope_, transport_, label, endpoint_);

    auto received = invitee.receive_invite(invite_url);
    if (!received) {
        return received.error();
    }

    auto sent = invitee.send_request();
    if (!sent) {
        return sent.error();
    }

    auto wire = expect_message(inbound_, timeout_);
    if (!wire) {
        return wire.error();
    }

    auto response = unpack_for(*wire, invitee.my_identity()->verkey);
    if (!response) {
        return response.error();
    }

    auto verified = invitee.handle_response(*response);
    if (!verified) {
        return verified.error();
    }

    auto mine = *invitee.my_identity();
    auto theirs = *invitee.their_identity();

    SuiteConnection connection;
    connection.my_did = mine.did;
    connection.my_verkey = mine.verkey;
    connection.their_did = theirs.did;
    connection.their_verkey = theirs.verkey;
    connection.their_endpoint = theirs.endpoint;

    auto stored = identities_.store_pairwise(
        PairwiseInfo{theirs.did, theirs.verkey, mine.did, theirs.endpoint,
                     invitee.invite()->at("label").get<std::string>()});
    if (!stored) {
        return stored.error();
    }

    utilities::log_info("Conformance: Connected as invitee to " + theirs.did);
    return connection;
}

Result<SuiteConnection> ConformanceDriver::connect_as_inviter(
    const std::string& label,
    const std::function<void(const std::string&)>& deliver_invite) {

    Inviter inviter(crypto_, envelope_, transport_, label, endpoint_);

    auto invite_url = inviter.issue_invite();
    if (!invite_url) {
        return invite_url.error();
    }

    utilities::log_info("Conformance: Invitation " + *invite_url);
    deliver_invite(*invite_url);

    auto wire = expect_message(inbound_, timeout_);
    if (!wire) {
        return wire.error();
    }

    auto request = unpack_for(*wire, inviter.connection_key());
    if (!request) {
        return request.error();
    }

    auto answered = inviter.handle_request(*request);
    if (!answered) {
        return answered.error();
    }

    auto mine = *inviter.my_identity();
    auto theirs = *inviter.their_identity();

    SuiteConnection connection;
    connection.my_did = mine.did;
    connection.my_verkey = mine.verkey;
    connection.their_did = theirs.did;
    connection.their_verkey = theirs.verkey;
    connection.their_endpoint = theirs.endpoint;

    auto stored = identities_.store_pairwise(
        PairwiseInfo{theirs.did, theirs.verkey, mine.did, theirs.endpoint, theirs.label});
    if (!stored) {
        return stored.error();
    }

    utilities::log_info("Conformance: Connected as inviter to " + theirs.did);
    return connection;
}

Status ConformanceDriver::bad_request_is_ignored(const std::string& invite_url) {
    auto invite = Invite::parse(invite_url);
    if (!invite) {
        return invite.error();
    }

    auto identity = crypto_.create_local_identity();
    if (!identity) {
        return identity.error();
    }

    Message request = Request::build("conformance", identity->did, identity->verkey, endpoint_);
    request[CONNECTION].erase(std::string(DID_DOC));

    auto wire = envelope_.pack(request, {invite->at("recipientKeys").at(0).get<std::string>()}, identity->verkey);
    if (!wire) {
        return wire.error();
    }

    auto sent = transport_.send(invite->at("serviceEndpoint").get<std::string>(), *wire);
    if (!sent) {
        return sent.error();
    }

    return expect_silence(inbound_, timeout_);
}

} // namespace didagent
