/**
 * @file agent.cpp
 * @brief Implementation of the agent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/agent.hpp"
#include "didagent/security_config.hpp"
#include "didagent/serializer.hpp"
#include "didagent/utilities.hpp"

#include <stdexcept>

namespace didagent {

using namespace didagent::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

Agent::Agent(AgentConfig config, std::shared_ptr<Transport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , wallet_(std::make_unique<Wallet>(config_.wallet_directory()))
    , envelope_(std::make_unique<SecureEnvelope>(*wallet_, *wallet_))
    , freshness_(config_.signature_max_age)
    , endpoint_(config_.endpoint())
    , offer_endpoint_(config_.offer_endpoint())
{
    if (!transport_) {
        throw std::invalid_argument("Agent requires a transport");
    }
    if (!security::validate_identifier(config_.name)) {
        throw std::invalid_argument("Invalid agent name: " + config_.name);
    }

    log_info("Agent: Initializing agent '" + config_.name + "' at " + endpoint_);
}

Agent::~Agent() {
    if (running_) {
        stop();
    }
    wallet_->close();
}

// ============================================================================
// Wallet
// ============================================================================

Status Agent::connect_wallet(const std::string& agent_name, const std::string& passphrase, bool ephemeral) {
    std::string wallet_name = AgentConfig::wallet_name_for(agent_name, ephemeral);

    if (ephemeral) {
        if (wallet_->is_open() && wallet_->name() == wallet_name) {
            wallet_->close();
        }

        auto removed = wallet_->remove(wallet_name);
        if (removed) {
            log_info("Agent: Removed ephemeral wallet '" + wallet_name + "'");
        } else if (removed.error().kind != ErrorKind::WalletNotFound) {
            log_warn("Agent: Could not remove ephemeral wallet: " + removed.error().to_string());
        }
    }

    auto created = wallet_->create(wallet_name, passphrase);
    if (!created && created.error().kind != ErrorKind::WalletAlreadyExists) {
        log_warn("Agent: Could not create wallet: " + created.error().to_string());
    }

    auto opened = wallet_->open(wallet_name, passphrase);
    if (!opened) {
        log_error("Agent: Could not open wallet '" + wallet_name + "': " + opened.error().to_string());
        initialized_ = false;
        return Error(ErrorKind::WalletUnavailable, "Could not open wallet '" + wallet_name + "'");
    }

    auto identity = wallet_->create_local_identity();
    if (!identity) {
        log_error("Agent: Could not create endpoint identity: " + identity.error().to_string());
        wallet_->close();
        initialized_ = false;
        return Error(ErrorKind::WalletUnavailable, identity.error().message);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        owner_ = agent_name;
        endpoint_vk_ = identity->verkey;
        agent_admin_key_.clear();
    }
    initialized_ = true;

    log_info("Agent: Wallet '" + wallet_name + "' connected, endpoint key " + identity->verkey);
    return Status::success();
}

Status Agent::connect_wallet() {
    return connect_wallet(config_.name, config_.passphrase, config_.ephemeral);
}

void Agent::disconnect_wallet() {
    wallet_->close();
    initialized_ = false;

    std::lock_guard<std::mutex> lock(state_mutex_);
    owner_.clear();
    endpoint_vk_.clear();
    agent_admin_key_.clear();

    log_info("Agent: Wallet disconnected");
}

// ============================================================================
// Processing
// ============================================================================

Status Agent::register_module(std::shared_ptr<Module> module) {
    if (!module) {
        return Error(ErrorKind::InvalidArgument, "Null module");
    }

    auto status = router_.register_module(module);
    if (status) {
        log_info("Agent: Registered module " + module->family());
    }
    return status;
}

void Agent::deliver(const std::string& wire_bytes) {
    if (!message_queue_.push(wire_bytes)) {
        log_warn("Agent: Inbound queue closed, dropping message");
    }
}

bool Agent::start() {
    if (running_) {
        log_warn("Agent: Already running");
        return false;
    }

    running_ = true;
    message_queue_.resume();
    processing_thread_ = std::thread([this]() { processing_loop(); });

    log_info("Agent: Processing started");
    return true;
}

void Agent::stop() {
    if (!running_) {
        log_warn("Agent: Not running");
        return;
    }

    running_ = false;
    message_queue_.interrupt();
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }

    log_info("Agent: Processing stopped, " + std::to_string(message_queue_.size()) + " message(s) queued");
}

void Agent::processing_loop() {
    while (running_) {
        auto wire_bytes = message_queue_.pop();
        if (!wire_bytes) {
            continue;
        }

        auto status = handle_incoming(*wire_bytes);
        if (!status) {
            log_debug("Agent: Message finished with " + status.error().to_string());
        }
    }
}

Status Agent::handle_incoming(const std::string& wire_bytes) {
    messages_received_++;

    try {
        auto msg = envelope_->unpack(wire_bytes);
        if (!msg) {
            messages_dropped_++;
            log_warn("Agent: Dropping message (" + msg.error().to_string() + "): " + excerpt(wire_bytes));
            return msg.error();
        }

        log_debug("Agent: Received " + msg->type());

        auto result = route_message_to_module(*msg);
        if (!result) {
            messages_dropped_++;
            log_warn("Agent: Dropping " + msg->type() + " (" + result.error().to_string() + "): " +
                     excerpt(msg->fields().dump()));
            return result.error();
        }

        messages_routed_++;

        if (result->has_value()) {
            return reply(*msg, **result);
        }
        return Status::success();

    } catch (const std::exception& e) {
        messages_dropped_++;
        log_error("Agent: Message processing failed: " + std::string(e.what()) + ": " + excerpt(wire_bytes));
        return Error(ErrorKind::InvalidArgument, std::string("Message processing failed: ") + e.what());
    }
}

RouteResult Agent::route_message_to_module(const Message& msg) {
    return router_.route(msg);
}

Status Agent::reply(const Message& msg, const Message& response) {
    if (!msg.has_context() || !msg.context().from_did) {
        log_warn("Agent: No relationship to reply to " + msg.type() + " over, dropping " + response.type());
        return Error(ErrorKind::KeyNotFound, "Sender of " + msg.type() + " is unknown");
    }

    return send_message_to_agent(*msg.context().from_did, response);
}

// ============================================================================
// Sending
// ============================================================================

Status Agent::send_message_to_agent(const std::string& their_did, const Message& msg) {
    if (!initialized_) {
        return Error(ErrorKind::WalletUnavailable, "No wallet connected");
    }

    auto info = wallet_->pairwise_info(their_did);
    if (!info) {
        log_warn("Agent: No pairwise relationship with " + their_did);
        return info.error();
    }

    auto my_verkey = wallet_->local_key_for_did(info->my_did);
    if (!my_verkey) {
        return my_verkey.error();
    }

    return send_message_to_endpoint_and_key(info->their_verkey, info->their_endpoint, msg, *my_verkey);
}

Status Agent::send_message_to_endpoint_and_key(const std::string& their_verkey,
                                               const std::string& their_endpoint,
                                               const Message& msg,
                                               const std::optional<std::string>& my_verkey) {
    log_debug("Agent: Sending " + msg.type() + " to " + their_endpoint);

    auto wire = envelope_->pack(msg, {their_verkey}, my_verkey);
    if (!wire) {
        log_error("Agent: Could not pack " + msg.type() + ": " + wire.error().to_string());
        return wire.error();
    }

    auto status = transport_->send(their_endpoint, *wire);
    if (!status) {
        log_error("Agent: Sending to " + their_endpoint + " failed: " + status.error().to_string());
        return status.error();
    }
    if (*status != security::HTTP_ACCEPTED) {
        log_warn("Agent: " + their_endpoint + " answered " + std::to_string(*status));
        return Error(ErrorKind::TransportFailure,
                     their_endpoint + " answered " + std::to_string(*status));
    }

    messages_sent_++;
    return Status::success();
}

// ============================================================================
// Admin channel
// ============================================================================

Status Agent::setup_admin(const std::string& admin_key) {
    auto key = wallet_->create_key();
    if (!key) {
        return key.error();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        admin_key_ = admin_key;
        agent_admin_key_ = *key;
    }

    log_info("Agent: Admin key " + *key);
    return Status::success();
}

Status Agent::send_admin_message(const Message& msg) {
    std::string admin_key;
    std::string agent_admin_key;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        admin_key = admin_key_;
        agent_admin_key = agent_admin_key_;
    }

    std::string outbound;
    if (!admin_key.empty() && !agent_admin_key.empty()) {
        auto wire = envelope_->pack(msg, {admin_key}, agent_admin_key);
        if (!wire) {
            log_error("Agent: Could not pack admin message: " + wire.error().to_string());
            return wire.error();
        }
        outbound = *wire;
    } else {
        outbound = JsonSerializer::serialize(msg);
    }

    if (!outbound_admin_queue_.push(std::move(outbound))) {
        return Error(ErrorKind::TransportFailure, "Admin queue closed");
    }

    admin_messages_++;
    return Status::success();
}

std::optional<std::string> Agent::next_admin_message(std::chrono::milliseconds timeout) {
    return outbound_admin_queue_.wait_for(timeout);
}

// ============================================================================
// Accessors
// ============================================================================

std::string Agent::owner() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return owner_;
}

std::string Agent::endpoint_verkey() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return endpoint_vk_;
}

std::string Agent::agent_admin_key() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return agent_admin_key_;
}

AgentStats Agent::get_stats() const {
    AgentStats stats;
    stats.messages_received = messages_received_;
    stats.messages_routed = messages_routed_;
    stats.messages_dropped = messages_dropped_;
    stats.messages_sent = messages_sent_;
    stats.admin_messages = admin_messages_;
    return stats;
}

} // namespace didagent
