/**
 * @file agent.hpp
 * @brief Agent: wallet, envelope, family router and the inbound processing loop
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Agent coordinates:
 * - Wallet connection (create, open, endpoint identity)
 * - Inbound queue consumed by a single processing thread
 * - Unpack -> route -> reply, one message at a time
 * - Outbound sends over a Transport
 * - Admin channel (outbound admin queue, optionally encrypted)
 */

#pragma once

#include "didagent/agent_config.hpp"
#include "didagent/errors.hpp"
#include "didagent/family_router.hpp"
#include "didagent/message.hpp"
#include "didagent/message_queue.hpp"
#include "didagent/replay_protection.hpp"
#include "didagent/secure_envelope.hpp"
#include "didagent/transport.hpp"
#include "didagent/wallet.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace didagent {

/**
 * @brief Agent statistics
 */
struct AgentStats {
    size_t messages_received;           ///< Wire messages taken off the inbound queue
    size_t messages_routed;             ///< Messages handled by a module
    size_t messages_dropped;            ///< Unpack, routing or handler failures
    size_t messages_sent;               ///< Outbound messages accepted by a peer (202)
    size_t admin_messages;              ///< Messages put on the admin queue
};

/**
 * @brief Agent - owns the wallet and dispatches inbound messages to modules
 *
 * Inbound wire bytes are processed strictly in arrival order by one
 * thread; a failing message is logged and dropped and never stops the
 * loop. Module handlers therefore run one at a time.
 */
class Agent {
public:
    /**
     * @brief Construct an agent
     * @param config Agent configuration (name, host, port, storage)
     * @param transport Outbound transport
     */
    Agent(AgentConfig config, std::shared_ptr<Transport> transport);

    /**
     * @brief Destructor - stops processing and closes the wallet
     */
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    // ========================================================================
    // Wallet
    // ========================================================================

    /**
     * @brief Create (if needed) and open the agent wallet
     *
     * Ephemeral wallets are deleted first. An existing wallet is reused.
     * Opening creates a fresh endpoint identity and marks the agent
     * initialized.
     *
     * @param agent_name Wallet owner; the wallet is "<agent_name>-wallet"
     *        or "<agent_name>-ephemeral_wallet"
     * @param passphrase Wallet passphrase
     * @param ephemeral Start from an empty wallet
     * @return WalletUnavailable when the wallet cannot be opened
     */
    Status connect_wallet(const std::string& agent_name, const std::string& passphrase, bool ephemeral = false);

    /**
     * @brief connect_wallet() with the configured name, passphrase and mode
     */
    Status connect_wallet();

    /**
     * @brief Close the wallet and return to the uninitialized state
     */
    void disconnect_wallet();

    // ========================================================================
    // Processing
    // ========================================================================

    /**
     * @brief Register a module under its family
     * @return DuplicateRegistration when the family is taken
     */
    Status register_module(std::shared_ptr<Module> module);

    /**
     * @brief Enqueue inbound wire bytes (transport delivery callback)
     */
    void deliver(const std::string& wire_bytes);

    /**
     * @brief Start the processing thread
     * @return false if already running
     */
    bool start();

    /**
     * @brief Stop the processing thread; queued messages stay queued
     */
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief Process one wire message: unpack, route, send any reply
     *
     * Every failure is logged with an excerpt of the message and returned;
     * exceptions escaping a handler are caught here.
     */
    Status handle_incoming(const std::string& wire_bytes);

    /**
     * @brief Route an already unpacked message to its module
     */
    RouteResult route_message_to_module(const Message& msg);

    // ========================================================================
    // Sending
    // ========================================================================

    /**
     * @brief Send a message over an established pairwise relationship
     * @param their_did Peer DID
     * @return KeyNotFound for an unknown peer, TransportFailure when the
     *         peer did not accept the message
     */
    Status send_message_to_agent(const std::string& their_did, const Message& msg);

    /**
     * @brief Send a message to a key at an endpoint
     * @param my_verkey Sender key; std::nullopt sends anonymously
     */
    Status send_message_to_endpoint_and_key(const std::string& their_verkey,
                                            const std::string& their_endpoint,
                                            const Message& msg,
                                            const std::optional<std::string>& my_verkey = std::nullopt);

    // ========================================================================
    // Admin channel
    // ========================================================================

    /**
     * @brief Enable encrypted admin messages
     * @param admin_key Verkey of the admin interface
     * @return Provider errors creating the agent's admin key
     */
    Status setup_admin(const std::string& admin_key);

    /**
     * @brief Queue a message for the admin interface
     *
     * Packed from the agent admin key to the admin key once setup_admin()
     * ran, plain JSON otherwise.
     */
    Status send_admin_message(const Message& msg);

    /**
     * @brief Next outbound admin message
     * @return Serialized message, or std::nullopt after the timeout
     */
    std::optional<std::string> next_admin_message(std::chrono::milliseconds timeout);

    // ========================================================================
    // Accessors
    // ========================================================================

    const AgentConfig& config() const { return config_; }

    /// Wallet owner, empty when no wallet is connected
    std::string owner() const;

    bool initialized() const { return initialized_; }

    std::string endpoint() const { return endpoint_; }
    std::string offer_endpoint() const { return offer_endpoint_; }

    /// Verkey of the endpoint identity created by connect_wallet()
    std::string endpoint_verkey() const;

    /// Agent side key of the admin channel, empty before setup_admin()
    std::string agent_admin_key() const;

    Wallet& wallet() { return *wallet_; }
    SecureEnvelope& envelope() { return *envelope_; }
    Transport& transport() { return *transport_; }
    SignatureFreshness& freshness() { return freshness_; }
    FamilyRouter& router() { return router_; }

    AgentStats get_stats() const;

private:
    AgentConfig config_;
    std::shared_ptr<Transport> transport_;
    std::unique_ptr<Wallet> wallet_;
    std::unique_ptr<SecureEnvelope> envelope_;
    FamilyRouter router_;
    SignatureFreshness freshness_;

    std::string endpoint_;
    std::string offer_endpoint_;

    /// Wallet owner and keys, guarded by state_mutex_
    std::string owner_;
    std::string endpoint_vk_;
    std::string admin_key_;
    std::string agent_admin_key_;
    mutable std::mutex state_mutex_;

    std::atomic<bool> initialized_{false};

    MessageQueue<std::string> message_queue_;
    MessageQueue<std::string> outbound_admin_queue_;

    std::atomic<bool> running_{false};
    std::thread processing_thread_;

    std::atomic<size_t> messages_received_{0};
    std::atomic<size_t> messages_routed_{0};
    std::atomic<size_t> messages_dropped_{0};
    std::atomic<size_t> messages_sent_{0};
    std::atomic<size_t> admin_messages_{0};

    void processing_loop();

    /// Send a handler's reply back to the sender of msg
    Status reply(const Message& msg, const Message& response);
};

} // namespace didagent
