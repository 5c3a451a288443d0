/**
 * @file handshake_demo.cpp
 * @brief Two in-process agents connect and exchange a basic message
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * alice invites, bob accepts; both run on a LoopbackTransport with
 * ephemeral wallets under a temporary directory.
 */

#include "didagent/agent.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/basic_message.hpp"
#include "didagent/connection_module.hpp"
#include "didagent/utilities.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace didagent;
using namespace std::chrono_literals;

namespace {
    AgentConfig demo_config(const std::string& name, const std::filesystem::path& dir) {
        AgentConfig config;
        config.name = name;
        config.passphrase = name + "-passphrase";
        config.host = name;
        config.ephemeral = true;
        config.storage_dir = dir / name;
        return config;
    }

    bool wait_for_admin(Agent& agent, const std::string& label) {
        auto notice = agent.next_admin_message(5s);
        if (!notice) {
            std::cerr << label << ": no admin notification\n";
            return false;
        }
        std::cout << label << " admin: " << *notice << "\n";
        return true;
    }
}

int main() {
    utilities::initialize_logging("", utilities::LogLevel::WARN);

    if (!AgentCrypto::initialize()) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    auto dir = std::filesystem::temp_directory_path() / ("didagent_demo_" + utilities::generate_uuid());

    try {
        std::cout << "\n=== DIDAgent Handshake Demo ===\n\n";

        auto transport = std::make_shared<LoopbackTransport>();

        Agent alice(demo_config("alice", dir), transport);
        Agent bob(demo_config("bob", dir), transport);

        transport->attach(alice.endpoint(), [&alice](const std::string& wire) { alice.deliver(wire); });
        transport->attach(bob.endpoint(), [&bob](const std::string& wire) { bob.deliver(wire); });

        for (Agent* agent : {&alice, &bob}) {
            auto connected = agent->connect_wallet();
            if (!connected) {
                std::cerr << "Wallet error: " << connected.error().to_string() << "\n";
                return 1;
            }
        }

        auto alice_connections = std::make_shared<ConnectionModule>(alice);
        auto bob_connections = std::make_shared<ConnectionModule>(bob);
        auto alice_messages = std::make_shared<BasicMessageModule>(alice);
        auto bob_messages = std::make_shared<BasicMessageModule>(bob);

        if (!alice.register_module(alice_connections) || !alice.register_module(alice_messages) ||
            !bob.register_module(bob_connections) || !bob.register_module(bob_messages)) {
            std::cerr << "Module registration failed\n";
            return 1;
        }

        alice.start();
        bob.start();

        auto invite = alice_connections->create_invite("alice");
        if (!invite) {
            std::cerr << "Invite error: " << invite.error().to_string() << "\n";
            return 1;
        }
        std::cout << "Invitation: " << *invite << "\n\n";

        auto accepted = bob_connections->receive_invite(*invite, "bob");
        if (!accepted) {
            std::cerr << "Accept error: " << accepted.error().to_string() << "\n";
            return 1;
        }

        if (!wait_for_admin(alice, "alice") || !wait_for_admin(bob, "bob")) {
            return 1;
        }

        auto pairwise = bob.wallet().list_pairwise();
        if (!pairwise || pairwise->empty()) {
            std::cerr << "bob has no pairwise relationship\n";
            return 1;
        }

        auto sent = bob_messages->send(pairwise->front().their_did, "Hello alice");
        if (!sent) {
            std::cerr << "Send error: " << sent.error().to_string() << "\n";
            return 1;
        }

        if (!wait_for_admin(alice, "alice")) {
            return 1;
        }

        alice.stop();
        bob.stop();
        alice.disconnect_wallet();
        bob.disconnect_wallet();

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);

        std::cout << "\nDone.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
