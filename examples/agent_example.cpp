/**
 * @file agent_example.cpp
 * @brief HTTP agent with a small command console
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Configuration from DIDAGENT_* variables
 * - Wallet connection and module registration
 * - Receiving wire messages over HTTP
 * - Creating and accepting invitations, sending basic messages
 */

#include "didagent/admin_module.hpp"
#include "didagent/agent.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/basic_message.hpp"
#include "didagent/connection_module.hpp"
#include "didagent/http_transport.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>

using namespace didagent;
using namespace std::chrono_literals;

static std::atomic<bool> g_shutdown(false);

void signal_handler(int signal) {
    (void)signal;
    g_shutdown = true;
}

void print_help() {
    std::cout << "\nCommands:\n";
    std::cout << "  invite <label>          Create an invitation URL\n";
    std::cout << "  accept <url>            Accept an invitation\n";
    std::cout << "  send <did> <text>       Send a basic message\n";
    std::cout << "  state                   Show agent state\n";
    std::cout << "  quit                    Stop the agent\n\n";
}

int main(int argc, char** argv) {
    auto config = AgentConfig::from_environment();
    if (!config) {
        std::cerr << "Configuration error: " << config.error().message << "\n";
        std::cerr << "Set DIDAGENT_PASSPHRASE (and optionally DIDAGENT_NAME, DIDAGENT_PORT, ...)\n";
        return 1;
    }
    if (argc >= 2) {
        config->name = argv[1];
    }

    // A bare file name goes to the data directory's logs/
    std::string log_file = config->log_file;
    if (!log_file.empty() && std::filesystem::path(log_file).is_relative()) {
        try {
            log_file = (security::get_log_directory() / log_file).string();
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Cannot create log directory: " << e.what() << "\n";
            return 1;
        }
    }
    utilities::initialize_logging(log_file,
                                  utilities::parse_log_level(config->log_level).value_or(utilities::LogLevel::INFO));

    if (!AgentCrypto::initialize()) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    try {
        std::cout << "\n=== DIDAgent ===\n\n";

        Agent agent(*config, std::make_shared<HttpTransport>());

        auto connected = agent.connect_wallet();
        if (!connected) {
            std::cerr << "Wallet error: " << connected.error().to_string() << "\n";
            return 1;
        }

        auto connections = std::make_shared<ConnectionModule>(agent);
        auto messages = std::make_shared<BasicMessageModule>(agent);
        auto admin = std::make_shared<AdminModule>(agent, connections);

        for (std::shared_ptr<Module> module : {std::shared_ptr<Module>(connections),
                                               std::shared_ptr<Module>(messages),
                                               std::shared_ptr<Module>(admin)}) {
            auto registered = agent.register_module(module);
            if (!registered) {
                std::cerr << "Module error: " << registered.error().to_string() << "\n";
                return 1;
            }
        }

        HttpListener listener("0.0.0.0", config->port, {"/indy"},
                              [&agent](const std::string& wire_bytes) { agent.deliver(wire_bytes); });
        if (!listener.start()) {
            std::cerr << "Could not listen on port " << config->port << "\n";
            return 1;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        agent.start();

        std::cout << "Agent:     " << agent.owner() << "\n";
        std::cout << "Endpoint:  " << agent.endpoint() << "\n";
        std::cout << "Key:       " << agent.endpoint_verkey() << "\n";

        // Admin notifications
        std::thread admin_printer([&agent]() {
            while (!g_shutdown) {
                auto notice = agent.next_admin_message(500ms);
                if (notice) {
                    std::cout << "\n<<< " << *notice << "\n> ";
                    std::cout.flush();
                }
            }
        });

        print_help();

        std::string line;
        while (!g_shutdown) {
            std::cout << "> ";
            std::cout.flush();
            if (!std::getline(std::cin, line)) {
                break;
            }

            std::istringstream input(line);
            std::string command;
            input >> command;

            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                print_help();
            } else if (command == "invite") {
                std::string label;
                std::getline(input >> std::ws, label);
                auto url = connections->create_invite(label.empty() ? agent.owner() : label);
                if (url) {
                    std::cout << *url << "\n";
                } else {
                    std::cout << "Error: " << url.error().to_string() << "\n";
                }
            } else if (command == "accept") {
                std::string url;
                input >> url;
                auto accepted = connections->receive_invite(url, agent.owner());
                std::cout << (accepted ? "Request sent\n" : "Error: " + accepted.error().to_string() + "\n");
            } else if (command == "send") {
                std::string did;
                std::string text;
                input >> did;
                std::getline(input >> std::ws, text);
                auto sent = messages->send(did, text);
                std::cout << (sent ? "Sent\n" : "Error: " + sent.error().to_string() + "\n");
            } else if (command == "state") {
                auto state = admin->build_state();
                if (state) {
                    std::cout << state->pretty_print() << "\n";
                } else {
                    std::cout << "Error: " << state.error().to_string() << "\n";
                }
            } else if (!command.empty()) {
                std::cout << "Unknown command: " << command << "\n";
            }
        }

        g_shutdown = true;
        admin_printer.join();

        std::cout << "\nShutting down...\n";
        listener.stop();
        agent.stop();
        agent.disconnect_wallet();

        auto stats = agent.get_stats();
        std::cout << "Received " << stats.messages_received << ", dropped " << stats.messages_dropped
                  << ", sent " << stats.messages_sent << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
