/**
 * @file basic_message.hpp
 * @brief basicmessage/1.0 family: human-readable text between connected agents
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 *   message  {@type, ~l10n: {locale: "en"}, sent_time, content}
 */

#pragma once

#include "didagent/errors.hpp"
#include "didagent/family_router.hpp"
#include "didagent/message.hpp"

#include <string>

namespace didagent {

class Agent;

class BasicMessageModule : public Module {
public:
    static constexpr const char* FAMILY_NAME = "basicmessage";
    static constexpr const char* FAMILY_VERSION = "1.0";
    static constexpr const char* MESSAGE = "message";

    explicit BasicMessageModule(Agent& agent);

    std::string family() const override;
    RouteResult route(const Message& msg) override;

    static std::string message_type();

    /**
     * @brief Build a basic message stamped with the current UTC time
     */
    static Message build(const std::string& content);

    /**
     * @brief Check type, ~l10n locale "en", sent_time and content
     * @return InvalidArgument naming the first bad field
     */
    static Status validate(const Message& msg);

    /**
     * @brief Send a basic message over a pairwise relationship
     */
    Status send(const std::string& their_did, const std::string& content);

private:
    Agent& agent_;
    SimpleRouter router_;

    /// Validate and forward to the admin queue
    RouteResult receive(const Message& msg);
};

} // namespace didagent
