/**
 * @file family_router.hpp
 * @brief Two-level message dispatch: family prefix -> module, @type -> handler
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/errors.hpp"
#include "didagent/message.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace didagent {

/// Outcome of routing: an optional reply, or an error
using RouteResult = Result<std::optional<Message>>;

/// Handler for one exact message type
using MessageHandler = std::function<RouteResult(const Message&)>;

/**
 * @brief Message family handler
 */
class Module {
public:
    virtual ~Module() = default;

    /**
     * @brief Family identifier this module serves
     * @return e.g. "did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/connections/1.0"
     */
    virtual std::string family() const = 0;

    /**
     * @brief Handle a message of this family
     * @return Reply message, std::nullopt for none, or an error
     */
    virtual RouteResult route(const Message& msg) = 0;
};

/**
 * @brief Exact-type dispatch table used inside a module
 */
class SimpleRouter {
public:
    /**
     * @brief Register a handler for an exact @type
     * @return DuplicateRegistration if the type already has a handler
     */
    Status register_handler(const std::string& type, MessageHandler handler);

    /**
     * @brief Invoke the handler registered for msg's @type
     * @return Handler result, or UnroutableMessage
     */
    RouteResult route(const Message& msg) const;

    bool has_handler(const std::string& type) const;

private:
    std::map<std::string, MessageHandler> handlers_;
};

/**
 * @brief Family-level router
 *
 * A message goes to the module with the longest registered family that
 * prefixes its @type and ends on a '/' boundary. Thread-safe.
 */
class FamilyRouter {
public:
    /**
     * @brief Register a module under an explicit family identifier
     * @param family Family identifier (a trailing '/' is ignored)
     * @param module Module instance
     * @return DuplicateRegistration or InvalidArgument
     */
    Status register_module(const std::string& family, std::shared_ptr<Module> module);

    /**
     * @brief Register a module under its own family()
     */
    Status register_module(std::shared_ptr<Module> module);

    /**
     * @brief Route a message to its module
     * @return Module result, or UnroutableMessage when no family matches
     */
    RouteResult route(const Message& msg) const;

    /**
     * @brief Module that would receive a message of this @type
     */
    std::shared_ptr<Module> find_module(const std::string& type) const;

    size_t module_count() const;

private:
    std::map<std::string, std::shared_ptr<Module>> modules_;
    mutable std::mutex mutex_;
};

} // namespace didagent
