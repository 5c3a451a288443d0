/**
 * @file message.hpp
 * @brief Agent protocol message model for DIDAgent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A Message is an ordered JSON object that always carries an "@type" of the
 * form "<base-did>;spec/<family>/<version>/<name>". Unpacking attaches an
 * out-of-band context (sender/recipient keys and DIDs) that is never
 * serialized.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace didagent {

/// Insertion-ordered JSON value used for all message content
using Json = nlohmann::ordered_json;

/**
 * @brief Key and identity hints attached to a message by unpack
 */
struct MessageContext {
    std::optional<std::string> from_did;    ///< Sender DID, if the sender key is known
    std::optional<std::string> to_did;      ///< Recipient DID, if the key maps to one
    std::optional<std::string> from_key;    ///< Sender verkey (absent when anonymous)
    std::string to_key;                     ///< Recipient verkey (empty for plaintext)

    bool operator==(const MessageContext& other) const {
        return from_did == other.from_did && to_did == other.to_did &&
               from_key == other.from_key && to_key == other.to_key;
    }
};

/**
 * @brief Protocol message: ordered, key-unique mapping plus unpack context
 */
class Message {
public:
    /**
     * @brief Construct an empty message
     */
    Message();

    /**
     * @brief Construct from a JSON object
     * @param fields Message fields
     * @throws std::invalid_argument if fields is not a JSON object
     */
    explicit Message(Json fields);

    /**
     * @brief Create a message of the given type with a fresh "@id"
     * @param type Full message type URI
     */
    static Message create(const std::string& type);

    /// "@type" value, or empty string when absent or not a string
    std::string type() const;

    /// Whether "@type" is present as a string
    bool has_type() const;

    /// "@id" value, or empty string when absent or not a string
    std::string id() const;

    bool contains(const std::string& key) const;

    /**
     * @brief Access or insert a field
     */
    Json& operator[](const std::string& key);

    /**
     * @brief Read a field
     * @throws nlohmann::json::out_of_range if the key is missing
     */
    const Json& at(const std::string& key) const;

    /**
     * @brief Remove a field (no-op when absent)
     */
    void erase(const std::string& key);

    const Json& fields() const { return fields_; }
    Json& fields() { return fields_; }

    // ========================================================================
    // Unpack context
    // ========================================================================

    bool has_context() const { return context_.has_value(); }

    /**
     * @brief Context attached by unpack
     * @throws std::logic_error if the message was never unpacked
     */
    const MessageContext& context() const;

    void set_context(MessageContext context);

    /**
     * @brief Indented JSON rendering for logs
     */
    std::string pretty_print() const;

    /// Field-wise equality; the context does not take part
    bool operator==(const Message& other) const { return fields_ == other.fields_; }
    bool operator!=(const Message& other) const { return !(*this == other); }

private:
    Json fields_;
    std::optional<MessageContext> context_;
};

/**
 * @brief Components of a message type URI
 */
struct MessageTypeParts {
    std::string base_did;       ///< e.g. "did:sov:BzCbsNYhMrjHiqZDTUASHg"
    std::string family_name;    ///< e.g. "connections"
    std::string version;        ///< e.g. "1.0"
    std::string message_name;   ///< e.g. "request"

    /// Family identifier: "<base_did>;spec/<family_name>/<version>"
    std::string family() const;
};

/**
 * @brief Helper functions for message types and identifiers
 */
class MessageHelpers {
public:
    /// Base DID that scopes every family defined by this agent
    static constexpr const char* BASE_DID = "did:sov:BzCbsNYhMrjHiqZDTUASHg";

    /**
     * @brief Build a family identifier
     * @param family_name Family name (e.g. "connections")
     * @param version Family version (e.g. "1.0")
     * @return "<BASE_DID>;spec/<family_name>/<version>"
     */
    static std::string family_identifier(const std::string& family_name, const std::string& version);

    /**
     * @brief Build a full message type from a family identifier and a name
     */
    static std::string message_type(const std::string& family, const std::string& message_name);

    /**
     * @brief Split a message type URI into its components
     * @return Parts, or std::nullopt if the type is not "<did>;spec/<f>/<v>/<n>"
     */
    static std::optional<MessageTypeParts> parse_message_type(const std::string& type);

    /**
     * @brief Generate unique message ID (UUID v4)
     */
    static std::string generate_message_id();
};

} // namespace didagent
