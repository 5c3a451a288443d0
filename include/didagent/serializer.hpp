/**
 * @file serializer.hpp
 * @brief Message <-> wire text conversion
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/message.hpp"
#include "didagent/errors.hpp"

#include <string>

namespace didagent {

/**
 * @brief Lossless JSON serialization of messages
 *
 * Key order is preserved, so deserialize(serialize(m)) == m for every
 * message. The unpack context is never written.
 */
class JsonSerializer {
public:
    /**
     * @brief Serialize message fields to compact JSON
     * @param msg Message to serialize
     * @return UTF-8 JSON text
     */
    static std::string serialize(const Message& msg);

    /**
     * @brief Parse wire text into a message
     * @param text UTF-8 JSON text
     * @return Message, or MalformedWireBytes if the text is oversized, not
     *         JSON or not a JSON object
     */
    static Result<Message> deserialize(const std::string& text);
};

} // namespace didagent
