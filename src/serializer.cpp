/**
 * @file serializer.cpp
 * @brief Implementation of message serialization
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/serializer.hpp"
#include "didagent/security_config.hpp"

namespace didagent {

std::string JsonSerializer::serialize(const Message& msg) {
    return msg.fields().dump();
}

Result<Message> JsonSerializer::deserialize(const std::string& text) {
    if (text.size() > security::MAX_MESSAGE_SIZE) {
        return Error(ErrorKind::MalformedWireBytes,
                     "Message exceeds " + std::to_string(security::MAX_MESSAGE_SIZE) + " bytes");
    }

    try {
        Json j = Json::parse(text);
        if (!j.is_object()) {
            return Error(ErrorKind::MalformedWireBytes, "Message is not a JSON object");
        }
        return Message(std::move(j));

    } catch (const Json::exception& e) {
        return Error(ErrorKind::MalformedWireBytes, std::string("Invalid JSON: ") + e.what());
    }
}

} // namespace didagent
