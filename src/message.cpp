/**
 * @file message.cpp
 * @brief Implementation of the agent protocol message model
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/message.hpp"
#include "didagent/utilities.hpp"

#include <stdexcept>

namespace didagent {

// ============================================================================
// Message
// ============================================================================

Message::Message()
    : fields_(Json::object())
{
}

Message::Message(Json fields)
    : fields_(std::move(fields))
{
    if (!fields_.is_object()) {
        throw std::invalid_argument("Message must be a JSON object");
    }
}

Message Message::create(const std::string& type) {
    Message msg;
    msg["@type"] = type;
    msg["@id"] = MessageHelpers::generate_message_id();
    return msg;
}

std::string Message::type() const {
    auto it = fields_.find("@type");
    if (it == fields_.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool Message::has_type() const {
    auto it = fields_.find("@type");
    return it != fields_.end() && it->is_string();
}

std::string Message::id() const {
    auto it = fields_.find("@id");
    if (it == fields_.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool Message::contains(const std::string& key) const {
    return fields_.contains(key);
}

Json& Message::operator[](const std::string& key) {
    return fields_[key];
}

const Json& Message::at(const std::string& key) const {
    return fields_.at(key);
}

void Message::erase(const std::string& key) {
    fields_.erase(key);
}

const MessageContext& Message::context() const {
    if (!context_) {
        throw std::logic_error("Message has no context (not unpacked)");
    }
    return *context_;
}

void Message::set_context(MessageContext context) {
    context_ = std::move(context);
}

std::string Message::pretty_print() const {
    return fields_.dump(4);
}

// ============================================================================
// Message Types
// ============================================================================

std::string MessageTypeParts::family() const {
    return base_did + ";spec/" + family_name + "/" + version;
}

std::string MessageHelpers::family_identifier(const std::string& family_name, const std::string& version) {
    return std::string(BASE_DID) + ";spec/" + family_name + "/" + version;
}

std::string MessageHelpers::message_type(const std::string& family, const std::string& message_name) {
    if (utilities::ends_with(family, "/")) {
        return family + message_name;
    }
    return family + "/" + message_name;
}

std::optional<MessageTypeParts> MessageHelpers::parse_message_type(const std::string& type) {
    const std::string marker = ";spec/";

    auto marker_pos = type.find(marker);
    if (marker_pos == std::string::npos || marker_pos == 0) {
        return std::nullopt;
    }

    MessageTypeParts parts;
    parts.base_did = type.substr(0, marker_pos);

    // Remainder must be exactly <family>/<version>/<name>
    std::string rest = type.substr(marker_pos + marker.size());
    auto first = rest.find('/');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto second = rest.find('/', first + 1);
    if (second == std::string::npos || rest.find('/', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    parts.family_name = rest.substr(0, first);
    parts.version = rest.substr(first + 1, second - first - 1);
    parts.message_name = rest.substr(second + 1);

    if (parts.family_name.empty() || parts.version.empty() || parts.message_name.empty()) {
        return std::nullopt;
    }

    return parts;
}

std::string MessageHelpers::generate_message_id() {
    return utilities::generate_uuid();
}

} // namespace didagent
