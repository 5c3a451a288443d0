/**
 * @file basic_message.cpp
 * @brief Implementation of the basicmessage family
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/basic_message.hpp"
#include "didagent/admin_module.hpp"
#include "didagent/agent.hpp"
#include "didagent/utilities.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace didagent {

namespace {
    /// "2025-11-10 15:30:45.123456+00:00"
    std::string utc_sent_time() {
        auto now = std::chrono::system_clock::now();
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count() % 1000000;

        std::time_t time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
        gmtime_r(&time, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setw(6) << std::setfill('0') << micros
            << "+00:00";
        return oss.str();
    }

    Error invalid(const std::string& reason) {
        return Error(ErrorKind::InvalidArgument, "Basic message: " + reason);
    }
}

BasicMessageModule::BasicMessageModule(Agent& agent)
    : agent_(agent)
{
    auto status = router_.register_handler(message_type(),
                                           [this](const Message& msg) { return receive(msg); });
    if (!status) {
        throw std::logic_error(status.error().to_string());
    }
}

std::string BasicMessageModule::family() const {
    return MessageHelpers::family_identifier(FAMILY_NAME, FAMILY_VERSION);
}

RouteResult BasicMessageModule::route(const Message& msg) {
    return router_.route(msg);
}

std::string BasicMessageModule::message_type() {
    return MessageHelpers::message_type(MessageHelpers::family_identifier(FAMILY_NAME, FAMILY_VERSION), MESSAGE);
}

Message BasicMessageModule::build(const std::string& content) {
    Message msg;
    msg["@type"] = message_type();
    msg["~l10n"] = {{"locale", "en"}};
    msg["sent_time"] = utc_sent_time();
    msg["content"] = content;
    return msg;
}

Status BasicMessageModule::validate(const Message& msg) {
    if (msg.type() != message_type()) {
        return invalid("unexpected @type '" + msg.type() + "'");
    }
    if (!msg.contains("~l10n") || !msg.at("~l10n").is_object()) {
        return invalid("missing ~l10n");
    }

    const Json& l10n = msg.at("~l10n");
    auto locale = l10n.find("locale");
    if (locale == l10n.end() || !locale->is_string() || locale->get<std::string>() != "en") {
        return invalid("locale is not 'en'");
    }

    if (!msg.contains("sent_time") || !msg.at("sent_time").is_string()) {
        return invalid("missing sent_time");
    }
    if (!msg.contains("content") || !msg.at("content").is_string()) {
        return invalid("missing content");
    }

    return Status::success();
}

Status BasicMessageModule::send(const std::string& their_did, const std::string& content) {
    return agent_.send_message_to_agent(their_did, build(content));
}

RouteResult BasicMessageModule::receive(const Message& msg) {
    auto status = validate(msg);
    if (!status) {
        return status.error();
    }

    std::optional<std::string> from_did;
    if (msg.has_context()) {
        from_did = msg.context().from_did;
    }

    utilities::log_info("BasicMessageModule: Message from " + from_did.value_or("unknown sender"));

    Message notice = Message::create(admin::message_type(admin::BASICMESSAGE_RECEIVED));
    Json content = Json::object();
    content["from"] = from_did ? Json(*from_did) : Json(nullptr);
    content["sent_time"] = msg.at("sent_time");
    content["content"] = msg.at("content");
    notice["content"] = content;

    auto forwarded = agent_.send_admin_message(notice);
    if (!forwarded) {
        return forwarded.error();
    }

    return RouteResult(std::nullopt);
}

} // namespace didagent
