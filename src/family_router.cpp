/**
 * @file family_router.cpp
 * @brief Implementation of family and type dispatch
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/family_router.hpp"
#include "didagent/utilities.hpp"

namespace didagent {

// ============================================================================
// SimpleRouter
// ============================================================================

Status SimpleRouter::register_handler(const std::string& type, MessageHandler handler) {
    if (type.empty() || !handler) {
        return Error(ErrorKind::InvalidArgument, "Handler registration needs a type and a callable");
    }

    if (!handlers_.emplace(type, std::move(handler)).second) {
        return Error(ErrorKind::DuplicateRegistration, "Handler already registered for " + type);
    }

    return Status::success();
}

RouteResult SimpleRouter::route(const Message& msg) const {
    auto it = handlers_.find(msg.type());
    if (it == handlers_.end()) {
        return Error(ErrorKind::UnroutableMessage, "No handler for message type '" + msg.type() + "'");
    }
    return it->second(msg);
}

bool SimpleRouter::has_handler(const std::string& type) const {
    return handlers_.count(type) > 0;
}

// ============================================================================
// FamilyRouter
// ============================================================================

Status FamilyRouter::register_module(const std::string& family, std::shared_ptr<Module> module) {
    if (!module) {
        return Error(ErrorKind::InvalidArgument, "Cannot register a null module");
    }

    std::string key = family;
    while (!key.empty() && key.back() == '/') {
        key.pop_back();
    }
    if (key.empty()) {
        return Error(ErrorKind::InvalidArgument, "Family identifier is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!modules_.emplace(key, std::move(module)).second) {
        return Error(ErrorKind::DuplicateRegistration, "Family already registered: " + key);
    }

    utilities::log_debug("FamilyRouter: Registered " + key);
    return Status::success();
}

Status FamilyRouter::register_module(std::shared_ptr<Module> module) {
    if (!module) {
        return Error(ErrorKind::InvalidArgument, "Cannot register a null module");
    }
    std::string family = module->family();
    return register_module(family, std::move(module));
}

std::shared_ptr<Module> FamilyRouter::find_module(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::shared_ptr<Module> best;
    size_t best_length = 0;

    for (const auto& entry : modules_) {
        const std::string& family = entry.first;
        if (type.size() > family.size() &&
            type.compare(0, family.size(), family) == 0 &&
            type[family.size()] == '/' &&
            family.size() > best_length) {
            best = entry.second;
            best_length = family.size();
        }
    }

    return best;
}

RouteResult FamilyRouter::route(const Message& msg) const {
    auto module = find_module(msg.type());
    if (!module) {
        return Error(ErrorKind::UnroutableMessage, "No module for message type '" + msg.type() + "'");
    }
    return module->route(msg);
}

size_t FamilyRouter::module_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_.size();
}

} // namespace didagent
