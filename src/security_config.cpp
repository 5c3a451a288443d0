/**
 * @file security_config.cpp
 * @brief Storage locations and input validation
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/security_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace didagent {
namespace security {

namespace {
    constexpr const char* DEFAULT_DATA_DIRECTORY = "/var/lib/didagent";

    std::filesystem::path ensure_directory(std::filesystem::path dir) {
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }
        return dir;
    }
}

// ============================================================================
// Storage Locations
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* configured = std::getenv("DIDAGENT_DATA_DIR");
    if (configured != nullptr && *configured != '\0') {
        return ensure_directory(configured);
    }
    return ensure_directory(DEFAULT_DATA_DIRECTORY);
}

std::filesystem::path get_wallet_directory() {
    return ensure_directory(get_data_directory() / "wallets");
}

std::filesystem::path get_log_directory() {
    return ensure_directory(get_data_directory() / "logs");
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    return std::all_of(identifier.begin(), identifier.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
    });
}

bool validate_label(const std::string& label, size_t max_length) {
    if (label.empty() || label.length() > max_length) {
        return false;
    }

    return std::none_of(label.begin(), label.end(), [](char c) {
        return std::iscntrl(static_cast<unsigned char>(c)) != 0;
    });
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        auto resolved = std::filesystem::weakly_canonical(path);
        auto base = std::filesystem::weakly_canonical(base_dir);

        // Compare component by component so "/data_other" is not inside "/data"
        auto mismatch = std::mismatch(base.begin(), base.end(), resolved.begin(), resolved.end());
        if (mismatch.first != base.end()) {
            // weakly_canonical keeps a trailing separator as an empty last element
            return mismatch.first->empty() && std::next(mismatch.first) == base.end();
        }

        return true;

    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

} // namespace security
} // namespace didagent
