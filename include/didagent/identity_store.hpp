/**
 * @file identity_store.hpp
 * @brief Identity Store capability: local DIDs and pairwise relationships
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "didagent/errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace didagent {

/**
 * @brief Relationship established by a completed handshake
 */
struct PairwiseInfo {
    std::string their_did;
    std::string their_verkey;
    std::string my_did;
    std::string their_endpoint;
    std::string label;          ///< Peer's human-readable label
};

/**
 * @brief Lookup of identities and relationships
 */
class IdentityStore {
public:
    virtual ~IdentityStore() = default;

    /**
     * @brief Resolve a verkey to a DID (local or pairwise peer)
     * @return DID, std::nullopt when the key is unknown, or WalletUnavailable
     */
    virtual Result<std::optional<std::string>> verkey_to_did(const std::string& verkey) = 0;

    /**
     * @brief Verkey of a local DID
     * @return Verkey, or KeyNotFound
     */
    virtual Result<std::string> local_key_for_did(const std::string& did) = 0;

    /**
     * @brief Relationship with a peer DID
     * @return PairwiseInfo, or KeyNotFound
     */
    virtual Result<PairwiseInfo> pairwise_info(const std::string& their_did) = 0;

    /**
     * @brief Insert or replace a relationship
     */
    virtual Status store_pairwise(const PairwiseInfo& info) = 0;

    /**
     * @brief All stored relationships, oldest first
     */
    virtual Result<std::vector<PairwiseInfo>> list_pairwise() = 0;
};

} // namespace didagent
