/**
 * @file wallet.hpp
 * @brief SQLite-backed wallet: keys, DIDs, pairwise relationships, envelopes
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * One wallet is one SQLite file <storage_dir>/<name>.db. Secret keys are
 * encrypted at rest with a key derived from the wallet passphrase
 * (Argon2id); a sealed check value detects a wrong passphrase on open.
 */

#pragma once

#include "didagent/agent_crypto.hpp"
#include "didagent/crypto_provider.hpp"
#include "didagent/identity_store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace didagent {

/**
 * @brief Wallet - CryptoProvider and IdentityStore over an encrypted SQLite file
 *
 * Every operation other than create(), remove() and verify() requires an
 * open wallet and returns WalletUnavailable otherwise. Thread-safe.
 */
class Wallet : public CryptoProvider, public IdentityStore {
public:
    /**
     * @brief Construct a wallet manager rooted at a storage directory
     * @param storage_dir Directory holding wallet files (created on demand)
     */
    explicit Wallet(std::filesystem::path storage_dir);

    ~Wallet() override;

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Create a new wallet file
     * @param name Wallet name (alphanumeric, underscore, hyphen)
     * @param passphrase Passphrase protecting the secret keys
     * @return WalletAlreadyExists if the file exists, InvalidArgument for a
     *         bad name, WalletUnavailable on storage failure
     */
    Status create(const std::string& name, const std::string& passphrase);

    /**
     * @brief Open an existing wallet (closes any wallet already open)
     * @return WalletNotFound if missing, WalletUnavailable on a wrong
     *         passphrase or storage failure
     */
    Status open(const std::string& name, const std::string& passphrase);

    /**
     * @brief Close the open wallet and wipe the storage key
     */
    void close();

    /**
     * @brief Delete a wallet file
     * @return WalletNotFound if missing
     */
    Status remove(const std::string& name);

    bool exists(const std::string& name) const;
    bool is_open() const;

    /// Name of the open wallet, empty when closed
    std::string name() const;

    // ========================================================================
    // CryptoProvider
    // ========================================================================

    Result<std::vector<uint8_t>> sign(const std::string& verkey, const std::vector<uint8_t>& data) override;

    bool verify(const std::string& verkey,
                const std::vector<uint8_t>& data,
                const std::vector<uint8_t>& signature) override;

    /**
     * @brief Pack plaintext into a JWE-like JSON envelope
     *
     * A content key encrypts the plaintext (ChaCha20-Poly1305, AAD = the
     * protected header text). Per recipient the content key is wrapped with
     * crypto_box from the sender key (Authcrypt, sender verkey sealed to the
     * recipient) or with a sealed box (Anoncrypt).
     */
    Result<std::string> pack_envelope(const std::vector<std::string>& recipient_verkeys,
                                      const std::optional<std::string>& sender_verkey,
                                      const std::string& plaintext) override;

    Result<UnpackedEnvelope> unpack_envelope(const std::string& envelope) override;

    Result<std::string> create_key() override;
    Result<LocalIdentity> create_local_identity() override;

    // ========================================================================
    // IdentityStore
    // ========================================================================

    Result<std::optional<std::string>> verkey_to_did(const std::string& verkey) override;
    Result<std::string> local_key_for_did(const std::string& did) override;
    Result<PairwiseInfo> pairwise_info(const std::string& their_did) override;
    Status store_pairwise(const PairwiseInfo& info) override;
    Result<std::vector<PairwiseInfo>> list_pairwise() override;

    // ========================================================================
    // Identifiers
    // ========================================================================

    /**
     * @brief Verkey of an Ed25519 public key (base58)
     */
    static std::string verkey_from_public_key(const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key);

    /**
     * @brief Unqualified DID of an Ed25519 public key (base58 of the first 16 bytes)
     */
    static std::string did_from_public_key(const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key);

    /**
     * @brief Decode a verkey to its Ed25519 public key
     * @return Public key, or std::nullopt if not base58 or not 32 bytes
     */
    static std::optional<std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>> public_key_from_verkey(
        const std::string& verkey
    );

private:
    /// Directory holding wallet files
    std::filesystem::path storage_dir_;

    /// Name of the open wallet
    std::string wallet_name_;

    /// SQLite database connection (opaque pointer), nullptr when closed
    void* db_connection_;

    /// Key protecting secret keys at rest
    StorageKey storage_key_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    std::filesystem::path wallet_path(const std::string& name) const;

    /**
     * @brief Create tables on a fresh database
     * @return true if successful, false otherwise
     */
    static bool initialize_database(void* db);

    /// Caller holds db_mutex_
    void close_locked();

    /// Caller holds db_mutex_ and the wallet is open
    Result<std::string> insert_key_locked(const SignatureKeyPair& keypair);

    /// Caller holds db_mutex_ and the wallet is open
    std::optional<SignatureKeyPair> load_keypair_locked(const std::string& verkey) const;

    static Error unavailable();
};

} // namespace didagent
