/**
 * @file wallet.cpp
 * @brief Implementation of the SQLite-backed wallet
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/wallet.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>

using json = nlohmann::ordered_json;

namespace didagent {

namespace {
    const std::string CONTENT_ENCRYPTION = "chacha20poly1305_ietf";
    const std::string ENVELOPE_TYPE = "JWM/1.0";
    const std::string ALG_AUTHCRYPT = "Authcrypt";
    const std::string ALG_ANONCRYPT = "Anoncrypt";

    // Plaintext of the sealed check value stored in meta
    const std::string PASSPHRASE_CHECK = "didagent-wallet-v1";

    int64_t now_seconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

    std::vector<uint8_t> to_bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string column_text(sqlite3_stmt* stmt, int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    std::vector<uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
        int size = sqlite3_column_bytes(stmt, column);
        if (!data || size <= 0) {
            return {};
        }
        return std::vector<uint8_t>(data, data + size);
    }

    bool put_meta(sqlite3* db, const std::string& name, const std::vector<uint8_t>& value) {
        const char* sql = "INSERT OR REPLACE INTO meta (name, value) VALUES (?, ?)";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        return rc == SQLITE_DONE;
    }

    std::optional<std::vector<uint8_t>> get_meta(sqlite3* db, const std::string& name) {
        const char* sql = "SELECT value FROM meta WHERE name = ?";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<std::vector<uint8_t>> value;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            value = column_blob(stmt, 0);
        }
        sqlite3_finalize(stmt);

        return value;
    }

    PairwiseInfo read_pairwise_row(sqlite3_stmt* stmt) {
        PairwiseInfo info;
        info.their_did = column_text(stmt, 0);
        info.their_verkey = column_text(stmt, 1);
        info.my_did = column_text(stmt, 2);
        info.their_endpoint = column_text(stmt, 3);
        info.label = column_text(stmt, 4);
        return info;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

Wallet::Wallet(std::filesystem::path storage_dir)
    : storage_dir_(std::move(storage_dir))
    , db_connection_(nullptr)
{
    storage_key_.fill(0);
}

Wallet::~Wallet() {
    close();
}

std::filesystem::path Wallet::wallet_path(const std::string& name) const {
    return storage_dir_ / (name + ".db");
}

Error Wallet::unavailable() {
    return Error(ErrorKind::WalletUnavailable, "Wallet is not open");
}

// ============================================================================
// Database Initialization
// ============================================================================

bool Wallet::initialize_database(void* connection) {
    sqlite3* db = static_cast<sqlite3*>(connection);
    char* error_msg = nullptr;

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS meta (
            name TEXT PRIMARY KEY,
            value BLOB NOT NULL
        );
        CREATE TABLE IF NOT EXISTS keys (
            verkey TEXT PRIMARY KEY,
            secret BLOB NOT NULL,
            created_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS dids (
            did TEXT PRIMARY KEY,
            verkey TEXT NOT NULL REFERENCES keys(verkey),
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_dids_verkey ON dids(verkey);
        CREATE TABLE IF NOT EXISTS pairwise (
            their_did TEXT PRIMARY KEY,
            their_verkey TEXT NOT NULL,
            my_did TEXT NOT NULL,
            their_endpoint TEXT NOT NULL,
            label TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_pairwise_verkey ON pairwise(their_verkey);
    )";

    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error("Wallet: Schema creation failed: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Wallet::exists(const std::string& name) const {
    return std::filesystem::exists(wallet_path(name));
}

bool Wallet::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_connection_ != nullptr;
}

std::string Wallet::name() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return wallet_name_;
}

Status Wallet::create(const std::string& name, const std::string& passphrase) {
    auto path = wallet_path(name);
    if (!security::validate_identifier(name) || !security::is_safe_path(path, storage_dir_)) {
        return Error(ErrorKind::InvalidArgument, "Invalid wallet name: " + name);
    }

    if (std::filesystem::exists(path)) {
        return Error(ErrorKind::WalletAlreadyExists, "Wallet already exists: " + name);
    }

    try {
        std::filesystem::create_directories(storage_dir_);
    } catch (const std::filesystem::filesystem_error& e) {
        return Error(ErrorKind::WalletUnavailable, std::string("Cannot create wallet directory: ") + e.what());
    }

    std::array<uint8_t, crypto_pwhash_SALTBYTES> salt;
    randombytes_buf(salt.data(), salt.size());

    auto key = AgentCrypto::derive_storage_key(passphrase, salt);
    if (!key) {
        return Error(ErrorKind::WalletUnavailable, "Key derivation failed");
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        AgentCrypto::secure_zero(key->data(), key->size());
        return Error(ErrorKind::WalletUnavailable, "Failed to create wallet database: " + path.string());
    }

    bool ok = initialize_database(db) &&
              put_meta(db, "salt", std::vector<uint8_t>(salt.begin(), salt.end())) &&
              put_meta(db, "check", AgentCrypto::seal_secret(to_bytes(PASSPHRASE_CHECK), *key));

    sqlite3_close(db);
    AgentCrypto::secure_zero(key->data(), key->size());

    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return Error(ErrorKind::WalletUnavailable, "Failed to initialize wallet: " + name);
    }

    // Set restrictive permissions (owner read/write only)
#ifndef _WIN32
    std::error_code perm_ec;
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, perm_ec);
#endif

    utilities::log_info("Wallet: Created " + name);
    return Status::success();
}

Status Wallet::open(const std::string& name, const std::string& passphrase) {
    auto path = wallet_path(name);
    if (!security::validate_identifier(name) || !security::is_safe_path(path, storage_dir_)) {
        return Error(ErrorKind::InvalidArgument, "Invalid wallet name: " + name);
    }

    if (!std::filesystem::exists(path)) {
        return Error(ErrorKind::WalletNotFound, "Wallet not found: " + name);
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    close_locked();

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READWRITE, nullptr);
    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        return Error(ErrorKind::WalletUnavailable, "Failed to open wallet database: " + path.string());
    }

    auto salt_bytes = get_meta(db, "salt");
    auto check = get_meta(db, "check");
    if (!salt_bytes || salt_bytes->size() != crypto_pwhash_SALTBYTES || !check) {
        sqlite3_close(db);
        return Error(ErrorKind::WalletUnavailable, "Wallet metadata is corrupted: " + name);
    }

    std::array<uint8_t, crypto_pwhash_SALTBYTES> salt;
    std::copy(salt_bytes->begin(), salt_bytes->end(), salt.begin());

    auto key = AgentCrypto::derive_storage_key(passphrase, salt);
    if (!key) {
        sqlite3_close(db);
        return Error(ErrorKind::WalletUnavailable, "Key derivation failed");
    }

    auto opened = AgentCrypto::open_secret(*check, *key);
    if (!opened || std::string(opened->begin(), opened->end()) != PASSPHRASE_CHECK) {
        AgentCrypto::secure_zero(key->data(), key->size());
        sqlite3_close(db);
        return Error(ErrorKind::WalletUnavailable, "Invalid passphrase for wallet: " + name);
    }

    storage_key_ = *key;
    AgentCrypto::secure_zero(key->data(), key->size());
    db_connection_ = static_cast<void*>(db);
    wallet_name_ = name;

    utilities::log_info("Wallet: Opened " + name);
    return Status::success();
}

void Wallet::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    close_locked();
}

void Wallet::close_locked() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
        utilities::log_info("Wallet: Closed " + wallet_name_);
    }
    AgentCrypto::secure_zero(storage_key_.data(), storage_key_.size());
    wallet_name_.clear();
}

Status Wallet::remove(const std::string& name) {
    auto path = wallet_path(name);
    if (!security::validate_identifier(name) || !security::is_safe_path(path, storage_dir_)) {
        return Error(ErrorKind::InvalidArgument, "Invalid wallet name: " + name);
    }

    if (!std::filesystem::exists(path)) {
        return Error(ErrorKind::WalletNotFound, "Wallet not found: " + name);
    }

    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_connection_ && wallet_name_ == name) {
            close_locked();
        }
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return Error(ErrorKind::WalletUnavailable, "Failed to remove wallet: " + ec.message());
    }

    utilities::log_info("Wallet: Removed " + name);
    return Status::success();
}

// ============================================================================
// Identifiers
// ============================================================================

std::string Wallet::verkey_from_public_key(const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key) {
    return utilities::base58_encode(std::vector<uint8_t>(public_key.begin(), public_key.end()));
}

std::string Wallet::did_from_public_key(const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key) {
    return utilities::base58_encode(
        std::vector<uint8_t>(public_key.begin(), public_key.begin() + security::DID_SOURCE_BYTES));
}

std::optional<std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>> Wallet::public_key_from_verkey(
    const std::string& verkey
) {
    auto bytes = utilities::base58_decode(verkey);
    if (!bytes || bytes->size() != crypto_sign_PUBLICKEYBYTES) {
        return std::nullopt;
    }

    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::copy(bytes->begin(), bytes->end(), public_key.begin());
    return public_key;
}

// ============================================================================
// Keys
// ============================================================================

Result<std::string> Wallet::insert_key_locked(const SignatureKeyPair& keypair) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    std::string verkey = verkey_from_public_key(keypair.public_key);

    std::vector<uint8_t> secret(keypair.secret_key.begin(), keypair.secret_key.end());
    auto sealed = AgentCrypto::seal_secret(secret, storage_key_);
    AgentCrypto::secure_zero(secret.data(), secret.size());

    const char* sql = "INSERT INTO keys (verkey, secret, created_at) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, verkey.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, sealed.data(), static_cast<int>(sealed.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, now_seconds());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Error(ErrorKind::WalletUnavailable, "Failed to store key: " + std::string(sqlite3_errmsg(db)));
    }

    return verkey;
}

std::optional<SignatureKeyPair> Wallet::load_keypair_locked(const std::string& verkey) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    auto public_key = public_key_from_verkey(verkey);
    if (!public_key) {
        return std::nullopt;
    }

    const char* sql = "SELECT secret FROM keys WHERE verkey = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, verkey.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<uint8_t> sealed;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        sealed = column_blob(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (sealed.empty()) {
        return std::nullopt;
    }

    auto secret = AgentCrypto::open_secret(sealed, storage_key_);
    if (!secret || secret->size() != crypto_sign_SECRETKEYBYTES) {
        utilities::log_error("Wallet: Secret key record is corrupted for " + verkey);
        return std::nullopt;
    }

    SignatureKeyPair keypair;
    keypair.public_key = *public_key;
    std::copy(secret->begin(), secret->end(), keypair.secret_key.begin());
    AgentCrypto::secure_zero(secret->data(), secret->size());

    return keypair;
}

Result<std::string> Wallet::create_key() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    auto keypair = AgentCrypto::generate_signature_keypair();
    auto verkey = insert_key_locked(keypair);
    AgentCrypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());

    return verkey;
}

Result<LocalIdentity> Wallet::create_local_identity() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    auto keypair = AgentCrypto::generate_signature_keypair();
    auto verkey = insert_key_locked(keypair);
    AgentCrypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
    if (!verkey) {
        return verkey.error();
    }

    LocalIdentity identity;
    identity.did = did_from_public_key(keypair.public_key);
    identity.verkey = *verkey;

    const char* sql = "INSERT INTO dids (did, verkey, created_at) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, identity.did.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, identity.verkey.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, now_seconds());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Error(ErrorKind::WalletUnavailable, "Failed to store DID: " + std::string(sqlite3_errmsg(db)));
    }

    return identity;
}

// ============================================================================
// Signatures
// ============================================================================

Result<std::vector<uint8_t>> Wallet::sign(const std::string& verkey, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    auto keypair = load_keypair_locked(verkey);
    if (!keypair) {
        return Error(ErrorKind::KeyNotFound, "No secret key for verkey " + verkey);
    }

    auto signature = AgentCrypto::sign_message(data, keypair->secret_key);
    AgentCrypto::secure_zero(keypair->secret_key.data(), keypair->secret_key.size());

    return signature;
}

bool Wallet::verify(const std::string& verkey,
                    const std::vector<uint8_t>& data,
                    const std::vector<uint8_t>& signature) {
    auto public_key = public_key_from_verkey(verkey);
    if (!public_key) {
        return false;
    }
    return AgentCrypto::verify_signature(data, signature, *public_key);
}

// ============================================================================
// Envelopes
// ============================================================================

Result<std::string> Wallet::pack_envelope(const std::vector<std::string>& recipient_verkeys,
                                          const std::optional<std::string>& sender_verkey,
                                          const std::string& plaintext) {
    if (recipient_verkeys.empty()) {
        return Error(ErrorKind::InvalidArgument, "Envelope needs at least one recipient");
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    std::optional<EncryptionKeyPair> sender_keys;
    if (sender_verkey) {
        auto sender = load_keypair_locked(*sender_verkey);
        if (!sender) {
            return Error(ErrorKind::KeyNotFound, "No secret key for sender " + *sender_verkey);
        }
        sender_keys = AgentCrypto::to_encryption_keypair(*sender);
        AgentCrypto::secure_zero(sender->secret_key.data(), sender->secret_key.size());
        if (!sender_keys) {
            return Error(ErrorKind::InvalidArgument, "Sender key cannot be converted: " + *sender_verkey);
        }
    }

    ContentKey cek = AgentCrypto::generate_content_key();
    std::vector<uint8_t> cek_bytes(cek.begin(), cek.end());

    json recipients = json::array();
    for (const auto& verkey : recipient_verkeys) {
        auto public_key = public_key_from_verkey(verkey);
        auto recipient_key = public_key ? AgentCrypto::to_encryption_public_key(*public_key) : std::nullopt;
        if (!recipient_key) {
            AgentCrypto::secure_zero(cek_bytes.data(), cek_bytes.size());
            return Error(ErrorKind::InvalidArgument, "Invalid recipient verkey: " + verkey);
        }

        json header = {{"kid", verkey}};
        std::optional<std::vector<uint8_t>> encrypted_key;

        if (sender_keys) {
            std::array<uint8_t, crypto_box_NONCEBYTES> nonce;
            randombytes_buf(nonce.data(), nonce.size());

            encrypted_key = AgentCrypto::box_encrypt(cek_bytes, nonce, *recipient_key, sender_keys->secret_key);
            auto sealed_sender = AgentCrypto::seal(to_bytes(*sender_verkey), *recipient_key);
            if (!sealed_sender) {
                encrypted_key.reset();
            } else {
                header["sender"] = AgentCrypto::bytes_to_base64url(*sealed_sender);
                header["iv"] = AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(nonce.begin(), nonce.end()));
            }
        } else {
            encrypted_key = AgentCrypto::seal(cek_bytes, *recipient_key);
        }

        if (!encrypted_key) {
            AgentCrypto::secure_zero(cek_bytes.data(), cek_bytes.size());
            return Error(ErrorKind::InvalidArgument, "Key wrapping failed for " + verkey);
        }

        recipients.push_back({
            {"encrypted_key", AgentCrypto::bytes_to_base64url(*encrypted_key)},
            {"header", header}
        });
    }

    if (sender_keys) {
        AgentCrypto::secure_zero(sender_keys->secret_key.data(), sender_keys->secret_key.size());
    }
    AgentCrypto::secure_zero(cek_bytes.data(), cek_bytes.size());

    json protected_header = {
        {"enc", CONTENT_ENCRYPTION},
        {"typ", ENVELOPE_TYPE},
        {"alg", sender_verkey ? ALG_AUTHCRYPT : ALG_ANONCRYPT},
        {"recipients", recipients}
    };
    std::string protected_b64 = AgentCrypto::bytes_to_base64url(to_bytes(protected_header.dump()));

    ContentNonce nonce = AgentCrypto::generate_nonce();
    auto ciphertext = AgentCrypto::encrypt(to_bytes(plaintext), cek, nonce, protected_b64);
    AgentCrypto::secure_zero(cek.data(), cek.size());
    if (!ciphertext) {
        return Error(ErrorKind::InvalidArgument, "Content encryption failed");
    }

    // Detached tag: last ABYTES of the AEAD output
    auto tag_start = ciphertext->end() - crypto_aead_chacha20poly1305_ietf_ABYTES;

    json envelope = {
        {"protected", protected_b64},
        {"iv", AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(nonce.begin(), nonce.end()))},
        {"ciphertext", AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(ciphertext->begin(), tag_start))},
        {"tag", AgentCrypto::bytes_to_base64url(std::vector<uint8_t>(tag_start, ciphertext->end()))}
    };

    return envelope.dump();
}

Result<UnpackedEnvelope> Wallet::unpack_envelope(const std::string& envelope) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    auto malformed = [](const std::string& reason) {
        return Error(ErrorKind::MalformedWireBytes, "Envelope: " + reason);
    };

    json outer;
    json header;
    try {
        outer = json::parse(envelope);
        for (const char* field : {"protected", "iv", "ciphertext", "tag"}) {
            if (!outer.contains(field) || !outer[field].is_string()) {
                return malformed(std::string("missing ") + field);
            }
        }

        auto header_bytes = AgentCrypto::base64url_to_bytes(outer["protected"].get<std::string>());
        if (!header_bytes) {
            return malformed("protected header is not base64url");
        }
        header = json::parse(header_bytes->begin(), header_bytes->end());

    } catch (const json::exception& e) {
        return malformed(e.what());
    }

    if (!header.is_object() || header.value("enc", "") != CONTENT_ENCRYPTION ||
        !header.contains("recipients") || !header["recipients"].is_array()) {
        return malformed("unsupported protected header");
    }

    std::string alg = header.value("alg", "");
    if (alg != ALG_AUTHCRYPT && alg != ALG_ANONCRYPT) {
        return malformed("unsupported alg " + alg);
    }

    // First recipient whose key this wallet holds
    std::optional<SignatureKeyPair> recipient;
    json recipient_entry;
    for (const auto& entry : header["recipients"]) {
        if (!entry.is_object() || !entry.contains("header") || !entry["header"].is_object()) {
            continue;
        }
        std::string kid = entry["header"].value("kid", "");
        recipient = load_keypair_locked(kid);
        if (recipient) {
            recipient_entry = entry;
            break;
        }
    }

    if (!recipient) {
        return malformed("no recipient key held by this wallet");
    }

    UnpackedEnvelope result;
    result.recipient_verkey = verkey_from_public_key(recipient->public_key);

    auto recipient_keys = AgentCrypto::to_encryption_keypair(*recipient);
    AgentCrypto::secure_zero(recipient->secret_key.data(), recipient->secret_key.size());
    if (!recipient_keys) {
        return malformed("recipient key cannot be converted");
    }

    auto encrypted_key = AgentCrypto::base64url_to_bytes(recipient_entry.value("encrypted_key", ""));
    if (!encrypted_key) {
        return malformed("encrypted_key is not base64url");
    }

    std::optional<std::vector<uint8_t>> cek_bytes;
    const json& recipient_header = recipient_entry["header"];

    if (alg == ALG_AUTHCRYPT) {
        auto sealed_sender = AgentCrypto::base64url_to_bytes(recipient_header.value("sender", ""));
        auto iv = AgentCrypto::base64url_to_bytes(recipient_header.value("iv", ""));
        if (!sealed_sender || !iv || iv->size() != crypto_box_NONCEBYTES) {
            AgentCrypto::secure_zero(recipient_keys->secret_key.data(), recipient_keys->secret_key.size());
            return malformed("authcrypt recipient header incomplete");
        }

        auto sender_bytes = AgentCrypto::seal_open(*sealed_sender, *recipient_keys);
        std::string sender_verkey = sender_bytes ? std::string(sender_bytes->begin(), sender_bytes->end()) : "";
        auto sender_public = public_key_from_verkey(sender_verkey);
        auto sender_key = sender_public ? AgentCrypto::to_encryption_public_key(*sender_public) : std::nullopt;

        if (sender_key) {
            std::array<uint8_t, crypto_box_NONCEBYTES> nonce;
            std::copy(iv->begin(), iv->end(), nonce.begin());
            cek_bytes = AgentCrypto::box_decrypt(*encrypted_key, nonce, *sender_key, recipient_keys->secret_key);
            result.sender_verkey = sender_verkey;
        }
    } else {
        cek_bytes = AgentCrypto::seal_open(*encrypted_key, *recipient_keys);
    }

    AgentCrypto::secure_zero(recipient_keys->secret_key.data(), recipient_keys->secret_key.size());

    if (!cek_bytes || cek_bytes->size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
        return malformed("content key could not be unwrapped");
    }

    ContentKey cek;
    std::copy(cek_bytes->begin(), cek_bytes->end(), cek.begin());
    AgentCrypto::secure_zero(cek_bytes->data(), cek_bytes->size());

    auto iv = AgentCrypto::base64url_to_bytes(outer["iv"].get<std::string>());
    auto ciphertext = AgentCrypto::base64url_to_bytes(outer["ciphertext"].get<std::string>());
    auto tag = AgentCrypto::base64url_to_bytes(outer["tag"].get<std::string>());
    if (!iv || iv->size() != crypto_aead_chacha20poly1305_ietf_NPUBBYTES || !ciphertext || !tag) {
        AgentCrypto::secure_zero(cek.data(), cek.size());
        return malformed("content fields are not base64url");
    }

    ContentNonce nonce;
    std::copy(iv->begin(), iv->end(), nonce.begin());
    ciphertext->insert(ciphertext->end(), tag->begin(), tag->end());

    auto plaintext = AgentCrypto::decrypt(*ciphertext, cek, nonce, outer["protected"].get<std::string>());
    AgentCrypto::secure_zero(cek.data(), cek.size());
    if (!plaintext) {
        return malformed("content authentication failed");
    }

    result.message.assign(plaintext->begin(), plaintext->end());
    return result;
}

// ============================================================================
// Identity Store
// ============================================================================

Result<std::optional<std::string>> Wallet::verkey_to_did(const std::string& verkey) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    // Local DIDs first, then pairwise peers
    const char* queries[] = {
        "SELECT did FROM dids WHERE verkey = ?",
        "SELECT their_did FROM pairwise WHERE their_verkey = ?"
    };

    for (const char* sql : queries) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
        }

        sqlite3_bind_text(stmt, 1, verkey.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<std::string> did;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            did = column_text(stmt, 0);
        }
        sqlite3_finalize(stmt);

        if (did) {
            return did;
        }
    }

    return std::optional<std::string>();
}

Result<std::string> Wallet::local_key_for_did(const std::string& did) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT verkey FROM dids WHERE did = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, did.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> verkey;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        verkey = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (!verkey) {
        return Error(ErrorKind::KeyNotFound, "Unknown local DID " + did);
    }
    return *verkey;
}

Result<PairwiseInfo> Wallet::pairwise_info(const std::string& their_did) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT their_did, their_verkey, my_did, their_endpoint, label
        FROM pairwise
        WHERE their_did = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, their_did.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<PairwiseInfo> info;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        info = read_pairwise_row(stmt);
    }
    sqlite3_finalize(stmt);

    if (!info) {
        return Error(ErrorKind::KeyNotFound, "No pairwise relationship with " + their_did);
    }
    return *info;
}

Status Wallet::store_pairwise(const PairwiseInfo& info) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO pairwise
        (their_did, their_verkey, my_did, their_endpoint, label, created_at)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, info.their_did.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, info.their_verkey.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, info.my_did.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, info.their_endpoint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, info.label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, now_seconds());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Error(ErrorKind::WalletUnavailable, "Failed to store pairwise: " + std::string(sqlite3_errmsg(db)));
    }
    return Status::success();
}

Result<std::vector<PairwiseInfo>> Wallet::list_pairwise() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_connection_) {
        return unavailable();
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT their_did, their_verkey, my_did, their_endpoint, label
        FROM pairwise
        ORDER BY created_at ASC, rowid ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorKind::WalletUnavailable, sqlite3_errmsg(db));
    }

    std::vector<PairwiseInfo> relationships;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        relationships.push_back(read_pairwise_row(stmt));
    }
    sqlite3_finalize(stmt);

    return relationships;
}

} // namespace didagent
