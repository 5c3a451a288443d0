/**
 * @file agent_crypto.hpp
 * @brief Cryptographic primitives for DIDAgent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 signatures, Ed25519 -> X25519 conversion, crypto_box and
 * sealed boxes for key wrapping, ChaCha20-Poly1305 AEAD for envelope content,
 * and Argon2id/secretbox for wallet storage.
 */

#pragma once

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace didagent {

/**
 * @brief Ed25519 signature key pair
 */
struct SignatureKeyPair {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief X25519 encryption key pair
 */
struct EncryptionKeyPair {
    std::array<uint8_t, crypto_box_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_box_SECRETKEYBYTES> secret_key;
};

/// Symmetric key for envelope content encryption
using ContentKey = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES>;

/// Nonce for envelope content encryption
using ContentNonce = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES>;

/// Symmetric key protecting secrets at rest in the wallet
using StorageKey = std::array<uint8_t, crypto_secretbox_KEYBYTES>;

/**
 * @brief AgentCrypto - Cryptographic operations for agents
 *
 * Thread-safe cryptographic primitives using libsodium.
 * All methods are stateless.
 */
class AgentCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 signature key pair
     * @return SignatureKeyPair with public and secret keys
     */
    static SignatureKeyPair generate_signature_keypair();

    /**
     * @brief Derive the X25519 key pair matching an Ed25519 key pair
     * @param keypair Ed25519 key pair
     * @return EncryptionKeyPair, or std::nullopt if the key cannot be converted
     */
    static std::optional<EncryptionKeyPair> to_encryption_keypair(const SignatureKeyPair& keypair);

    /**
     * @brief Derive the X25519 public key matching an Ed25519 public key
     * @param public_key Ed25519 public key
     * @return X25519 public key, or std::nullopt for an invalid point
     */
    static std::optional<std::array<uint8_t, crypto_box_PUBLICKEYBYTES>> to_encryption_public_key(
        const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
    );

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 signature
     * @param message Original message
     * @param signature Signature to verify (64 bytes)
     * @param public_key Public key of signer
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
    );

    // ========================================================================
    // Key Wrapping (crypto_box / sealed box)
    // ========================================================================

    /**
     * @brief Authenticated public-key encryption (X25519 + XSalsa20-Poly1305)
     * @param plaintext Data to encrypt
     * @param nonce 24-byte nonce
     * @param recipient_public_key Recipient X25519 public key
     * @param sender_secret_key Sender X25519 secret key
     * @return Ciphertext with MAC, or std::nullopt on failure
     */
    static std::optional<std::vector<uint8_t>> box_encrypt(
        const std::vector<uint8_t>& plaintext,
        const std::array<uint8_t, crypto_box_NONCEBYTES>& nonce,
        const std::array<uint8_t, crypto_box_PUBLICKEYBYTES>& recipient_public_key,
        const std::array<uint8_t, crypto_box_SECRETKEYBYTES>& sender_secret_key
    );

    /**
     * @brief Open a box produced by box_encrypt
     * @return Plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> box_decrypt(
        const std::vector<uint8_t>& ciphertext,
        const std::array<uint8_t, crypto_box_NONCEBYTES>& nonce,
        const std::array<uint8_t, crypto_box_PUBLICKEYBYTES>& sender_public_key,
        const std::array<uint8_t, crypto_box_SECRETKEYBYTES>& recipient_secret_key
    );

    /**
     * @brief Anonymous sealed-box encryption to a recipient
     */
    static std::optional<std::vector<uint8_t>> seal(
        const std::vector<uint8_t>& plaintext,
        const std::array<uint8_t, crypto_box_PUBLICKEYBYTES>& recipient_public_key
    );

    /**
     * @brief Open a sealed box
     * @return Plaintext, or std::nullopt if the box was not sealed to this key pair
     */
    static std::optional<std::vector<uint8_t>> seal_open(
        const std::vector<uint8_t>& ciphertext,
        const EncryptionKeyPair& recipient_keypair
    );

    // ========================================================================
    // Encryption (ChaCha20-Poly1305 AEAD)
    // ========================================================================

    /**
     * @brief Encrypt message with ChaCha20-Poly1305
     * @param plaintext Message to encrypt
     * @param key Content key
     * @param nonce Unique nonce (12 bytes) - must never be reused with same key
     * @param associated_data Authenticated but unencrypted data
     * @return Ciphertext with authentication tag appended
     */
    static std::optional<std::vector<uint8_t>> encrypt(
        const std::vector<uint8_t>& plaintext,
        const ContentKey& key,
        const ContentNonce& nonce,
        const std::string& associated_data = ""
    );

    /**
     * @brief Decrypt message with ChaCha20-Poly1305
     * @param ciphertext Encrypted message with authentication tag
     * @param key Content key
     * @param nonce Nonce used for encryption (12 bytes)
     * @param associated_data Associated data given at encryption
     * @return Decrypted plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> decrypt(
        const std::vector<uint8_t>& ciphertext,
        const ContentKey& key,
        const ContentNonce& nonce,
        const std::string& associated_data = ""
    );

    // ========================================================================
    // Storage Protection
    // ========================================================================

    /**
     * @brief Derive a storage key from a passphrase (Argon2id, interactive limits)
     * @param passphrase Wallet passphrase
     * @param salt Random salt stored beside the wallet
     * @return StorageKey, or std::nullopt if derivation runs out of memory
     */
    static std::optional<StorageKey> derive_storage_key(
        const std::string& passphrase,
        const std::array<uint8_t, crypto_pwhash_SALTBYTES>& salt
    );

    /**
     * @brief Encrypt secret material for storage (nonce prepended)
     */
    static std::vector<uint8_t> seal_secret(const std::vector<uint8_t>& secret, const StorageKey& key);

    /**
     * @brief Decrypt secret material produced by seal_secret
     * @return Secret, or std::nullopt on a wrong key or corrupted record
     */
    static std::optional<std::vector<uint8_t>> open_secret(const std::vector<uint8_t>& sealed, const StorageKey& key);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate a fresh content key
     */
    static ContentKey generate_content_key();

    /**
     * @brief Generate cryptographically secure random nonce
     * @return Random nonce (12 bytes)
     */
    static ContentNonce generate_nonce();

    /**
     * @brief Convert bytes to hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert bytes to URL-safe base64 (padded)
     * @param bytes Input bytes
     * @return Base64url string representation
     */
    static std::string bytes_to_base64url(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert URL-safe base64 to bytes, padded or unpadded
     * @param base64 Base64url string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64url_to_bytes(const std::string& base64);

    /**
     * @brief SHA-256 digest
     */
    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     * @param data Pointer to memory to zero
     * @param size Size of memory region
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace didagent
