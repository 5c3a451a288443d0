/**
 * @file agent_crypto.cpp
 * @brief Implementation of cryptographic primitives for DIDAgent
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: Digital signatures and agent verkeys
 * - X25519: Key wrapping (converted from Ed25519 keys)
 * - ChaCha20-Poly1305: Envelope content AEAD
 * - Argon2id + XSalsa20-Poly1305: Wallet secrets at rest
 * - libsodium: Industry-standard implementation
 */

#include "didagent/agent_crypto.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace didagent {

// ============================================================================
// Initialization
// ============================================================================

bool AgentCrypto::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair AgentCrypto::generate_signature_keypair() {
    SignatureKeyPair keypair;

    crypto_sign_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data()
    );

    return keypair;
}

std::optional<EncryptionKeyPair> AgentCrypto::to_encryption_keypair(const SignatureKeyPair& keypair) {
    EncryptionKeyPair converted;

    if (crypto_sign_ed25519_pk_to_curve25519(
            converted.public_key.data(), keypair.public_key.data()) != 0) {
        return std::nullopt;
    }

    if (crypto_sign_ed25519_sk_to_curve25519(
            converted.secret_key.data(), keypair.secret_key.data()) != 0) {
        secure_zero(converted.secret_key.data(), converted.secret_key.size());
        return std::nullopt;
    }

    return converted;
}

std::optional<std::array<uint8_t, crypto_box_PUBLICKEYBYTES>> AgentCrypto::to_encryption_public_key(
    const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
) {
    std::array<uint8_t, crypto_box_PUBLICKEYBYTES> converted;

    if (crypto_sign_ed25519_pk_to_curve25519(converted.data(), public_key.data()) != 0) {
        return std::nullopt;
    }

    return converted;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> AgentCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    // Sign the message (detached signature)
    unsigned long long signature_len;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);

    return signature;
}

bool AgentCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
) {
    // Signature must be exactly 64 bytes
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );

    return result == 0;
}

// ============================================================================
// Key Wrapping
// ============================================================================

std::optional<std::vector<uint8_t>> AgentCrypto::box_encrypt(
    const std::vector<uint8_t>& plaintext,
    const std::array<uint8_t, crypto_box_NONCEBYTES>& nonce,
    const std::array<uint8_t, crypto_box_PUBLICKEYBYTES>& recipient_public_key,
    const std::array<uint8_t, crypto_box_SECRETKEYBYTES>& sender_secret_key
) {
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_box_MACBYTES);

    int result = crypto_box_easy(
        ciphertext.data(),
        plaintext.data(),
        plaintext.size(),
        nonce.data(),
        recipient_public_key.data(),
        sender_secret_key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    return ciphertext;
}

std::optional<std::vector<uint8_t>> AgentCrypto::box_decrypt(
    const std::vector<uint8_t>& ciphertext,
    const std::array<uint8_t, crypto_box_NONCEBYTES>& nonce,
    const std::array<uint8_t, crypto_box_PUBLICKEYBYTES>& sender_public_key,
    const std::array<uint8_t, crypto_box_SECRETKEYBYTES>& recipient_secret_key
) {
    if (ciphertext.size() < crypto_box_MACBYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_box_MACBYTES);

    int result = crypto_box_open_easy(
        plaintext.data(),
        ciphertext.data(),
        ciphertext.size(),
        nonce.data(),
        sender_public_key.data(),
        recipient_secret_key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    return plaintext;
}

std::optional<std::vector<uint8_t>> AgentCrypto::seal(
    const std::vector<uint8_t>& plaintext,
    const std::array<uint8_t, crypto_box_PUBLICKEYBYTES>& recipient_public_key
) {
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_box_SEALBYTES);

    if (crypto_box_seal(ciphertext.data(), plaintext.data(), plaintext.size(),
                        recipient_public_key.data()) != 0) {
        return std::nullopt;
    }

    return ciphertext;
}

std::optional<std::vector<uint8_t>> AgentCrypto::seal_open(
    const std::vector<uint8_t>& ciphertext,
    const EncryptionKeyPair& recipient_keypair
) {
    if (ciphertext.size() < crypto_box_SEALBYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_box_SEALBYTES);

    if (crypto_box_seal_open(plaintext.data(), ciphertext.data(), ciphertext.size(),
                             recipient_keypair.public_key.data(),
                             recipient_keypair.secret_key.data()) != 0) {
        return std::nullopt;
    }

    return plaintext;
}

// ============================================================================
// Encryption (ChaCha20-Poly1305 AEAD)
// ============================================================================

std::optional<std::vector<uint8_t>> AgentCrypto::encrypt(
    const std::vector<uint8_t>& plaintext,
    const ContentKey& key,
    const ContentNonce& nonce,
    const std::string& associated_data
) {
    // Allocate ciphertext buffer (plaintext + authentication tag)
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long ciphertext_len;

    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        reinterpret_cast<const unsigned char*>(associated_data.data()),
        associated_data.size(),
        nullptr,  // No secret nonce
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    ciphertext.resize(ciphertext_len);

    return ciphertext;
}

std::optional<std::vector<uint8_t>> AgentCrypto::decrypt(
    const std::vector<uint8_t>& ciphertext,
    const ContentKey& key,
    const ContentNonce& nonce,
    const std::string& associated_data
) {
    // Ciphertext must be at least as long as the authentication tag
    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long plaintext_len;

    // This will fail if authentication tag doesn't match (tampering detected)
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,  // No secret nonce
        ciphertext.data(),
        ciphertext.size(),
        reinterpret_cast<const unsigned char*>(associated_data.data()),
        associated_data.size(),
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    plaintext.resize(plaintext_len);

    return plaintext;
}

// ============================================================================
// Storage Protection
// ============================================================================

std::optional<StorageKey> AgentCrypto::derive_storage_key(
    const std::string& passphrase,
    const std::array<uint8_t, crypto_pwhash_SALTBYTES>& salt
) {
    StorageKey key;

    int result = crypto_pwhash(
        key.data(),
        key.size(),
        passphrase.data(),
        passphrase.size(),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0) {
        return std::nullopt;
    }

    return key;
}

std::vector<uint8_t> AgentCrypto::seal_secret(const std::vector<uint8_t>& secret, const StorageKey& key) {
    std::vector<uint8_t> sealed(crypto_secretbox_NONCEBYTES + secret.size() + crypto_secretbox_MACBYTES);

    // Layout: nonce || ciphertext
    randombytes_buf(sealed.data(), crypto_secretbox_NONCEBYTES);
    crypto_secretbox_easy(
        sealed.data() + crypto_secretbox_NONCEBYTES,
        secret.data(),
        secret.size(),
        sealed.data(),
        key.data()
    );

    return sealed;
}

std::optional<std::vector<uint8_t>> AgentCrypto::open_secret(const std::vector<uint8_t>& sealed, const StorageKey& key) {
    if (sealed.size() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> secret(sealed.size() - crypto_secretbox_NONCEBYTES - crypto_secretbox_MACBYTES);

    int result = crypto_secretbox_open_easy(
        secret.data(),
        sealed.data() + crypto_secretbox_NONCEBYTES,
        sealed.size() - crypto_secretbox_NONCEBYTES,
        sealed.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    return secret;
}

// ============================================================================
// Utility Functions
// ============================================================================

ContentKey AgentCrypto::generate_content_key() {
    ContentKey key;
    crypto_aead_chacha20poly1305_ietf_keygen(key.data());
    return key;
}

ContentNonce AgentCrypto::generate_nonce() {
    ContentNonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

std::string AgentCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string AgentCrypto::bytes_to_base64url(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> AgentCrypto::base64url_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length() + 1);

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    // Padded first, then the unpadded variant some peers emit
    int variants[] = {sodium_base64_VARIANT_URLSAFE, sodium_base64_VARIANT_URLSAFE_NO_PADDING};

    for (int variant : variants) {
        int result = sodium_base642bin(
            bytes.data(),
            bytes.size(),
            base64.c_str(),
            base64.length(),
            nullptr,  // No ignore characters
            &decoded_len,
            &end_ptr,
            variant
        );

        // Trailing garbage is a decoding failure, not a shorter value
        if (result == 0 && end_ptr == base64.c_str() + base64.length()) {
            bytes.resize(decoded_len);
            return bytes;
        }
    }

    return std::nullopt;
}

std::vector<uint8_t> AgentCrypto::sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(hash.data(), data.data(), data.size());
    return hash;
}

void AgentCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace didagent
