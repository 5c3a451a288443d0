/**
 * @file test_agent_crypto.cpp
 * @brief Comprehensive unit tests for AgentCrypto
 *
 * Tests all cryptographic operations including:
 * - Key generation and Ed25519 -> X25519 conversion
 * - Digital signatures (Ed25519)
 * - Key wrapping (crypto_box, sealed boxes)
 * - Encryption/decryption with associated data (ChaCha20-Poly1305)
 * - Storage key derivation and secret sealing
 * - Utility functions (encoding, constant-time comparison, hashing)
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "didagent/agent_crypto.hpp"
#include <thread>
#include <vector>
#include <algorithm>

using namespace didagent;

// Test fixture for AgentCrypto tests
class AgentCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize libsodium once for all tests
        ASSERT_TRUE(AgentCrypto::initialize());
    }

    static std::array<uint8_t, crypto_box_NONCEBYTES> box_nonce() {
        std::array<uint8_t, crypto_box_NONCEBYTES> nonce;
        randombytes_buf(nonce.data(), nonce.size());
        return nonce;
    }
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(AgentCryptoTest, InitializeSuccess) {
    // Should succeed on multiple calls
    EXPECT_TRUE(AgentCrypto::initialize());
    EXPECT_TRUE(AgentCrypto::initialize());
}

// ============================================================================
// Key Generation Tests
// ============================================================================

TEST_F(AgentCryptoTest, GenerateSignatureKeypair) {
    auto keypair = AgentCrypto::generate_signature_keypair();

    EXPECT_EQ(keypair.public_key.size(), crypto_sign_PUBLICKEYBYTES);
    EXPECT_EQ(keypair.secret_key.size(), crypto_sign_SECRETKEYBYTES);

    bool public_not_zero = std::any_of(keypair.public_key.begin(),
                                       keypair.public_key.end(),
                                       [](uint8_t b) { return b != 0; });
    EXPECT_TRUE(public_not_zero);
}

TEST_F(AgentCryptoTest, GenerateSignatureKeypairUniqueness) {
    auto keypair1 = AgentCrypto::generate_signature_keypair();
    auto keypair2 = AgentCrypto::generate_signature_keypair();

    EXPECT_NE(keypair1.public_key, keypair2.public_key);
    EXPECT_NE(keypair1.secret_key, keypair2.secret_key);
}

TEST_F(AgentCryptoTest, ConvertToEncryptionKeypair) {
    auto keypair = AgentCrypto::generate_signature_keypair();

    auto encryption = AgentCrypto::to_encryption_keypair(keypair);
    ASSERT_TRUE(encryption.has_value());

    // Public half derived from the verkey alone must agree
    auto public_only = AgentCrypto::to_encryption_public_key(keypair.public_key);
    ASSERT_TRUE(public_only.has_value());
    EXPECT_EQ(encryption->public_key, *public_only);
}

// ============================================================================
// Digital Signature Tests (Ed25519)
// ============================================================================

TEST_F(AgentCryptoTest, SignAndVerifyMessage) {
    auto keypair = AgentCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = AgentCrypto::sign_message(message, keypair.secret_key);

    EXPECT_EQ(signature.size(), crypto_sign_BYTES);
    EXPECT_TRUE(AgentCrypto::verify_signature(message, signature, keypair.public_key));
}

TEST_F(AgentCryptoTest, VerifyInvalidSignature) {
    auto keypair = AgentCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = AgentCrypto::sign_message(message, keypair.secret_key);
    signature[0] ^= 0xFF;

    EXPECT_FALSE(AgentCrypto::verify_signature(message, signature, keypair.public_key));
}

TEST_F(AgentCryptoTest, VerifyModifiedMessage) {
    auto keypair = AgentCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = AgentCrypto::sign_message(message, keypair.secret_key);
    message[2] = 42;

    EXPECT_FALSE(AgentCrypto::verify_signature(message, signature, keypair.public_key));
}

TEST_F(AgentCryptoTest, VerifyWrongPublicKey) {
    auto keypair1 = AgentCrypto::generate_signature_keypair();
    auto keypair2 = AgentCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3};

    auto signature = AgentCrypto::sign_message(message, keypair1.secret_key);

    EXPECT_FALSE(AgentCrypto::verify_signature(message, signature, keypair2.public_key));
}

TEST_F(AgentCryptoTest, VerifyTruncatedSignature) {
    auto keypair = AgentCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3};

    auto signature = AgentCrypto::sign_message(message, keypair.secret_key);
    signature.resize(10);

    EXPECT_FALSE(AgentCrypto::verify_signature(message, signature, keypair.public_key));
}

TEST_F(AgentCryptoTest, SignEmptyMessage) {
    auto keypair = AgentCrypto::generate_signature_keypair();
    std::vector<uint8_t> message;

    auto signature = AgentCrypto::sign_message(message, keypair.secret_key);

    EXPECT_TRUE(AgentCrypto::verify_signature(message, signature, keypair.public_key));
}

// ============================================================================
// Key Wrapping Tests
// ============================================================================

TEST_F(AgentCryptoTest, BoxEncryptDecrypt) {
    auto alice = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());
    auto bob = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());

    auto key = AgentCrypto::generate_content_key();
    std::vector<uint8_t> plaintext(key.begin(), key.end());
    auto nonce = box_nonce();

    auto wrapped = AgentCrypto::box_encrypt(plaintext, nonce, bob.public_key, alice.secret_key);
    ASSERT_TRUE(wrapped.has_value());
    EXPECT_EQ(wrapped->size(), plaintext.size() + crypto_box_MACBYTES);

    auto unwrapped = AgentCrypto::box_decrypt(*wrapped, nonce, alice.public_key, bob.secret_key);
    ASSERT_TRUE(unwrapped.has_value());
    EXPECT_EQ(*unwrapped, plaintext);
}

TEST_F(AgentCryptoTest, BoxDecryptWrongSender) {
    auto alice = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());
    auto bob = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());
    auto mallory = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());

    std::vector<uint8_t> plaintext = {9, 8, 7};
    auto nonce = box_nonce();

    auto wrapped = AgentCrypto::box_encrypt(plaintext, nonce, bob.public_key, alice.secret_key);
    ASSERT_TRUE(wrapped.has_value());

    EXPECT_FALSE(AgentCrypto::box_decrypt(*wrapped, nonce, mallory.public_key, bob.secret_key).has_value());
}

TEST_F(AgentCryptoTest, SealAndOpen) {
    auto bob = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());
    std::vector<uint8_t> plaintext = {1, 2, 3, 4};

    auto sealed = AgentCrypto::seal(plaintext, bob.public_key);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed->size(), plaintext.size() + crypto_box_SEALBYTES);

    auto opened = AgentCrypto::seal_open(*sealed, bob);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);
}

TEST_F(AgentCryptoTest, SealOpenWrongRecipient) {
    auto bob = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());
    auto eve = *AgentCrypto::to_encryption_keypair(AgentCrypto::generate_signature_keypair());

    auto sealed = AgentCrypto::seal({1, 2, 3}, bob.public_key);
    ASSERT_TRUE(sealed.has_value());

    EXPECT_FALSE(AgentCrypto::seal_open(*sealed, eve).has_value());
}

// ============================================================================
// Encryption Tests (ChaCha20-Poly1305)
// ============================================================================

TEST_F(AgentCryptoTest, EncryptDecryptSuccess) {
    auto key = AgentCrypto::generate_content_key();
    auto nonce = AgentCrypto::generate_nonce();
    std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};

    auto ciphertext = AgentCrypto::encrypt(plaintext, key, nonce, "header");
    ASSERT_TRUE(ciphertext.has_value());
    EXPECT_EQ(ciphertext->size(), plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

    auto decrypted = AgentCrypto::decrypt(*ciphertext, key, nonce, "header");
    ASSERT_TRUE(decrypted.has_value());
    EXPECT_EQ(*decrypted, plaintext);
}

TEST_F(AgentCryptoTest, DecryptWrongAssociatedData) {
    auto key = AgentCrypto::generate_content_key();
    auto nonce = AgentCrypto::generate_nonce();
    std::vector<uint8_t> plaintext = {1, 2, 3};

    auto ciphertext = AgentCrypto::encrypt(plaintext, key, nonce, "protected-a");
    ASSERT_TRUE(ciphertext.has_value());

    EXPECT_FALSE(AgentCrypto::decrypt(*ciphertext, key, nonce, "protected-b").has_value());
}

TEST_F(AgentCryptoTest, DecryptModifiedCiphertext) {
    auto key = AgentCrypto::generate_content_key();
    auto nonce = AgentCrypto::generate_nonce();
    std::vector<uint8_t> plaintext = {1, 2, 3, 4, 5};

    auto ciphertext = AgentCrypto::encrypt(plaintext, key, nonce);
    ASSERT_TRUE(ciphertext.has_value());
    (*ciphertext)[0] ^= 0x01;

    EXPECT_FALSE(AgentCrypto::decrypt(*ciphertext, key, nonce).has_value());
}

TEST_F(AgentCryptoTest, DecryptWrongNonce) {
    auto key = AgentCrypto::generate_content_key();
    std::vector<uint8_t> plaintext = {1, 2, 3};

    auto ciphertext = AgentCrypto::encrypt(plaintext, key, AgentCrypto::generate_nonce());
    ASSERT_TRUE(ciphertext.has_value());

    EXPECT_FALSE(AgentCrypto::decrypt(*ciphertext, key, AgentCrypto::generate_nonce()).has_value());
}

TEST_F(AgentCryptoTest, DecryptTooShort) {
    auto key = AgentCrypto::generate_content_key();
    std::vector<uint8_t> ciphertext = {1, 2, 3};

    EXPECT_FALSE(AgentCrypto::decrypt(ciphertext, key, AgentCrypto::generate_nonce()).has_value());
}

// ============================================================================
// Storage Protection Tests
// ============================================================================

TEST_F(AgentCryptoTest, DeriveStorageKeyDeterministic) {
    std::array<uint8_t, crypto_pwhash_SALTBYTES> salt{};
    salt[0] = 7;

    auto key1 = AgentCrypto::derive_storage_key("correct horse", salt);
    auto key2 = AgentCrypto::derive_storage_key("correct horse", salt);
    auto key3 = AgentCrypto::derive_storage_key("battery staple", salt);

    ASSERT_TRUE(key1.has_value());
    ASSERT_TRUE(key2.has_value());
    ASSERT_TRUE(key3.has_value());
    EXPECT_EQ(*key1, *key2);
    EXPECT_NE(*key1, *key3);
}

TEST_F(AgentCryptoTest, SealSecretRoundTrip) {
    StorageKey key;
    randombytes_buf(key.data(), key.size());
    std::vector<uint8_t> secret = {10, 20, 30, 40};

    auto sealed = AgentCrypto::seal_secret(secret, key);
    EXPECT_NE(sealed, secret);

    auto opened = AgentCrypto::open_secret(sealed, key);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, secret);

    StorageKey other;
    randombytes_buf(other.data(), other.size());
    EXPECT_FALSE(AgentCrypto::open_secret(sealed, other).has_value());
}

// ============================================================================
// Utility Function Tests
// ============================================================================

TEST_F(AgentCryptoTest, GenerateNonceUniqueness) {
    auto nonce1 = AgentCrypto::generate_nonce();
    auto nonce2 = AgentCrypto::generate_nonce();

    EXPECT_NE(nonce1, nonce2);
}

TEST_F(AgentCryptoTest, BytesToHex) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(AgentCrypto::bytes_to_hex(bytes), "000fabff");
}

TEST_F(AgentCryptoTest, Base64UrlAlphabet) {
    // 0xfb 0xff encodes to "+/" in the standard alphabet
    std::vector<uint8_t> bytes = {0xfb, 0xff, 0xbf};

    std::string encoded = AgentCrypto::bytes_to_base64url(bytes);

    EXPECT_EQ(encoded, "-_-_");
    EXPECT_EQ(encoded.find('+'), std::string::npos);
    EXPECT_EQ(encoded.find('/'), std::string::npos);
}

TEST_F(AgentCryptoTest, Base64UrlPaddedAndUnpadded) {
    std::vector<uint8_t> bytes = {'a', 'b'};

    std::string padded = AgentCrypto::bytes_to_base64url(bytes);
    EXPECT_EQ(padded, "YWI=");

    auto from_padded = AgentCrypto::base64url_to_bytes("YWI=");
    auto from_unpadded = AgentCrypto::base64url_to_bytes("YWI");
    ASSERT_TRUE(from_padded.has_value());
    ASSERT_TRUE(from_unpadded.has_value());
    EXPECT_EQ(*from_padded, bytes);
    EXPECT_EQ(*from_unpadded, bytes);
}

TEST_F(AgentCryptoTest, Base64UrlRejectsGarbage) {
    EXPECT_FALSE(AgentCrypto::base64url_to_bytes("not base64!").has_value());
    EXPECT_FALSE(AgentCrypto::base64url_to_bytes("YWI=extra").has_value());
}

TEST_F(AgentCryptoTest, Base64EmptyInput) {
    EXPECT_EQ(AgentCrypto::bytes_to_base64url({}), "");

    auto decoded = AgentCrypto::base64url_to_bytes("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST_F(AgentCryptoTest, Sha256KnownVector) {
    std::string abc = "abc";
    auto digest = AgentCrypto::sha256(std::vector<uint8_t>(abc.begin(), abc.end()));

    EXPECT_EQ(AgentCrypto::bytes_to_hex(digest),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(AgentCryptoTest, ConcurrentSignAndVerify) {
    const int num_threads = 10;
    auto keypair = AgentCrypto::generate_signature_keypair();
    std::vector<std::thread> threads;
    std::vector<int> results(num_threads, 0);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&keypair, &results, i]() {
            std::vector<uint8_t> message = {static_cast<uint8_t>(i)};
            auto signature = AgentCrypto::sign_message(message, keypair.secret_key);
            results[i] = AgentCrypto::verify_signature(message, signature, keypair.public_key) ? 1 : 0;
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int result : results) {
        EXPECT_EQ(result, 1);
    }
}

// ============================================================================
// Security Tests
// ============================================================================

TEST_F(AgentCryptoTest, SecureZeroMemory) {
    std::vector<uint8_t> sensitive_data(32, 0xFF);

    AgentCrypto::secure_zero(sensitive_data.data(), sensitive_data.size());

    for (uint8_t byte : sensitive_data) {
        EXPECT_EQ(byte, 0);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
