/**
 * @file test_secure_envelope.cpp
 * @brief Unit tests for SecureEnvelope pack/unpack
 *
 * Tests:
 * - Plaintext-first unpack with empty context
 * - Authenticated and anonymous envelopes
 * - DID resolution of sender and recipient keys
 * - Multiple recipients
 * - Rejection of garbage, oversized and misaddressed envelopes
 */

#include <gtest/gtest.h>
#include "didagent/secure_envelope.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/security_config.hpp"
#include "didagent/serializer.hpp"
#include "didagent/utilities.hpp"
#include "didagent/wallet.hpp"
#include <filesystem>

using namespace didagent;
namespace fs = std::filesystem;

class SecureEnvelopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());
        utilities::initialize_logging("", utilities::LogLevel::WARN);

        test_dir_ = fs::temp_directory_path() / ("didagent_envelope_" + utilities::generate_uuid());

        alice_ = std::make_unique<Wallet>(test_dir_);
        bob_ = std::make_unique<Wallet>(test_dir_);
        ASSERT_TRUE(alice_->create("alice", "alice-pass").ok());
        ASSERT_TRUE(alice_->open("alice", "alice-pass").ok());
        ASSERT_TRUE(bob_->create("bob", "bob-pass").ok());
        ASSERT_TRUE(bob_->open("bob", "bob-pass").ok());

        auto alice_id = alice_->create_local_identity();
        auto bob_id = bob_->create_local_identity();
        ASSERT_TRUE(alice_id.ok());
        ASSERT_TRUE(bob_id.ok());
        alice_id_ = *alice_id;
        bob_id_ = *bob_id;

        alice_envelope_ = std::make_unique<SecureEnvelope>(*alice_, *alice_);
        bob_envelope_ = std::make_unique<SecureEnvelope>(*bob_, *bob_);

        message_ = Message::create(MessageHelpers::message_type(
            MessageHelpers::family_identifier("basicmessage", "1.0"), "message"));
        message_["content"] = "hello";
    }

    void TearDown() override {
        alice_envelope_.reset();
        bob_envelope_.reset();
        alice_.reset();
        bob_.reset();
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    fs::path test_dir_;
    std::unique_ptr<Wallet> alice_;
    std::unique_ptr<Wallet> bob_;
    LocalIdentity alice_id_;
    LocalIdentity bob_id_;
    std::unique_ptr<SecureEnvelope> alice_envelope_;
    std::unique_ptr<SecureEnvelope> bob_envelope_;
    Message message_;
};

// ============================================================================
// Plaintext Tests
// ============================================================================

TEST_F(SecureEnvelopeTest, PlaintextUnpackHasEmptyContext) {
    auto msg = bob_envelope_->unpack(JsonSerializer::serialize(message_));

    ASSERT_TRUE(msg.ok());
    EXPECT_EQ(*msg, message_);
    ASSERT_TRUE(msg->has_context());
    EXPECT_EQ(msg->context(), MessageContext{});
}

TEST_F(SecureEnvelopeTest, JsonWithoutTypeIsNotPlaintext) {
    auto msg = bob_envelope_->unpack("{\"content\":\"hello\"}");

    ASSERT_FALSE(msg.ok());
    EXPECT_EQ(msg.error().kind, ErrorKind::MalformedWireBytes);
}

TEST_F(SecureEnvelopeTest, GarbageRejected) {
    for (const std::string& wire : {std::string(""), std::string("garbage"), std::string("[]")}) {
        auto msg = bob_envelope_->unpack(wire);
        ASSERT_FALSE(msg.ok()) << wire;
        EXPECT_EQ(msg.error().kind, ErrorKind::MalformedWireBytes);
    }
}

TEST_F(SecureEnvelopeTest, OversizedRejected) {
    auto msg = bob_envelope_->unpack(std::string(security::MAX_MESSAGE_SIZE + 1, 'x'));

    ASSERT_FALSE(msg.ok());
    EXPECT_EQ(msg.error().kind, ErrorKind::MalformedWireBytes);
}

// ============================================================================
// Authenticated Envelope Tests
// ============================================================================

TEST_F(SecureEnvelopeTest, AuthcryptRoundTrip) {
    auto wire = alice_envelope_->pack(message_, {bob_id_.verkey}, alice_id_.verkey);
    ASSERT_TRUE(wire.ok());

    // Ciphertext must not leak the content
    EXPECT_EQ(wire->find("hello"), std::string::npos);

    auto msg = bob_envelope_->unpack(*wire);

    ASSERT_TRUE(msg.ok());
    EXPECT_EQ(*msg, message_);
    EXPECT_EQ(msg->context().to_key, bob_id_.verkey);
    EXPECT_EQ(msg->context().to_did, bob_id_.did);
    EXPECT_EQ(msg->context().from_key, alice_id_.verkey);
    EXPECT_FALSE(msg->context().from_did.has_value());
}

TEST_F(SecureEnvelopeTest, SenderResolvedThroughPairwise) {
    PairwiseInfo info;
    info.their_did = alice_id_.did;
    info.their_verkey = alice_id_.verkey;
    info.my_did = bob_id_.did;
    info.their_endpoint = "http://alice/indy";
    info.label = "alice";
    ASSERT_TRUE(bob_->store_pairwise(info).ok());

    auto wire = alice_envelope_->pack(message_, {bob_id_.verkey}, alice_id_.verkey);
    ASSERT_TRUE(wire.ok());

    auto msg = bob_envelope_->unpack(*wire);

    ASSERT_TRUE(msg.ok());
    EXPECT_EQ(msg->context().from_did, alice_id_.did);
}

TEST_F(SecureEnvelopeTest, UnresolvedRecipientKeyHasNoDid) {
    auto bare_key = bob_->create_key();
    ASSERT_TRUE(bare_key.ok());

    auto wire = alice_envelope_->pack(message_, {*bare_key}, alice_id_.verkey);
    ASSERT_TRUE(wire.ok());

    auto msg = bob_envelope_->unpack(*wire);

    ASSERT_TRUE(msg.ok());
    EXPECT_EQ(msg->context().to_key, *bare_key);
    EXPECT_FALSE(msg->context().to_did.has_value());
}

TEST_F(SecureEnvelopeTest, PackWithForeignSenderFails) {
    auto wire = alice_envelope_->pack(message_, {bob_id_.verkey}, bob_id_.verkey);

    ASSERT_FALSE(wire.ok());
    EXPECT_EQ(wire.error().kind, ErrorKind::KeyNotFound);
}

// ============================================================================
// Anonymous Envelope Tests
// ============================================================================

TEST_F(SecureEnvelopeTest, AnoncryptHasNoSender) {
    auto wire = alice_envelope_->pack(message_, {bob_id_.verkey});
    ASSERT_TRUE(wire.ok());

    auto msg = bob_envelope_->unpack(*wire);

    ASSERT_TRUE(msg.ok());
    EXPECT_EQ(*msg, message_);
    EXPECT_EQ(msg->context().to_key, bob_id_.verkey);
    EXPECT_FALSE(msg->context().from_key.has_value());
    EXPECT_FALSE(msg->context().from_did.has_value());
}

// ============================================================================
// Addressing Tests
// ============================================================================

TEST_F(SecureEnvelopeTest, MultipleRecipients) {
    auto wire = alice_envelope_->pack(message_, {alice_id_.verkey, bob_id_.verkey}, alice_id_.verkey);
    ASSERT_TRUE(wire.ok());

    auto for_bob = bob_envelope_->unpack(*wire);
    auto for_alice = alice_envelope_->unpack(*wire);

    ASSERT_TRUE(for_bob.ok());
    ASSERT_TRUE(for_alice.ok());
    EXPECT_EQ(for_bob->context().to_key, bob_id_.verkey);
    EXPECT_EQ(for_alice->context().to_key, alice_id_.verkey);
}

TEST_F(SecureEnvelopeTest, MisaddressedEnvelopeRejected) {
    auto wire = alice_envelope_->pack(message_, {alice_id_.verkey}, alice_id_.verkey);
    ASSERT_TRUE(wire.ok());

    auto msg = bob_envelope_->unpack(*wire);

    ASSERT_FALSE(msg.ok());
    EXPECT_EQ(msg.error().kind, ErrorKind::MalformedWireBytes);
}

TEST_F(SecureEnvelopeTest, NoRecipientsRejected) {
    auto wire = alice_envelope_->pack(message_, {}, alice_id_.verkey);

    EXPECT_FALSE(wire.ok());
}

TEST_F(SecureEnvelopeTest, TamperedCiphertextRejected) {
    auto wire = alice_envelope_->pack(message_, {bob_id_.verkey}, alice_id_.verkey);
    ASSERT_TRUE(wire.ok());

    Json envelope = Json::parse(*wire);
    std::string ciphertext = envelope["ciphertext"].get<std::string>();
    ciphertext[0] = ciphertext[0] == 'A' ? 'B' : 'A';
    envelope["ciphertext"] = ciphertext;

    auto msg = bob_envelope_->unpack(envelope.dump());

    ASSERT_FALSE(msg.ok());
    EXPECT_EQ(msg.error().kind, ErrorKind::MalformedWireBytes);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
