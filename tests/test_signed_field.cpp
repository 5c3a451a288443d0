/**
 * @file test_signed_field.cpp
 * @brief Unit tests for the signed-field protocol
 *
 * Tests:
 * - sig_data layout (big-endian timestamp ++ payload JSON)
 * - Verification of genuine, tampered and foreign signatures
 * - Malformed signed fields
 * - Message field replacement ("<name>" <-> "<name>~sig")
 */

#include <gtest/gtest.h>
#include "didagent/signed_field.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/utilities.hpp"
#include "didagent/wallet.hpp"
#include <filesystem>

using namespace didagent;
namespace fs = std::filesystem;

class SignedFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());
        utilities::initialize_logging("", utilities::LogLevel::WARN);

        test_dir_ = fs::temp_directory_path() / ("didagent_signed_field_" + utilities::generate_uuid());
        wallet_ = std::make_unique<Wallet>(test_dir_);
        ASSERT_TRUE(wallet_->create("signer", "passphrase").ok());
        ASSERT_TRUE(wallet_->open("signer", "passphrase").ok());

        auto key = wallet_->create_key();
        ASSERT_TRUE(key.ok());
        verkey_ = *key;

        payload_ = Json{{"DID", "did"}, {"DIDDoc", Json{{"service", Json::array()}}}};
    }

    void TearDown() override {
        wallet_.reset();
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    /// Re-encode a field's sig_data after altering it
    static Json with_sig_data(Json field, const std::vector<uint8_t>& sig_data) {
        field["sig_data"] = AgentCrypto::bytes_to_base64url(sig_data);
        return field;
    }

    fs::path test_dir_;
    std::unique_ptr<Wallet> wallet_;
    std::string verkey_;
    Json payload_;
};

// ============================================================================
// Signing Tests
// ============================================================================

TEST_F(SignedFieldTest, SignProducesSignatureObject) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);

    ASSERT_TRUE(field.ok());
    EXPECT_EQ((*field)["@type"], SignedField::SIGNATURE_TYPE);
    EXPECT_EQ((*field)["signer"], verkey_);
    EXPECT_TRUE((*field)["sig_data"].is_string());
    EXPECT_TRUE((*field)["signature"].is_string());
}

TEST_F(SignedFieldTest, SigDataLayout) {
    const uint64_t timestamp = 0x0102030405060708ULL;

    auto field = SignedField::sign_at(*wallet_, payload_, verkey_, timestamp);
    ASSERT_TRUE(field.ok());

    auto sig_data = AgentCrypto::base64url_to_bytes((*field)["sig_data"].get<std::string>());
    ASSERT_TRUE(sig_data.has_value());
    ASSERT_GT(sig_data->size(), 8u);

    for (size_t i = 0; i < 8; ++i) {
        EXPECT_EQ((*sig_data)[i], static_cast<uint8_t>(i + 1));
    }
    std::string json_text(sig_data->begin() + 8, sig_data->end());
    EXPECT_EQ(json_text, payload_.dump());
}

TEST_F(SignedFieldTest, SignWithUnknownKeyFails) {
    auto field = SignedField::sign(*wallet_, payload_, "GJ1SzoWzavQYfNL9XkaJdrQejfztN4XqdsiV4ct3LXKL");

    ASSERT_FALSE(field.ok());
    EXPECT_EQ(field.error().kind, ErrorKind::KeyNotFound);
}

// ============================================================================
// Verification Tests
// ============================================================================

TEST_F(SignedFieldTest, VerifyRecoversPayload) {
    uint64_t before = utilities::current_unix_time();
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());

    auto verified = SignedField::verify(*wallet_, *field);

    ASSERT_TRUE(verified.ok());
    EXPECT_TRUE(verified->verified);
    EXPECT_EQ(verified->payload, payload_);
    EXPECT_EQ(verified->signer, verkey_);
    EXPECT_GE(verified->timestamp, before);
    EXPECT_LE(verified->timestamp, utilities::current_unix_time());
}

TEST_F(SignedFieldTest, OldTimestampStillVerifies) {
    auto field = SignedField::sign_at(*wallet_, payload_, verkey_, 0);
    ASSERT_TRUE(field.ok());

    auto verified = SignedField::verify(*wallet_, *field);

    ASSERT_TRUE(verified.ok());
    EXPECT_TRUE(verified->verified);
    EXPECT_EQ(verified->timestamp, 0u);
}

TEST_F(SignedFieldTest, TamperedPayloadNotVerified) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());

    auto sig_data = AgentCrypto::base64url_to_bytes((*field)["sig_data"].get<std::string>());
    ASSERT_TRUE(sig_data.has_value());
    Json altered = payload_;
    altered["DID"] = "other";
    sig_data->resize(8);
    std::string text = altered.dump();
    sig_data->insert(sig_data->end(), text.begin(), text.end());

    auto verified = SignedField::verify(*wallet_, with_sig_data(*field, *sig_data));

    ASSERT_TRUE(verified.ok());
    EXPECT_FALSE(verified->verified);
    EXPECT_EQ(verified->payload["DID"], "other");
}

TEST_F(SignedFieldTest, TamperedTimestampNotVerified) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());

    auto sig_data = AgentCrypto::base64url_to_bytes((*field)["sig_data"].get<std::string>());
    ASSERT_TRUE(sig_data.has_value());
    (*sig_data)[7] ^= 0x01;

    auto verified = SignedField::verify(*wallet_, with_sig_data(*field, *sig_data));

    ASSERT_TRUE(verified.ok());
    EXPECT_FALSE(verified->verified);
}

TEST_F(SignedFieldTest, ForeignSignerNotVerified) {
    auto other = wallet_->create_key();
    ASSERT_TRUE(other.ok());

    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());
    (*field)["signer"] = *other;

    auto verified = SignedField::verify(*wallet_, *field);

    ASSERT_TRUE(verified.ok());
    EXPECT_FALSE(verified->verified);
}

// ============================================================================
// Malformed Field Tests
// ============================================================================

TEST_F(SignedFieldTest, MissingMembersRejected) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());

    for (const char* member : {"signer", "sig_data", "signature"}) {
        Json broken = *field;
        broken.erase(member);

        auto verified = SignedField::verify(*wallet_, broken);
        ASSERT_FALSE(verified.ok()) << member;
        EXPECT_EQ(verified.error().kind, ErrorKind::MalformedSignedField);
    }
}

TEST_F(SignedFieldTest, NonObjectRejected) {
    auto verified = SignedField::verify(*wallet_, Json("text"));

    ASSERT_FALSE(verified.ok());
    EXPECT_EQ(verified.error().kind, ErrorKind::MalformedSignedField);
}

TEST_F(SignedFieldTest, InvalidBase64Rejected) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());
    (*field)["sig_data"] = "not base64!";

    auto verified = SignedField::verify(*wallet_, *field);

    ASSERT_FALSE(verified.ok());
    EXPECT_EQ(verified.error().kind, ErrorKind::MalformedSignedField);
}

TEST_F(SignedFieldTest, ShortSigDataRejected) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());

    auto verified = SignedField::verify(*wallet_, with_sig_data(*field, {1, 2, 3}));

    ASSERT_FALSE(verified.ok());
    EXPECT_EQ(verified.error().kind, ErrorKind::MalformedSignedField);
}

TEST_F(SignedFieldTest, NonJsonPayloadRejected) {
    auto field = SignedField::sign(*wallet_, payload_, verkey_);
    ASSERT_TRUE(field.ok());

    std::vector<uint8_t> sig_data(8, 0);
    sig_data.push_back('{');

    auto verified = SignedField::verify(*wallet_, with_sig_data(*field, sig_data));

    ASSERT_FALSE(verified.ok());
    EXPECT_EQ(verified.error().kind, ErrorKind::MalformedSignedField);
}

// ============================================================================
// Message Field Tests
// ============================================================================

TEST_F(SignedFieldTest, SignMessageFieldReplacesField) {
    Message msg = Message::create("did:x;spec/connections/1.0/response");
    msg["connection"] = payload_;

    ASSERT_TRUE(SignedField::sign_message_field(*wallet_, msg, "connection", verkey_).ok());

    EXPECT_FALSE(msg.contains("connection"));
    EXPECT_TRUE(msg.contains("connection~sig"));
}

TEST_F(SignedFieldTest, SignMissingFieldFails) {
    Message msg = Message::create("did:x;spec/connections/1.0/response");

    auto status = SignedField::sign_message_field(*wallet_, msg, "connection", verkey_);

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(SignedFieldTest, UnpackMessageFieldRestoresField) {
    Message msg = Message::create("did:x;spec/connections/1.0/response");
    msg["connection"] = payload_;
    Message original = msg;
    ASSERT_TRUE(SignedField::sign_message_field(*wallet_, msg, "connection", verkey_).ok());

    auto verified = SignedField::unpack_message_field(*wallet_, msg, "connection");

    ASSERT_TRUE(verified.ok());
    EXPECT_TRUE(verified->verified);
    EXPECT_FALSE(msg.contains("connection~sig"));
    EXPECT_EQ(msg.at("connection"), payload_);
    EXPECT_EQ(msg.id(), original.id());
}

TEST_F(SignedFieldTest, UnpackMissingSignedFieldFails) {
    Message msg = Message::create("did:x;spec/connections/1.0/response");
    msg["connection"] = payload_;

    auto verified = SignedField::unpack_message_field(*wallet_, msg, "connection");

    ASSERT_FALSE(verified.ok());
    EXPECT_EQ(verified.error().kind, ErrorKind::MalformedSignedField);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
