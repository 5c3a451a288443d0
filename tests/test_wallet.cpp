/**
 * @file test_wallet.cpp
 * @brief Unit tests for the SQLite-backed wallet
 *
 * Tests:
 * - Create/open/close/remove lifecycle and its error kinds
 * - Passphrase protection
 * - Key and DID creation, persistence across reopen
 * - Signing and verification through the wallet
 * - Pairwise storage, lookup and ordering
 * - Operations on a closed wallet
 */

#include <gtest/gtest.h>
#include "didagent/wallet.hpp"
#include "didagent/agent_crypto.hpp"
#include "didagent/utilities.hpp"
#include <filesystem>

using namespace didagent;
namespace fs = std::filesystem;

class WalletTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());
        utilities::initialize_logging("", utilities::LogLevel::WARN);

        test_dir_ = fs::temp_directory_path() / ("didagent_wallet_" + utilities::generate_uuid());
        wallet_ = std::make_unique<Wallet>(test_dir_);
    }

    void TearDown() override {
        wallet_.reset();
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    void create_and_open() {
        ASSERT_TRUE(wallet_->create("alice-wallet", "passphrase").ok());
        ASSERT_TRUE(wallet_->open("alice-wallet", "passphrase").ok());
    }

    static PairwiseInfo pairwise(const std::string& their_did, const std::string& label) {
        PairwiseInfo info;
        info.their_did = their_did;
        info.their_verkey = their_did + "-verkey";
        info.my_did = "my-" + their_did;
        info.their_endpoint = "http://" + label + "/indy";
        info.label = label;
        return info;
    }

    fs::path test_dir_;
    std::unique_ptr<Wallet> wallet_;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(WalletTest, CreateAndOpen) {
    EXPECT_FALSE(wallet_->exists("alice-wallet"));

    create_and_open();

    EXPECT_TRUE(wallet_->exists("alice-wallet"));
    EXPECT_TRUE(wallet_->is_open());
    EXPECT_EQ(wallet_->name(), "alice-wallet");
    EXPECT_TRUE(fs::exists(test_dir_ / "alice-wallet.db"));
}

TEST_F(WalletTest, CreateExistingReportsAlreadyExists) {
    ASSERT_TRUE(wallet_->create("alice-wallet", "passphrase").ok());

    auto again = wallet_->create("alice-wallet", "passphrase");

    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().kind, ErrorKind::WalletAlreadyExists);
}

TEST_F(WalletTest, OpenMissingReportsNotFound) {
    auto status = wallet_->open("missing", "passphrase");

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::WalletNotFound);
    EXPECT_FALSE(wallet_->is_open());
}

TEST_F(WalletTest, WrongPassphraseUnavailable) {
    ASSERT_TRUE(wallet_->create("alice-wallet", "passphrase").ok());

    auto status = wallet_->open("alice-wallet", "not-the-passphrase");

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::WalletUnavailable);
    EXPECT_FALSE(wallet_->is_open());
}

TEST_F(WalletTest, InvalidNamesRejected) {
    for (const std::string& name : {std::string(""), std::string("../escape"), std::string("a b")}) {
        auto status = wallet_->create(name, "passphrase");
        ASSERT_FALSE(status.ok()) << name;
        EXPECT_EQ(status.error().kind, ErrorKind::InvalidArgument);
    }
}

TEST_F(WalletTest, CloseAndRemove) {
    create_and_open();

    wallet_->close();
    EXPECT_FALSE(wallet_->is_open());
    EXPECT_EQ(wallet_->name(), "");

    ASSERT_TRUE(wallet_->remove("alice-wallet").ok());
    EXPECT_FALSE(wallet_->exists("alice-wallet"));

    auto again = wallet_->remove("alice-wallet");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().kind, ErrorKind::WalletNotFound);
}

TEST_F(WalletTest, RemoveOpenWalletClosesIt) {
    create_and_open();

    ASSERT_TRUE(wallet_->remove("alice-wallet").ok());

    EXPECT_FALSE(wallet_->is_open());
}

TEST_F(WalletTest, ClosedWalletUnavailable) {
    auto key = wallet_->create_key();
    ASSERT_FALSE(key.ok());
    EXPECT_EQ(key.error().kind, ErrorKind::WalletUnavailable);

    auto signature = wallet_->sign("key", {1, 2, 3});
    ASSERT_FALSE(signature.ok());
    EXPECT_EQ(signature.error().kind, ErrorKind::WalletUnavailable);

    auto listed = wallet_->list_pairwise();
    ASSERT_FALSE(listed.ok());
    EXPECT_EQ(listed.error().kind, ErrorKind::WalletUnavailable);
}

// ============================================================================
// Identity Tests
// ============================================================================

TEST_F(WalletTest, LocalIdentityDerivedFromKey) {
    create_and_open();

    auto identity = wallet_->create_local_identity();
    ASSERT_TRUE(identity.ok());

    auto public_key = Wallet::public_key_from_verkey(identity->verkey);
    ASSERT_TRUE(public_key.has_value());
    EXPECT_EQ(Wallet::verkey_from_public_key(*public_key), identity->verkey);
    EXPECT_EQ(Wallet::did_from_public_key(*public_key), identity->did);

    auto decoded_did = utilities::base58_decode(identity->did);
    ASSERT_TRUE(decoded_did.has_value());
    EXPECT_EQ(decoded_did->size(), 16u);
}

TEST_F(WalletTest, IdentityLookups) {
    create_and_open();
    auto identity = wallet_->create_local_identity();
    ASSERT_TRUE(identity.ok());

    auto did = wallet_->verkey_to_did(identity->verkey);
    ASSERT_TRUE(did.ok());
    EXPECT_EQ(*did, identity->did);

    auto verkey = wallet_->local_key_for_did(identity->did);
    ASSERT_TRUE(verkey.ok());
    EXPECT_EQ(*verkey, identity->verkey);
}

TEST_F(WalletTest, UnknownKeysAndDids) {
    create_and_open();

    auto did = wallet_->verkey_to_did("GJ1SzoWzavQYfNL9XkaJdrQejfztN4XqdsiV4ct3LXKL");
    ASSERT_TRUE(did.ok());
    EXPECT_FALSE(did->has_value());

    auto verkey = wallet_->local_key_for_did("UnknownDid");
    ASSERT_FALSE(verkey.ok());
    EXPECT_EQ(verkey.error().kind, ErrorKind::KeyNotFound);
}

TEST_F(WalletTest, KeysPersistAcrossReopen) {
    create_and_open();
    auto identity = wallet_->create_local_identity();
    ASSERT_TRUE(identity.ok());

    wallet_->close();
    ASSERT_TRUE(wallet_->open("alice-wallet", "passphrase").ok());

    std::vector<uint8_t> data = {'d', 'a', 't', 'a'};
    auto signature = wallet_->sign(identity->verkey, data);
    ASSERT_TRUE(signature.ok());
    EXPECT_TRUE(wallet_->verify(identity->verkey, data, *signature));
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(WalletTest, SignAndVerify) {
    create_and_open();
    auto verkey = wallet_->create_key();
    ASSERT_TRUE(verkey.ok());

    std::vector<uint8_t> data = {1, 2, 3, 4};
    auto signature = wallet_->sign(*verkey, data);
    ASSERT_TRUE(signature.ok());
    EXPECT_EQ(signature->size(), 64u);

    EXPECT_TRUE(wallet_->verify(*verkey, data, *signature));

    data[0] ^= 0xFF;
    EXPECT_FALSE(wallet_->verify(*verkey, data, *signature));
}

TEST_F(WalletTest, VerifyWithMalformedKeyIsFalse) {
    create_and_open();

    EXPECT_FALSE(wallet_->verify("not-base58-0OIl", {1}, std::vector<uint8_t>(64, 0)));
    EXPECT_FALSE(wallet_->verify("", {1}, {}));
}

TEST_F(WalletTest, SignWithForeignKeyFails) {
    create_and_open();

    auto signature = wallet_->sign("GJ1SzoWzavQYfNL9XkaJdrQejfztN4XqdsiV4ct3LXKL", {1});

    ASSERT_FALSE(signature.ok());
    EXPECT_EQ(signature.error().kind, ErrorKind::KeyNotFound);
}

// ============================================================================
// Pairwise Tests
// ============================================================================

TEST_F(WalletTest, StoreAndLookupPairwise) {
    create_and_open();
    auto info = pairwise("TheirDid", "bob");

    ASSERT_TRUE(wallet_->store_pairwise(info).ok());

    auto stored = wallet_->pairwise_info("TheirDid");
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored->their_verkey, info.their_verkey);
    EXPECT_EQ(stored->my_did, info.my_did);
    EXPECT_EQ(stored->their_endpoint, info.their_endpoint);
    EXPECT_EQ(stored->label, "bob");

    auto did = wallet_->verkey_to_did(info.their_verkey);
    ASSERT_TRUE(did.ok());
    EXPECT_EQ(*did, std::optional<std::string>("TheirDid"));
}

TEST_F(WalletTest, StorePairwiseReplaces) {
    create_and_open();
    ASSERT_TRUE(wallet_->store_pairwise(pairwise("TheirDid", "bob")).ok());

    auto updated = pairwise("TheirDid", "robert");
    ASSERT_TRUE(wallet_->store_pairwise(updated).ok());

    auto listed = wallet_->list_pairwise();
    ASSERT_TRUE(listed.ok());
    ASSERT_EQ(listed->size(), 1u);
    EXPECT_EQ(listed->front().label, "robert");
}

TEST_F(WalletTest, ListPairwiseOldestFirst) {
    create_and_open();
    ASSERT_TRUE(wallet_->store_pairwise(pairwise("First", "one")).ok());
    ASSERT_TRUE(wallet_->store_pairwise(pairwise("Second", "two")).ok());
    ASSERT_TRUE(wallet_->store_pairwise(pairwise("Third", "three")).ok());

    auto listed = wallet_->list_pairwise();

    ASSERT_TRUE(listed.ok());
    ASSERT_EQ(listed->size(), 3u);
    EXPECT_EQ((*listed)[0].their_did, "First");
    EXPECT_EQ((*listed)[1].their_did, "Second");
    EXPECT_EQ((*listed)[2].their_did, "Third");
}

TEST_F(WalletTest, UnknownPairwiseNotFound) {
    create_and_open();

    auto info = wallet_->pairwise_info("Nobody");

    ASSERT_FALSE(info.ok());
    EXPECT_EQ(info.error().kind, ErrorKind::KeyNotFound);
}

TEST_F(WalletTest, PairwisePersistsAcrossReopen) {
    create_and_open();
    ASSERT_TRUE(wallet_->store_pairwise(pairwise("TheirDid", "bob")).ok());

    wallet_->close();
    ASSERT_TRUE(wallet_->open("alice-wallet", "passphrase").ok());

    auto stored = wallet_->pairwise_info("TheirDid");
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored->label, "bob");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
