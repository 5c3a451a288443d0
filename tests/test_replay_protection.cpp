/**
 * @file test_replay_protection.cpp
 * @brief Unit tests for SignatureFreshness
 *
 * Tests signed-field freshness policy including:
 * - Signature ID generation (SHA-256)
 * - Time window validation (past and future)
 * - Replay detection
 * - Disabled policy (zero window)
 * - Cache management and thread safety
 */

#include <gtest/gtest.h>
#include "didagent/replay_protection.hpp"
#include "didagent/utilities.hpp"
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>

using namespace didagent;

// Test fixture for freshness tests
class ReplayProtectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        freshness_ = std::make_unique<SignatureFreshness>();
    }

    void TearDown() override {
        freshness_.reset();
    }

    std::unique_ptr<SignatureFreshness> freshness_;

    static uint64_t now() {
        return utilities::current_unix_time();
    }

    static VerifiedField field(uint64_t timestamp, const std::string& signature) {
        VerifiedField f;
        f.payload = Json::object();
        f.verified = true;
        f.timestamp = timestamp;
        f.signer = "GJ1SzoWzavQYfNL9XkaJdrQejfztN4XqdsiV4ct3LXKL";
        f.signature = signature;
        return f;
    }
};

// ============================================================================
// Signature ID Tests
// ============================================================================

TEST_F(ReplayProtectionTest, SignatureIdIsSha256Hex) {
    std::string id = SignatureFreshness::signature_id("signer", "c2lnbmF0dXJl");

    EXPECT_EQ(id.length(), 64u);
    for (char c : id) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
}

TEST_F(ReplayProtectionTest, SignatureIdDeterministicAndDistinct) {
    EXPECT_EQ(SignatureFreshness::signature_id("a", "sig"), SignatureFreshness::signature_id("a", "sig"));
    EXPECT_NE(SignatureFreshness::signature_id("a", "sig1"), SignatureFreshness::signature_id("a", "sig2"));
    EXPECT_NE(SignatureFreshness::signature_id("a", "sig"), SignatureFreshness::signature_id("b", "sig"));
}

// ============================================================================
// Time Window Tests
// ============================================================================

TEST_F(ReplayProtectionTest, DefaultWindow) {
    EXPECT_EQ(freshness_->get_window(), std::chrono::seconds(300));
    EXPECT_TRUE(freshness_->enabled());
}

TEST_F(ReplayProtectionTest, CurrentTimestampIsFresh) {
    EXPECT_TRUE(freshness_->is_timestamp_fresh(now()));
    EXPECT_TRUE(freshness_->is_timestamp_fresh(now() - 299));
    EXPECT_TRUE(freshness_->is_timestamp_fresh(now() + 299));
}

TEST_F(ReplayProtectionTest, OldTimestampIsStale) {
    EXPECT_FALSE(freshness_->is_timestamp_fresh(now() - 301));
    EXPECT_FALSE(freshness_->is_timestamp_fresh(0));
}

TEST_F(ReplayProtectionTest, FutureTimestampIsStale) {
    EXPECT_FALSE(freshness_->is_timestamp_fresh(now() + 301));
}

TEST_F(ReplayProtectionTest, StaleSignatureRejected) {
    auto status = freshness_->check(field(now() - 3600, "c3RhbGU="));

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::SignatureVerificationFailed);
    EXPECT_EQ(freshness_->get_cache_size(), 0u);
}

// ============================================================================
// Replay Detection Tests
// ============================================================================

TEST_F(ReplayProtectionTest, FirstUseAccepted) {
    auto f = field(now(), "Zmlyc3Q=");

    EXPECT_TRUE(freshness_->check(f).ok());
    EXPECT_TRUE(freshness_->has_seen(SignatureFreshness::signature_id(f.signer, f.signature)));
    EXPECT_EQ(freshness_->get_cache_size(), 1u);
}

TEST_F(ReplayProtectionTest, ReplayRejected) {
    auto f = field(now(), "cmVwbGF5");

    ASSERT_TRUE(freshness_->check(f).ok());

    auto replay = freshness_->check(f);
    ASSERT_FALSE(replay.ok());
    EXPECT_EQ(replay.error().kind, ErrorKind::SignatureVerificationFailed);
}

TEST_F(ReplayProtectionTest, DistinctSignaturesAccepted) {
    EXPECT_TRUE(freshness_->check(field(now(), "b25l")).ok());
    EXPECT_TRUE(freshness_->check(field(now(), "dHdv")).ok());
    EXPECT_EQ(freshness_->get_cache_size(), 2u);
}

// ============================================================================
// Disabled Policy Tests
// ============================================================================

TEST_F(ReplayProtectionTest, ZeroWindowDisablesChecks) {
    SignatureFreshness disabled(std::chrono::seconds(0));
    auto f = field(0, "b2xk");

    EXPECT_FALSE(disabled.enabled());
    EXPECT_TRUE(disabled.is_timestamp_fresh(0));
    EXPECT_TRUE(disabled.check(f).ok());
    EXPECT_TRUE(disabled.check(f).ok());
    EXPECT_EQ(disabled.get_cache_size(), 0u);
}

TEST_F(ReplayProtectionTest, NegativeWindowTreatedAsDisabled) {
    SignatureFreshness disabled(std::chrono::seconds(-5));

    EXPECT_FALSE(disabled.enabled());
    EXPECT_EQ(disabled.get_window(), std::chrono::seconds(0));
}

// ============================================================================
// Cache Management Tests
// ============================================================================

TEST_F(ReplayProtectionTest, ClearEmptiesCache) {
    ASSERT_TRUE(freshness_->check(field(now(), "YQ==")).ok());
    ASSERT_TRUE(freshness_->check(field(now(), "Yg==")).ok());

    freshness_->clear();

    EXPECT_EQ(freshness_->get_cache_size(), 0u);
}

TEST_F(ReplayProtectionTest, CleanupKeepsLiveEntries) {
    ASSERT_TRUE(freshness_->check(field(now(), "bGl2ZQ==")).ok());

    EXPECT_EQ(freshness_->cleanup_expired(), 0u);
    EXPECT_EQ(freshness_->get_cache_size(), 1u);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(ReplayProtectionTest, ConcurrentReplayAcceptedOnce) {
    const int num_threads = 8;
    auto f = field(now(), "Y29uY3VycmVudA==");
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([this, &f, &accepted]() {
            if (freshness_->check(f).ok()) {
                accepted++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
