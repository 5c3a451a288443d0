/**
 * @file test_http_transport.cpp
 * @brief Tests for the HTTP transport and listener
 *
 * Tests:
 * - Endpoint URL parsing
 * - POST delivery to a local listener (202)
 * - Unknown paths (404) and unreachable endpoints
 * - Idle connections closed after the read timeout
 */

#include <gtest/gtest.h>
#include "didagent/http_transport.hpp"
#include "didagent/message_queue.hpp"
#include "didagent/utilities.hpp"
#include <chrono>
#include <stdexcept>

using namespace didagent;
using namespace std::chrono_literals;

class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        utilities::initialize_logging("", utilities::LogLevel::WARN);

        listener_ = std::make_unique<HttpListener>("127.0.0.1", 0, std::vector<std::string>{"/indy", "/offer"},
                                                   [this](const std::string& body) { inbox_.push(body); });
        ASSERT_TRUE(listener_->start());
        base_ = "http://127.0.0.1:" + std::to_string(listener_->port());
    }

    void TearDown() override {
        listener_->stop();
    }

    std::unique_ptr<HttpListener> listener_;
    MessageQueue<std::string> inbox_;
    std::string base_;
    HttpTransport transport_;
};

// ============================================================================
// URL Tests
// ============================================================================

TEST_F(HttpTransportTest, ParseUrl) {
    auto url = HttpUrl::parse("http://agent.example:3001/indy?c_i=abc");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "agent.example");
    EXPECT_EQ(url->port, 3001);
    EXPECT_EQ(url->target, "/indy?c_i=abc");
}

TEST_F(HttpTransportTest, ParseUrlDefaults) {
    auto bare = HttpUrl::parse("http://agent");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->port, 80);
    EXPECT_EQ(bare->target, "/");

    auto query = HttpUrl::parse("http://agent?x=1");
    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->target, "/?x=1");
}

TEST_F(HttpTransportTest, ParseUrlRejectsBadInput) {
    EXPECT_FALSE(HttpUrl::parse("https://agent/indy").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://agent:0/indy").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://agent:70000/indy").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://agent:port/indy").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://:3000/indy").has_value());
}

// ============================================================================
// Delivery Tests
// ============================================================================

TEST_F(HttpTransportTest, PostIsAccepted) {
    auto status = transport_.send(base_ + "/indy", "wire bytes");

    ASSERT_TRUE(status.ok()) << status.error().to_string();
    EXPECT_EQ(*status, 202);

    auto body = inbox_.wait_for(2s);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "wire bytes");
}

TEST_F(HttpTransportTest, LargeBodyDelivered) {
    std::string payload(200000, 'x');

    auto status = transport_.send(base_ + "/offer", payload);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(*status, 202);
    auto body = inbox_.wait_for(2s);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->size(), payload.size());
}

TEST_F(HttpTransportTest, UnknownPathIsNotFound) {
    auto status = transport_.send(base_ + "/other", "wire bytes");

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(*status, 404);
    EXPECT_FALSE(inbox_.wait_for(100ms).has_value());
}

TEST_F(HttpTransportTest, CallbackFailureStillAccepted) {
    HttpListener failing("127.0.0.1", 0, {"/indy"},
                         [](const std::string&) { throw std::runtime_error("delivery failed"); });
    ASSERT_TRUE(failing.start());

    auto status = transport_.send("http://127.0.0.1:" + std::to_string(failing.port()) + "/indy", "x");

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(*status, 202);
    failing.stop();
}

// ============================================================================
// Failure Tests
// ============================================================================

TEST_F(HttpTransportTest, UnsupportedUrlFails) {
    auto status = transport_.send("ftp://agent/indy", "x");

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::TransportFailure);
}

TEST_F(HttpTransportTest, ClosedPortFails) {
    std::string endpoint = base_ + "/indy";
    listener_->stop();

    auto status = transport_.send(endpoint, "x");

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::TransportFailure);
}

TEST_F(HttpTransportTest, IdleConnectionIsClosed) {
    HttpListener quick("127.0.0.1", 0, {"/indy"}, [](const std::string&) {}, 200ms);
    ASSERT_TRUE(quick.start());

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), quick.port()));

    // Send nothing and wait for the listener to hang up
    char byte = 0;
    bool closed = false;
    asio::error_code read_error;
    socket.async_read_some(asio::buffer(&byte, 1), [&](const asio::error_code& error, std::size_t) {
        closed = true;
        read_error = error;
    });
    io.run_for(3s);

    EXPECT_TRUE(closed);
    EXPECT_TRUE(read_error == asio::error::eof || read_error == asio::error::connection_reset)
        << read_error.message();
    quick.stop();
}

TEST_F(HttpTransportTest, StartTwiceFails) {
    EXPECT_TRUE(listener_->is_running());
    EXPECT_FALSE(listener_->start());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
