/**
 * @file http_transport.hpp
 * @brief HTTP/1.1 agent transport over ASIO
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * HttpTransport POSTs wire bytes with content type
 * application/ssi-agent-wire; HttpListener accepts them on the agent
 * paths and answers 202 Accepted.
 */

#pragma once

#include "didagent/security_config.hpp"
#include "didagent/transport.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace didagent {

/**
 * @brief Parsed http:// endpoint URL
 */
struct HttpUrl {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";   ///< Path plus query

    /**
     * @brief Parse "http://host[:port][/path][?query]"
     * @return HttpUrl, or std::nullopt for another scheme or a bad port
     */
    static std::optional<HttpUrl> parse(const std::string& url);
};

/**
 * @brief Blocking HTTP POST client
 */
class HttpTransport : public Transport {
public:
    HttpTransport() = default;

    /**
     * @brief POST wire bytes to an endpoint
     * @return Response status, or TransportFailure on a bad URL, connection
     *         failure or timeout
     */
    Result<int> send(const std::string& endpoint, const std::string& wire_bytes) override;
};

/**
 * @brief Inbound HTTP endpoint
 *
 * Accepts POST requests on the configured paths. Replies 404 for another
 * path, 405 for another method, 415 for another content type and 413 for
 * an oversized body; accepted bodies go to the delivery callback and get
 * 202. A connection that has not sent its whole request within the read
 * timeout is closed. Runs its own I/O thread.
 */
class HttpListener {
public:
    /**
     * @brief Configure a listener
     * @param host Interface address to bind ("0.0.0.0" for all)
     * @param port TCP port (0 picks a free port)
     * @param paths Accepted request paths (e.g. "/indy")
     * @param callback Receives accepted bodies
     * @param read_timeout Time a client has to send its whole request
     */
    HttpListener(std::string host,
                 uint16_t port,
                 std::vector<std::string> paths,
                 DeliveryCallback callback,
                 std::chrono::milliseconds read_timeout = security::READ_TIMEOUT);

    ~HttpListener();

    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;

    /**
     * @brief Bind and start serving
     * @return true if listening, false if already running or bind failed
     */
    bool start();

    /**
     * @brief Stop serving and join the I/O thread
     */
    void stop();

    bool is_running() const { return running_; }

    /// Bound port (valid after start)
    uint16_t port() const { return port_; }

private:
    struct Connection;

    std::string host_;
    uint16_t port_;
    std::vector<std::string> paths_;
    DeliveryCallback callback_;
    std::chrono::milliseconds read_timeout_;

    asio::io_context io_context_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    void start_accept();
    void handle_accept(const asio::error_code& error, std::shared_ptr<Connection> connection);
    void handle_headers(std::shared_ptr<Connection> connection);
    void deliver_body(std::shared_ptr<Connection> connection);
    void respond(std::shared_ptr<Connection> connection, int status);
};

} // namespace didagent
