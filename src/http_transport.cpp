/**
 * @file http_transport.cpp
 * @brief Implementation of the HTTP transport and listener
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "didagent/http_transport.hpp"
#include "didagent/security_config.hpp"
#include "didagent/utilities.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace didagent {

namespace {
    std::string status_text(int status) {
        switch (status) {
            case 202: return "Accepted";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 411: return "Length Required";
            case 413: return "Payload Too Large";
            case 415: return "Unsupported Media Type";
            default:  return "Error";
        }
    }

    std::string trim(const std::string& text) {
        auto begin = text.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            return "";
        }
        auto end = text.find_last_not_of(" \t");
        return text.substr(begin, end - begin + 1);
    }

    std::optional<size_t> parse_size(const std::string& text) {
        if (text.empty() || text.size() > 12 ||
            !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::stoull(text));
    }

    /**
     * @brief Run queued async work until it finishes or the timeout elapses
     * @return false on timeout (the socket is closed and the handler drained)
     */
    bool run_with_timeout(asio::io_context& io,
                          asio::ip::tcp::socket& socket,
                          const asio::error_code& result,
                          std::chrono::steady_clock::duration timeout) {
        io.restart();
        io.run_for(timeout);

        if (result == asio::error::would_block) {
            asio::error_code ignored;
            socket.close(ignored);
            io.restart();
            io.run();
            return false;
        }
        return true;
    }
}

// ============================================================================
// HttpUrl
// ============================================================================

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.size() <= scheme.size() || utilities::to_lowercase(url.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    auto target_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, target_pos);

    HttpUrl parsed;
    if (target_pos != std::string::npos) {
        parsed.target = rest.substr(target_pos);
        if (parsed.target[0] == '?') {
            parsed.target = "/" + parsed.target;
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        auto port = parse_size(authority.substr(colon + 1));
        if (!port || *port == 0 || *port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(*port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    parsed.host = authority;

    return parsed;
}

// ============================================================================
// HttpTransport
// ============================================================================

Result<int> HttpTransport::send(const std::string& endpoint, const std::string& wire_bytes) {
    auto url = HttpUrl::parse(endpoint);
    if (!url) {
        return Error(ErrorKind::TransportFailure, "Unsupported endpoint URL: " + endpoint);
    }

    try {
        asio::io_context io;
        asio::ip::tcp::resolver resolver(io);
        asio::ip::tcp::socket socket(io);

        asio::error_code ec;
        auto endpoints = resolver.resolve(url->host, std::to_string(url->port), ec);
        if (ec) {
            return Error(ErrorKind::TransportFailure, "Cannot resolve " + url->host + ": " + ec.message());
        }

        // Connect
        asio::error_code result = asio::error::would_block;
        asio::async_connect(socket, endpoints,
            [&result](const asio::error_code& error, const asio::ip::tcp::endpoint&) {
                result = error;
            });

        if (!run_with_timeout(io, socket, result, security::CONNECTION_TIMEOUT)) {
            return Error(ErrorKind::TransportFailure, "Connection to " + endpoint + " timed out");
        }
        if (result) {
            return Error(ErrorKind::TransportFailure, "Cannot connect to " + endpoint + ": " + result.message());
        }

        // Request
        std::ostringstream request;
        request << "POST " << url->target << " HTTP/1.1\r\n"
                << "Host: " << url->host << ":" << url->port << "\r\n"
                << "Content-Type: " << security::WIRE_CONTENT_TYPE << "\r\n"
                << "Content-Length: " << wire_bytes.size() << "\r\n"
                << "Connection: close\r\n"
                << "\r\n"
                << wire_bytes;
        std::string request_text = request.str();

        result = asio::error::would_block;
        asio::async_write(socket, asio::buffer(request_text),
            [&result](const asio::error_code& error, std::size_t) {
                result = error;
            });

        if (!run_with_timeout(io, socket, result, security::READ_TIMEOUT)) {
            return Error(ErrorKind::TransportFailure, "Sending to " + endpoint + " timed out");
        }
        if (result) {
            return Error(ErrorKind::TransportFailure, "Write to " + endpoint + " failed: " + result.message());
        }

        // Status line
        std::string response;
        result = asio::error::would_block;
        asio::async_read_until(socket, asio::dynamic_buffer(response, security::MAX_HTTP_HEADER_SIZE), "\r\n",
            [&result](const asio::error_code& error, std::size_t) {
                result = error;
            });

        if (!run_with_timeout(io, socket, result, security::READ_TIMEOUT)) {
            return Error(ErrorKind::TransportFailure, "Response from " + endpoint + " timed out");
        }
        if (result) {
            return Error(ErrorKind::TransportFailure, "Read from " + endpoint + " failed: " + result.message());
        }

        socket.close(ec);

        // "HTTP/1.1 202 Accepted"
        std::istringstream status_line(response.substr(0, response.find("\r\n")));
        std::string version;
        int status = 0;
        status_line >> version >> status;
        if (version.rfind("HTTP/", 0) != 0 || status < 100 || status > 599) {
            return Error(ErrorKind::TransportFailure, "Malformed HTTP response from " + endpoint);
        }

        return status;

    } catch (const std::exception& e) {
        return Error(ErrorKind::TransportFailure, "HTTP send to " + endpoint + " failed: " + e.what());
    }
}

// ============================================================================
// HttpListener
// ============================================================================

struct HttpListener::Connection {
    explicit Connection(asio::io_context& io) : socket(io), deadline(io) {}

    void close() {
        deadline.cancel();
        asio::error_code ignored;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    asio::ip::tcp::socket socket;
    asio::steady_timer deadline;    ///< Bounds the whole request read
    std::string buffer;             ///< Header block, possibly followed by a body prefix
    std::string body;
    size_t content_length = 0;
    std::string response;
};

HttpListener::HttpListener(std::string host,
                           uint16_t port,
                           std::vector<std::string> paths,
                           DeliveryCallback callback,
                           std::chrono::milliseconds read_timeout)
    : host_(std::move(host))
    , port_(port)
    , paths_(std::move(paths))
    , callback_(std::move(callback))
    , read_timeout_(read_timeout)
{
}

HttpListener::~HttpListener() {
    stop();
}

bool HttpListener::start() {
    if (running_.exchange(true)) {
        utilities::log_warn("HttpListener: Already running");
        return false;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host_), port_);

        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        port_ = acceptor_->local_endpoint().port();

        io_context_.restart();
        start_accept();

        io_thread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                utilities::log_error("HttpListener: I/O thread error: " + std::string(e.what()));
            }
        });

        utilities::log_info("HttpListener: Listening on " + host_ + ":" + std::to_string(port_));
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("HttpListener: Failed to start on " + host_ + ":" +
                             std::to_string(port_) + ": " + e.what());
        acceptor_.reset();
        running_ = false;
        return false;
    }
}

void HttpListener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    io_context_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    if (acceptor_ && acceptor_->is_open()) {
        asio::error_code ignored;
        acceptor_->close(ignored);
    }
    acceptor_.reset();

    utilities::log_info("HttpListener: Stopped");
}

void HttpListener::start_accept() {
    auto connection = std::make_shared<Connection>(io_context_);

    acceptor_->async_accept(
        connection->socket,
        [this, connection](const asio::error_code& error) {
            handle_accept(error, connection);
        }
    );
}

void HttpListener::handle_accept(const asio::error_code& error, std::shared_ptr<Connection> connection) {
    if (!error) {
        connection->deadline.expires_after(read_timeout_);
        connection->deadline.async_wait([connection](const asio::error_code& timer_error) {
            if (timer_error == asio::error::operation_aborted) {
                return;
            }
            utilities::log_warn("HttpListener: Request not received in time, closing connection");
            connection->close();
        });

        asio::async_read_until(
            connection->socket,
            asio::dynamic_buffer(connection->buffer, security::MAX_HTTP_HEADER_SIZE),
            "\r\n\r\n",
            [this, connection](const asio::error_code& read_error, std::size_t header_length) {
                if (read_error) {
                    if (read_error == asio::error::not_found) {
                        respond(connection, 413);
                    } else {
                        connection->close();
                    }
                    return;
                }
                connection->body = connection->buffer.substr(header_length);
                connection->buffer.resize(header_length);
                handle_headers(connection);
            }
        );
    }

    // Continue accepting
    if (running_) {
        start_accept();
    }
}

void HttpListener::handle_headers(std::shared_ptr<Connection> connection) {
    std::istringstream stream(connection->buffer);
    std::string request_line;
    std::getline(stream, request_line);

    std::istringstream request(request_line);
    std::string method;
    std::string target;
    request >> method >> target;

    std::string content_type;
    std::optional<size_t> content_length;

    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = utilities::to_lowercase(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (name == "content-type") {
            content_type = utilities::to_lowercase(trim(value.substr(0, value.find(';'))));
        } else if (name == "content-length") {
            content_length = parse_size(value);
        }
    }

    std::string path = target.substr(0, target.find('?'));

    if (std::find(paths_.begin(), paths_.end(), path) == paths_.end()) {
        respond(connection, 404);
        return;
    }
    if (method != "POST") {
        respond(connection, 405);
        return;
    }
    if (content_type != security::WIRE_CONTENT_TYPE) {
        utilities::log_warn("HttpListener: Rejected content type '" + content_type + "'");
        respond(connection, 415);
        return;
    }
    if (!content_length) {
        respond(connection, 411);
        return;
    }
    if (*content_length > security::MAX_MESSAGE_SIZE) {
        respond(connection, 413);
        return;
    }

    connection->content_length = *content_length;

    if (connection->body.size() >= connection->content_length) {
        connection->body.resize(connection->content_length);
        deliver_body(connection);
        return;
    }

    asio::async_read(
        connection->socket,
        asio::dynamic_buffer(connection->body),
        asio::transfer_exactly(connection->content_length - connection->body.size()),
        [this, connection](const asio::error_code& error, std::size_t) {
            if (error) {
                utilities::log_warn("HttpListener: Incomplete request body: " + error.message());
                connection->close();
                return;
            }
            deliver_body(connection);
        }
    );
}

void HttpListener::deliver_body(std::shared_ptr<Connection> connection) {
    try {
        if (callback_) {
            callback_(connection->body);
        }
    } catch (const std::exception& e) {
        utilities::log_error("HttpListener: Delivery callback failed: " + std::string(e.what()));
    }

    respond(connection, security::HTTP_ACCEPTED);
}

void HttpListener::respond(std::shared_ptr<Connection> connection, int status) {
    std::ostringstream response;
    response << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
    if (status == 405) {
        response << "Allow: POST\r\n";
    }
    response << "Content-Length: 0\r\n"
             << "Connection: close\r\n"
             << "\r\n";
    connection->response = response.str();
    connection->deadline.cancel();

    asio::async_write(
        connection->socket,
        asio::buffer(connection->response),
        [connection](const asio::error_code&, std::size_t) {
            connection->close();
        }
    );
}

} // namespace didagent
