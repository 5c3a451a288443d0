/**
 * @file errors.hpp
 * @brief Error kinds and result types for DIDAgent operations
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Operations report expected conditions (wallet already exists, unroutable
 * message, failed signature) as values so callers can tell benign outcomes
 * from fatal ones without catching exception subclasses.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <stdexcept>

namespace didagent {

/**
 * @brief Error taxonomy shared by all DIDAgent components
 */
enum class ErrorKind {
    MalformedWireBytes,           ///< Neither plaintext-parseable nor decryptable
    UnroutableMessage,            ///< No family or no handler for the @type
    InvalidHandshakeMessage,      ///< Missing required field or shape mismatch
    SignatureVerificationFailed,  ///< Signed field did not verify (or is stale)
    MalformedSignedField,         ///< Signed field cannot be decoded at all
    WalletUnavailable,            ///< Wallet not open, or cannot be opened
    WalletAlreadyExists,          ///< Benign: wallet file is already there
    WalletNotFound,               ///< Wallet file does not exist
    KeyNotFound,                  ///< Verkey or DID unknown to the wallet
    DuplicateRegistration,        ///< Family or @type registered twice
    TransportFailure,             ///< Endpoint unreachable or bad status
    Timeout,                      ///< Bounded wait elapsed without a message
    UnexpectedMessage,            ///< A message arrived where silence was expected
    InvalidArgument               ///< Caller supplied an unusable value
};

/**
 * @brief Convert ErrorKind to its display name
 */
inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedWireBytes: return "MalformedWireBytes";
        case ErrorKind::UnroutableMessage: return "UnroutableMessage";
        case ErrorKind::InvalidHandshakeMessage: return "InvalidHandshakeMessage";
        case ErrorKind::SignatureVerificationFailed: return "SignatureVerificationFailed";
        case ErrorKind::MalformedSignedField: return "MalformedSignedField";
        case ErrorKind::WalletUnavailable: return "WalletUnavailable";
        case ErrorKind::WalletAlreadyExists: return "WalletAlreadyExists";
        case ErrorKind::WalletNotFound: return "WalletNotFound";
        case ErrorKind::KeyNotFound: return "KeyNotFound";
        case ErrorKind::DuplicateRegistration: return "DuplicateRegistration";
        case ErrorKind::TransportFailure: return "TransportFailure";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::UnexpectedMessage: return "UnexpectedMessage";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

/**
 * @brief Error value carried by Result and Status
 */
struct Error {
    ErrorKind kind;         ///< Error classification
    std::string message;    ///< Human-readable detail for logs

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    std::string to_string() const {
        return std::string(error_kind_to_string(kind)) + ": " + message;
    }
};

/**
 * @brief Value-or-error result of an operation
 *
 * Accessing value() on an error (or error() on a value) is a programming
 * mistake and throws std::logic_error.
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + error().to_string());
        }
        return std::get<T>(data_);
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on success");
        }
        return std::get<Error>(data_);
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

private:
    std::variant<T, Error> data_;
};

/**
 * @brief Result of an operation that produces no value
 */
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), failed_(true) {}

    static Status success() { return Status(); }

    bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (!failed_) {
            throw std::logic_error("Status::error() on success");
        }
        return error_;
    }

private:
    Error error_{ErrorKind::InvalidArgument, ""};
    bool failed_ = false;
};

} // namespace didagent
