// include/telemetrydeck/error.hpp
// Single error class with kind enum.

#pragma once

#include <string>
#include <stdexcept>

namespace telemetrydeck {

enum class ErrorKind {
    Configuration,  // Invalid config at construction
    Hashing,        // Digest of the user identifier failed
    Serialization,  // Signal cannot be encoded as JSON
    Network,        // Transport failure (DNS, connect, TLS, timeout)
    Http            // Ingestion endpoint answered with a non-2xx status
};

class TelemetryDeckError : public std::exception {
public:
    TelemetryDeckError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    TelemetryDeckError(long status, std::string body)
        : kind_(ErrorKind::Http),
          message_("HTTP error: " + std::to_string(status)),
          status_(status), body_(std::move(body)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    // Response status and body; only set for ErrorKind::Http.
    long status() const noexcept { return status_; }
    const std::string& body() const noexcept { return body_; }

    static TelemetryDeckError configuration(std::string msg) {
        return TelemetryDeckError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static TelemetryDeckError hashing(std::string msg) {
        return TelemetryDeckError(ErrorKind::Hashing, "hashing error: " + msg);
    }

    static TelemetryDeckError serialization(std::string msg) {
        return TelemetryDeckError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static TelemetryDeckError network(std::string msg) {
        return TelemetryDeckError(ErrorKind::Network, "network error: " + msg);
    }

    static TelemetryDeckError http(long status, std::string body) {
        return TelemetryDeckError(status, std::move(body));
    }

private:
    ErrorKind kind_;
    std::string message_;
    long status_ = 0;
    std::string body_;
};

} // namespace telemetrydeck
