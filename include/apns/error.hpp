// include/apns/error.hpp
// Single exception class with kind enum.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace apns {

enum class ErrorKind {
    Configuration,  // Invalid config or arguments at construction
    Validation,     // Bad device token (fatal to the connection)
    Serialization,  // Payload body could not be marshaled (fatal)
    Network,        // Transport write failure (stream closed, no retry)
    Closed,         // Connection or stream already closed
    Io              // System I/O error on read
};

class ApnsError : public std::exception {
public:
    ApnsError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    static ApnsError configuration(std::string msg) {
        return ApnsError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static ApnsError invalid_token(std::string reason) {
        return ApnsError(ErrorKind::Validation, "invalid device token: " + reason);
    }

    static ApnsError payload_too_large(size_t size, size_t max) {
        return ApnsError(ErrorKind::Serialization,
            "serialization error: payload is " + std::to_string(size) +
            " bytes, max " + std::to_string(max));
    }

    static ApnsError serialization(std::string msg) {
        return ApnsError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static ApnsError network(std::string msg) {
        return ApnsError(ErrorKind::Network, "network error: " + msg);
    }

    static ApnsError closed() {
        return ApnsError(ErrorKind::Closed, "connection is closed");
    }

    static ApnsError closed(std::string msg) {
        return ApnsError(ErrorKind::Closed, "closed: " + msg);
    }

    static ApnsError io(std::string msg) {
        return ApnsError(ErrorKind::Io, "io error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace apns
