#pragma once

#include <stdexcept>
#include <string>

namespace blindxfer {

// Network failure or a retryable HTTP status. The only retryable kind.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message, long http_status = 0)
        : std::runtime_error(message), http_status_(http_status) {}

    long HttpStatus() const noexcept { return http_status_; }

private:
    long http_status_ = 0;
};

// A frame failed its tag check or was truncated. Never retried.
class AuthenticationError : public std::runtime_error {
public:
    explicit AuthenticationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Missing or inconsistent metadata, malformed responses, rejected requests.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error(message) {}
};

class UnsupportedError : public std::runtime_error {
public:
    explicit UnsupportedError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace blindxfer
