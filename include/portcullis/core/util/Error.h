#pragma once
#include <stdexcept>
#include <string>

namespace portcullis::core::util {
// Base of every error the proxy raises on purpose.
class ProxyError : public std::runtime_error {
public:
    explicit ProxyError(const std::string& what) : std::runtime_error(what) {}
};

// Filter configuration missing or malformed. Fatal at startup.
class ConfigError : public ProxyError {
public:
    explicit ConfigError(const std::string& what) : ProxyError(what) {}
};

// Request lacks a usable target authority. Fails only that request.
class RequestError : public ProxyError {
public:
    explicit RequestError(const std::string& what) : ProxyError(what) {}
};

// Connecting to or talking with an origin server failed.
class TransportError : public ProxyError {
public:
    explicit TransportError(const std::string& what) : ProxyError(what) {}
};

// Client sent bytes that are not valid HTTP/1.x framing. Ends the connection.
class ProtocolError : public ProxyError {
public:
    explicit ProtocolError(const std::string& what) : ProxyError(what) {}
};
}
