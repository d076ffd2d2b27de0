#pragma once
#include <string>
#include <optional>
#include "portcullis/core/net/Socket.h"

namespace portcullis::core::net {
class UpstreamConnector {
public:
    // Resolves host and connects to the first reachable address.
    // timeout_ms <= 0 waits as long as the OS does.
    static std::optional<Socket> connect(const std::string& host, uint16_t port, int timeout_ms = 0, std::string* error = nullptr);
};
}
