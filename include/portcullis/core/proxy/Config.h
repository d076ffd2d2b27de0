#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace portcullis::core::proxy {
struct Config {
    std::string listenAddress { "127.0.0.1" };
    uint16_t listenPort { 8080 };          // 0 picks an ephemeral port
    // Hardening knobs; 0 keeps the unbounded default behaviour.
    int connectTimeoutMs { 0 };            // origin TCP connect, HTTP and CONNECT alike
    int idleTimeoutSec { 0 };              // receive timeout on origin and tunnel sockets
    std::size_t maxHeaderBytes { 64 * 1024 };
    std::size_t relayBufferBytes { 16 * 1024 };
};
}
