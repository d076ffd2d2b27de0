#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace portcullis::core::net {
// Owning wrapper around a connected, blocking TCP socket.
class Socket {
public:
    Socket();
    explicit Socket(int fd);
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket();
    bool valid() const;
    int native() const;
    void close();
    // Reads whatever is available into buffer. nullopt on end-of-stream or error;
    // eof() tells the two apart afterwards.
    std::optional<int> recv_some(std::vector<char>& buffer);
    bool send_all(std::string_view data);
    bool eof() const { return last_errno == 0; }
    std::string error_text() const;
    // Half-close: the peer sees end-of-stream, reading stays possible.
    void shutdown_write();
    bool set_recv_timeout(int seconds);
    std::string peer_address() const;
private:
    int handle{-1};
    int last_errno{0};
};

class Listener {
public:
    Listener();
    ~Listener();
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;
    // Binds address:port (port 0 picks an ephemeral port). Non-blocking accept.
    bool open(const std::string& address, uint16_t port);
    Socket accept();
    void close();
    bool valid() const;
    uint16_t local_port() const;
private:
    int handle{-1};
};
}
