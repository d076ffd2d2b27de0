#include "portcullis/core/net/Socket.h"
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#endif
#include <cerrno>
#include <cstring>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace portcullis::core::net {
namespace {
inline int close_native(int fd) {
#ifdef _WIN32
    return closesocket(fd);
#else
    return ::close(fd);
#endif
}
inline int last_native_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}
inline bool set_blocking(int fd, bool blocking) {
#ifdef _WIN32
    u_long mode = blocking ? 0 : 1; return ioctlsocket(fd, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(fd, F_GETFL, 0); if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
#endif
}
#ifdef _WIN32
constexpr int kShutWrite = SD_SEND;
#else
constexpr int kShutWrite = SHUT_WR;
#endif
}

Socket::Socket() = default;
Socket::Socket(int fd) : handle(fd) {}
Socket::Socket(Socket&& other) noexcept : handle(other.handle), last_errno(other.last_errno) { other.handle = -1; }
Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) { close(); handle = other.handle; last_errno = other.last_errno; other.handle = -1; }
    return *this;
}
Socket::~Socket() { close(); }
bool Socket::valid() const { return handle >= 0; }
int Socket::native() const { return handle; }
void Socket::close() { if (handle >= 0) { close_native(handle); handle = -1; } }

std::optional<int> Socket::recv_some(std::vector<char>& buffer) {
    if (!valid()) { last_errno = EBADF; return std::nullopt; }
    for (;;) {
#ifdef _WIN32
        int r = ::recv(handle, buffer.data(), static_cast<int>(buffer.size()), 0);
#else
        int r = static_cast<int>(::recv(handle, buffer.data(), buffer.size(), 0));
#endif
        if (r > 0) { last_errno = 0; return r; }
        if (r == 0) { last_errno = 0; return std::nullopt; }
        int err = last_native_error();
        if (err == EINTR) continue;
        last_errno = err;
        return std::nullopt;
    }
}

bool Socket::send_all(std::string_view data) {
    if (!valid()) { last_errno = EBADF; return false; }
    const char* p = data.data(); size_t remaining = data.size();
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(handle, p, static_cast<int>(remaining), 0);
#else
        int sent = static_cast<int>(::send(handle, p, remaining, MSG_NOSIGNAL));
#endif
        if (sent < 0 && last_native_error() == EINTR) continue;
        if (sent <= 0) { last_errno = last_native_error(); return false; }
        p += sent; remaining -= static_cast<size_t>(sent);
    }
    return true;
}

std::string Socket::error_text() const {
    if (last_errno == 0) return "end of stream";
    return std::strerror(last_errno);
}

void Socket::shutdown_write() { if (valid()) ::shutdown(handle, kShutWrite); }

bool Socket::set_recv_timeout(int seconds) {
    if (!valid()) return false;
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(seconds) * 1000;
    return setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv)) == 0;
#else
    timeval tv{ seconds, 0 };
    return setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
#endif
}

std::string Socket::peer_address() const {
    if (!valid()) return "-";
    sockaddr_storage addr{}; socklen_t len = sizeof(addr);
    if (getpeername(handle, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return "-";
    char host[NI_MAXHOST]; char serv[NI_MAXSERV];
    if (getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host), serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) return "-";
    return std::string(host) + ":" + serv;
}

Listener::Listener() = default;
Listener::~Listener() { close(); }
bool Listener::valid() const { return handle >= 0; }
void Listener::close() { if (handle >= 0) { close_native(handle); handle = -1; } }

bool Listener::open(const std::string& address, uint16_t port) {
    handle = static_cast<int>(::socket(AF_INET, SOCK_STREAM, 0));
    if (handle < 0) return false;
    int yes = 1;
#ifdef _WIN32
    setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
#else
    setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#endif
    sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_port = htons(port);
    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        close(); return false;
    }
    if (bind(handle, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) { close(); return false; }
    if (listen(handle, 128) < 0) { close(); return false; }
    set_blocking(handle, false);
    return true;
}

Socket Listener::accept() {
    if (!valid()) return Socket();
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    int c = static_cast<int>(::accept(handle, reinterpret_cast<sockaddr*>(&addr), &len));
    if (c < 0) return Socket();
    // accepted sockets may inherit O_NONBLOCK; sessions use blocking I/O
    set_blocking(c, true);
    return Socket(c);
}

uint16_t Listener::local_port() const {
    if (!valid()) return 0;
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    if (getsockname(handle, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
    return ntohs(addr.sin_port);
}
}
