#include "portcullis/core/net/UpstreamConnector.h"
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#endif
#include <cerrno>
#include <cstring>

namespace portcullis::core::net {
namespace {
void set_error(std::string* out, const std::string& text) { if (out) *out = text; }
}

std::optional<Socket> UpstreamConnector::connect(const std::string& host, uint16_t port, int timeout_ms, std::string* error) {
    if (host.empty()) { set_error(error, "empty host"); return std::nullopt; }
    auto port_str = std::to_string(port);
    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM; hints.ai_protocol = IPPROTO_TCP;
    addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
#ifdef _WIN32
        set_error(error, "cannot resolve " + host);
#else
        set_error(error, std::string("cannot resolve ") + host + ": " + gai_strerror(gai));
#endif
        return std::nullopt;
    }
    std::string last = "no usable address";
    for (auto p = res; p; p = p->ai_next) {
#ifdef _WIN32
        int s = (int)::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;
        if (timeout_ms <= 0) {
            if (::connect(s, p->ai_addr, (int)p->ai_addrlen) == SOCKET_ERROR) { last = "connect failed"; closesocket(s); continue; }
        } else {
            u_long mode = 1; ioctlsocket(s, FIONBIO, &mode);
            int r = ::connect(s, p->ai_addr, (int)p->ai_addrlen);
            if (r == SOCKET_ERROR) {
                int err = WSAGetLastError();
                if (err != WSAEWOULDBLOCK && err != WSAEINPROGRESS) { last = "connect failed"; closesocket(s); continue; }
                WSAPOLLFD pfd{}; pfd.fd = (SOCKET)s; pfd.events = POLLWRNORM;
                if (WSAPoll(&pfd, 1, timeout_ms) <= 0 || (pfd.revents & (POLLERR | POLLHUP))) { last = "connect failed or timed out"; closesocket(s); continue; }
            }
            u_long mode0 = 0; ioctlsocket(s, FIONBIO, &mode0);
        }
        ::freeaddrinfo(res);
        return Socket(s);
#else
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last = std::strerror(errno); continue; }
        if (timeout_ms <= 0) {
            int r;
            do { r = ::connect(s, p->ai_addr, p->ai_addrlen); } while (r < 0 && errno == EINTR);
            if (r < 0) { last = std::strerror(errno); ::close(s); continue; }
        } else {
            int flags = fcntl(s, F_GETFL, 0); fcntl(s, F_SETFL, flags | O_NONBLOCK);
            int r = ::connect(s, p->ai_addr, p->ai_addrlen);
            if (r < 0) {
                if (errno != EINPROGRESS) { last = std::strerror(errno); ::close(s); continue; }
                pollfd pfd{}; pfd.fd = s; pfd.events = POLLOUT;
                int ready;
                do { ready = ::poll(&pfd, 1, timeout_ms); } while (ready < 0 && errno == EINTR);
                if (ready <= 0) { last = ready == 0 ? "connect timed out" : std::strerror(errno); ::close(s); continue; }
                int so_error = 0; socklen_t len = sizeof(so_error);
                if (getsockopt(s, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
                    last = std::strerror(so_error ? so_error : errno); ::close(s); continue;
                }
            }
            fcntl(s, F_SETFL, flags);
        }
        ::freeaddrinfo(res);
        return Socket(s);
#endif
    }
    if (res) ::freeaddrinfo(res);
    set_error(error, last);
    return std::nullopt;
}
}
