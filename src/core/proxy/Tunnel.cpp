#include "portcullis/core/proxy/Tunnel.h"
#include "portcullis/core/net/UpstreamConnector.h"
#include "portcullis/core/util/Error.h"
#include "portcullis/core/util/Logger.h"
#ifdef _WIN32
#include <winsock2.h>
#else
#include <sys/socket.h>
#endif
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string_view>
#include <thread>
#include <vector>
#include <fmt/format.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace portcullis::core::proxy {
using util::RequestError;
using util::TransportError;

namespace {
struct Direction {
    uint64_t bytes{0};
    std::string error;
};

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Shared by both directions of one tunnel: the tunnel is idle only when
// neither direction moved a byte for the whole window.
struct Activity {
    std::atomic<long long> last{now_ms()};
    long long window_ms{0};
    void touch() { last.store(now_ms()); }
    bool expired() const { return window_ms <= 0 || now_ms() - last.load() >= window_ms; }
};

bool timed_out(int err) {
#ifdef _WIN32
    return err == WSAETIMEDOUT || err == WSAEWOULDBLOCK;
#else
    return err == EAGAIN || err == EWOULDBLOCK;
#endif
}

int last_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

// Works on the native handles: each socket is read by one thread and written
// by the other, so the Socket wrappers' error state is left alone.
void pump(int from, int to, std::size_t buffer_bytes, Activity& activity, Direction& result) {
    std::vector<char> buf(buffer_bytes);
    for (;;) {
#ifdef _WIN32
        int r = ::recv(from, buf.data(), (int)buf.size(), 0);
#else
        int r = (int)::recv(from, buf.data(), buf.size(), 0);
#endif
        if (r < 0) {
            int err = last_error();
            if (err == EINTR) continue;
            // a receive timeout on a quiet direction is fine while the other one is busy
            if (timed_out(err)) {
                if (!activity.expired()) continue;
                result.error = "tunnel idle timeout";
                break;
            }
            result.error = std::strerror(err);
            break;
        }
        if (r == 0) break;
        activity.touch();
        const char* p = buf.data(); int remaining = r;
        while (remaining > 0) {
#ifdef _WIN32
            int sent = ::send(to, p, remaining, 0);
#else
            int sent = (int)::send(to, p, (size_t)remaining, MSG_NOSIGNAL);
#endif
            if (sent < 0 && last_error() == EINTR) continue;
            if (sent <= 0) { result.error = std::strerror(last_error()); break; }
            p += sent; remaining -= sent;
        }
        if (!result.error.empty()) break;
        result.bytes += (uint64_t)r;
    }
#ifdef _WIN32
    if (result.error.empty()) { ::shutdown(to, SD_SEND); }
    else { ::shutdown(from, SD_BOTH); ::shutdown(to, SD_BOTH); }
#else
    if (result.error.empty()) { ::shutdown(to, SHUT_WR); }
    else { ::shutdown(from, SHUT_RDWR); ::shutdown(to, SHUT_RDWR); }
#endif
}
}

TunnelStats relay(net::Socket& client, net::Socket& origin, std::size_t buffer_bytes, int idle_timeout_sec) {
    Activity activity;
    if (idle_timeout_sec > 0) {
        activity.window_ms = idle_timeout_sec * 1000LL;
        // wakes a blocked direction once per window so it can check the shared clock
        client.set_recv_timeout(idle_timeout_sec);
        origin.set_recv_timeout(idle_timeout_sec);
    }
    Direction upstream, downstream;
    int cfd = client.native(), ofd = origin.native();
    std::thread helper([&]{ pump(cfd, ofd, buffer_bytes, activity, upstream); });
    pump(ofd, cfd, buffer_bytes, activity, downstream);
    helper.join();
    TunnelStats stats;
    stats.clientToOrigin = upstream.bytes;
    stats.originToClient = downstream.bytes;
    stats.error = !upstream.error.empty() ? upstream.error : downstream.error;
    return stats;
}

TunnelEstablisher::TunnelEstablisher(Config cfg) : config(std::move(cfg)) {}

http::Authority TunnelEstablisher::target_of(const http::HttpRequest& req) {
    auto authority = http::uri_authority(req.request_line);
    if (authority.empty()) throw RequestError(fmt::format("CONNECT request missing authority in target '{}'", req.request_line.target));
    auto split = http::split_authority(authority, 443);
    if (!split) throw RequestError(fmt::format("CONNECT target '{}' is not host:port", authority));
    return *split;
}

http::HttpResponse TunnelEstablisher::acknowledgment() {
    http::HttpResponse resp;
    resp.status_line = http::HttpStatusLine{ "HTTP/1.1", 200, "Connection Established" };
    return resp;
}

TunnelStats TunnelEstablisher::run(net::Socket& client, std::string client_preface, const http::Authority& target) {
    std::string error;
    auto origin = net::UpstreamConnector::connect(target.host, target.port, config.connectTimeoutMs, &error);
    if (!origin) {
        client.close();
        throw TransportError(fmt::format("tunnel connect to {}:{} failed: {}", target.host, target.port, error));
    }
    util::log_debug(fmt::format("tunnel open {}:{}", target.host, target.port));
    if (!client_preface.empty() && !origin->send_all(client_preface)) {
        auto reason = origin->error_text();
        client.close();
        throw TransportError(fmt::format("tunnel to {}:{} failed before relay: {}", target.host, target.port, reason));
    }
    auto stats = relay(client, *origin, config.relayBufferBytes, config.idleTimeoutSec);
    stats.clientToOrigin += client_preface.size();
    origin->close();
    client.close();
    util::log_debug(fmt::format("tunnel closed {}:{} up {} down {}", target.host, target.port, stats.clientToOrigin, stats.originToClient));
    return stats;
}
}
