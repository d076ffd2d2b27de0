#pragma once
#include <cstdint>
#include <string>
#include "portcullis/core/http/HostUtil.h"
#include "portcullis/core/http/HttpParser.h"
#include "portcullis/core/net/Socket.h"
#include "portcullis/core/proxy/Config.h"

namespace portcullis::core::proxy {
struct TunnelStats {
    uint64_t clientToOrigin{0};
    uint64_t originToClient{0};
    std::string error; // first I/O error seen by either direction, empty on a clean close
};

class TunnelEstablisher {
public:
    explicit TunnelEstablisher(Config cfg = {});

    // host:port of a CONNECT target; a missing port means 443. Throws util::RequestError.
    static http::Authority target_of(const http::HttpRequest& req);

    // 200 with an empty body. It goes out before the origin is contacted: the
    // client learns about an unreachable origin only through the connection
    // being closed, never through an error status.
    static http::HttpResponse acknowledgment();

    // Connects to target, writes client_preface (bytes the client already sent
    // past the CONNECT head) and relays until both directions ended. Closes both
    // sockets. Throws util::TransportError when the origin cannot be reached.
    TunnelStats run(net::Socket& client, std::string client_preface, const http::Authority& target);

private:
    Config config;
};

// Exact byte copy in both directions, one of them on a helper thread. A
// direction that sees end-of-stream half-closes its destination so the other
// one can drain; an I/O error shuts both sockets down. With idle_timeout_sec
// set, the tunnel ends once neither direction moved a byte for that long.
TunnelStats relay(net::Socket& client, net::Socket& origin, std::size_t buffer_bytes, int idle_timeout_sec = 0);
}
