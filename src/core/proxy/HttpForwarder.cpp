#include "portcullis/core/proxy/HttpForwarder.h"
#include "portcullis/core/http/HostUtil.h"
#include "portcullis/core/http/MessageReader.h"
#include "portcullis/core/net/UpstreamConnector.h"
#include "portcullis/core/util/Error.h"
#include "portcullis/core/util/Logger.h"
#include <fmt/format.h>

namespace portcullis::core::proxy {
using util::RequestError;
using util::TransportError;

namespace {
// Owns the origin connection for as long as its response body is being read.
class OriginConnection : public http::BodyReader {
public:
    OriginConnection(net::Socket s, std::size_t max_header) : sock(std::move(s)), reader(sock, max_header) {}
    net::Socket& socket() { return sock; }
    http::MessageReader& message() { return reader; }
    bool next(std::string& out) override { return reader.next(out); }
private:
    net::Socket sock;
    http::MessageReader reader;
};
}

UpstreamHttpClient::UpstreamHttpClient(Config cfg) : config(std::move(cfg)) {}

ForwardedResponse UpstreamHttpClient::send(const http::HttpRequest& req, http::BodyReader* request_body) {
    auto target = http::extract_host_target(req);
    if (!target) throw RequestError(fmt::format("cannot derive origin from target '{}'", req.request_line.target));
    std::string error;
    auto upstream = net::UpstreamConnector::connect(target->host, target->port, config.connectTimeoutMs, &error);
    if (!upstream) throw TransportError(fmt::format("connect to {}:{} failed: {}", target->host, target->port, error));
    if (config.idleTimeoutSec > 0) upstream->set_recv_timeout(config.idleTimeoutSec);
    auto origin = std::make_unique<OriginConnection>(std::move(*upstream), config.maxHeaderBytes);
    auto& sock = origin->socket();

    auto send_failed = [&]{
        return TransportError(fmt::format("sending request to {}:{} failed: {}", target->host, target->port, sock.error_text()));
    };
    if (!sock.send_all(http::serialize_head(req))) throw send_failed();
    if (!req.body.empty() && !sock.send_all(req.body)) throw send_failed();
    if (request_body) {
        std::string slice;
        while (request_body->next(slice)) {
            if (!slice.empty() && !sock.send_all(slice)) throw send_failed();
            slice.clear();
        }
    }

    ForwardedResponse out;
    out.head = origin->message().read_response_head(req.request_line.method);
    util::log_debug(fmt::format("origin {}:{} answered {}", target->host, target->port, out.head.status_line.status));
    if (origin->message().body_pending()) out.body = std::move(origin);
    return out;
}

HttpForwarder::HttpForwarder(HttpClient& c) : client(c) {}

std::string HttpForwarder::absolute_target(const http::HttpRequestLine& line) {
    auto authority = http::uri_authority(line);
    if (authority.empty()) throw RequestError(fmt::format("missing authority in request target '{}'", line.target));
    if (!http::split_authority(authority, 80)) throw RequestError(fmt::format("unparseable authority '{}'", authority));
    auto path = http::path_and_query(line.target);
    return fmt::format("http://{}{}", authority, path.empty() ? "/" : path);
}

ForwardedResponse HttpForwarder::forward(http::HttpRequest& req, http::BodyReader* request_body) {
    req.request_line.target = absolute_target(req.request_line);
    util::log_info(fmt::format("HTTP: {} {}", req.request_line.method, req.request_line.target));
    return client.send(req, request_body);
}
}
