#include "portcullis/core/proxy/ClientSession.h"
#include "portcullis/core/proxy/Tunnel.h"
#include "portcullis/core/util/Error.h"
#include "portcullis/core/util/Logger.h"
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace portcullis::core::proxy {
namespace {
bool client_wants_close(const http::HttpRequest& req) {
    if (req.request_line.version == "HTTP/1.0") return !http::header_has_token(req.headers, "Connection", "keep-alive");
    return http::header_has_token(req.headers, "Connection", "close");
}

bool expects_continue(const http::HttpRequest& req) {
    if (req.request_line.version != "HTTP/1.1") return false;
    if (!http::header_has_token(req.headers, "Expect", "100-continue")) return false;
    auto length = http::content_length(req.headers);
    return http::find_header(req.headers, "Transfer-Encoding").has_value() || (length && *length > 0);
}

http::HttpResponse error_response(int status, const char* reason, std::string_view detail, bool closing = false) {
    auto resp = http::make_response(status, reason, fmt::format("{} {}: {}\n", status, reason, detail), "text/plain");
    if (closing) resp.headers.push_back(http::HttpHeader{ "Connection", "close" });
    return resp;
}
}

ClientSession::ClientSession(net::Socket socket, std::shared_ptr<const FilterRules> r, std::shared_ptr<HttpClient> client,
                             std::shared_ptr<TransactionDispatcher> ev, Config cfg)
    : sock(std::move(socket)), rules(std::move(r)), http_client(std::move(client)), events(std::move(ev)), config(std::move(cfg)) {
    peer = sock.peer_address();
}

void ClientSession::start() {
    try {
        process();
    } catch (const std::exception& e) {
        util::log_error(fmt::format("session {} aborted: {}", peer, e.what()));
    }
    sock.close();
}

void ClientSession::process() {
    http::MessageReader reader(sock, config.maxHeaderBytes);
    HttpForwarder forwarder(*http_client);
    RequestDispatcher dispatcher(rules, forwarder);

    for (;;) {
        std::optional<http::HttpRequest> req;
        try {
            req = reader.read_request_head();
            if (!req) break;
            if (expects_continue(*req) && !sock.send_all("HTTP/1.1 100 Continue\r\n\r\n")) break;
        } catch (const util::ProtocolError& e) {
            report_protocol_error(e.what());
            break;
        }
        if (!handle(reader, dispatcher, *req)) break;
    }
    sock.close();
}

void ClientSession::report_protocol_error(const std::string& what) {
    util::log_warn(fmt::format("protocol error from {}: {}", peer, what));
    if (!sock.send_all(http::serialize(error_response(400, "Bad Request", what, true)))) {
        util::log_debug(fmt::format("could not report protocol error to {}: {}", peer, sock.error_text()));
    }
}

bool ClientSession::handle(http::MessageReader& reader, RequestDispatcher& dispatcher, http::HttpRequest& req) {
    Transaction t{};
    t.id = events->next_id();
    t.startTime = std::chrono::steady_clock::now();
    t.wallTime = std::chrono::system_clock::now();
    t.client = peer;
    t.method = req.request_line.method;
    t.target = req.request_line.target;
    util::log_debug(fmt::format("{} {} {}", peer, t.method, t.target));
    bool keep_alive = !client_wants_close(req);

    DispatchResult result;
    try {
        result = dispatcher.dispatch(req, &reader);
    } catch (const util::RequestError& e) {
        util::log_warn(fmt::format("request error: {}", e.what()));
        t.host = http::extract_host(req);
        t.error = e.what();
        bool sent = send_response(error_response(400, "Bad Request", e.what(), !keep_alive), t);
        t.bytesIn = reader.body_bytes();
        finish(t);
        return sent && keep_alive && drain_request(reader);
    } catch (const util::TransportError& e) {
        util::log_error(fmt::format("HTTP request error: {}", e.what()));
        t.host = http::extract_host(req);
        t.error = e.what();
        bool sent = send_response(error_response(502, "Bad Gateway", e.what(), !keep_alive), t);
        t.bytesIn = reader.body_bytes();
        finish(t);
        return sent && keep_alive && drain_request(reader);
    } catch (const util::ProtocolError& e) {
        // the request body broke off while it was being sent to the origin
        t.host = http::extract_host(req);
        t.error = e.what();
        t.status = 400;
        report_protocol_error(e.what());
        t.bytesIn = reader.body_bytes();
        finish(t);
        return false;
    }
    t.host = result.host;
    t.outcome = result.outcome;

    if (result.action == DispatchResult::Action::tunnel) {
        // Optimistic acknowledgment: 200 before the origin connect is tried.
        if (!send_response(result.response, t)) { finish(t); return false; }
        TunnelEstablisher tunnel(config);
        try {
            auto stats = tunnel.run(sock, reader.take_buffered(), result.tunnelTarget);
            t.bytesIn = stats.clientToOrigin;
            t.bytesOut = stats.originToClient;
            if (!stats.error.empty()) {
                util::log_warn(fmt::format("Tunnel error {}:{}: {}", result.tunnelTarget.host, result.tunnelTarget.port, stats.error));
                t.error = stats.error;
            }
        } catch (const util::TransportError& e) {
            util::log_error(fmt::format("Tunnel error: {}", e.what()));
            t.outcome = Outcome::failed;
            t.error = e.what();
        }
        finish(t);
        return false;
    }

    bool sent = send_response(result.response, t);
    if (sent && result.body) sent = relay_body(*result.body, t);
    t.bytesIn = reader.body_bytes();
    finish(t);
    if (!sent) return false;
    if (result.response.close_delimited) return false;
    if (http::header_has_token(result.response.headers, "Connection", "close")) return false;
    return keep_alive && drain_request(reader);
}

bool ClientSession::send_response(const http::HttpResponse& resp, Transaction& t) {
    t.status = resp.status_line.status;
    if (!sock.send_all(http::serialize_head(resp)) || (!resp.body.empty() && !sock.send_all(resp.body))) {
        util::log_warn(fmt::format("write to {} failed: {}", peer, sock.error_text()));
        if (t.error.empty()) t.error = sock.error_text();
        return false;
    }
    t.bytesOut = resp.body.size();
    return true;
}

bool ClientSession::relay_body(http::BodyReader& body, Transaction& t) {
    std::string slice;
    try {
        while (body.next(slice)) {
            if (!slice.empty() && !sock.send_all(slice)) {
                util::log_warn(fmt::format("write to {} failed: {}", peer, sock.error_text()));
                t.error = sock.error_text();
                return false;
            }
            t.bytesOut += slice.size();
            slice.clear();
        }
    } catch (const util::TransportError& e) {
        // the head is out already, so the client can only learn through the close
        util::log_warn(fmt::format("response body from origin broke off: {}", e.what()));
        t.outcome = Outcome::failed;
        t.error = e.what();
        return false;
    }
    return true;
}

bool ClientSession::drain_request(http::MessageReader& reader) {
    try {
        reader.discard_body();
    } catch (const util::ProtocolError& e) {
        util::log_debug(fmt::format("request body from {} broke off: {}", peer, e.what()));
        return false;
    }
    return true;
}

void ClientSession::finish(Transaction& t) {
    t.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t.startTime);
    events->publish(t);
}
}
