#include "portcullis/core/proxy/RequestDispatcher.h"
#include "portcullis/core/proxy/HttpForwarder.h"
#include "portcullis/core/proxy/Tunnel.h"
#include "portcullis/core/http/HttpParser.h"
#include "portcullis/core/util/Error.h"
#include <cassert>
#include <memory>
#include <string>
#include <vector>

using namespace portcullis::core;
using namespace portcullis::core::proxy;

namespace {
// Stands in for the origin: records what would have gone on the wire.
class RecordingClient : public HttpClient {
public:
    std::vector<http::HttpRequest> seen;
    http::HttpResponse reply;
    bool fail{false};
    RecordingClient() {
        reply = http::make_response(200, "OK", "origin body", "text/html");
        reply.headers.push_back(http::HttpHeader{ "X-Origin", "1" });
    }
    std::string streamed;
    ForwardedResponse send(const http::HttpRequest& req, http::BodyReader* request_body) override {
        seen.push_back(req);
        if (fail) throw util::TransportError("connection refused");
        if (request_body) while (request_body->next(streamed)) {}
        ForwardedResponse out;
        out.head = reply;
        return out;
    }
};

http::HttpRequest request(const std::string& head) {
    http::HttpParser p;
    auto req = p.parse_request(head);
    assert(req.has_value());
    return *req;
}

std::shared_ptr<const FilterRules> deny(std::vector<std::string> d) { return std::make_shared<const FilterRules>(FilterRules::deny_list(std::move(d))); }
std::shared_ptr<const FilterRules> allow(std::vector<std::string> d) { return std::make_shared<const FilterRules>(FilterRules::allow_list(std::move(d))); }
}

int main() {
    // blocked CONNECT under a deny-list: 403 with the host including its port
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({"blocked.example"}), fwd);
        auto req = request("CONNECT blocked.example:443 HTTP/1.1\r\nHost: blocked.example:443\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.action == DispatchResult::Action::respond);
        assert(result.outcome == Outcome::blocked);
        assert(result.response.status_line.status == 403);
        assert(result.response.body == "Access to blocked.example:443 is blocked by proxy filter rules");
        assert(*http::find_header(result.response.headers, "Content-Type") == "text/plain");
        assert(client.seen.empty());
    }

    // blocked plain HTTP is never forwarded
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({"blocked.example"}), fwd);
        auto req = request("GET http://blocked.example/x HTTP/1.1\r\nHost: blocked.example\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.outcome == Outcome::blocked);
        assert(result.response.body == "Access to blocked.example is blocked by proxy filter rules");
        assert(client.seen.empty());
    }

    // hosts outside the deny-list are forwarded
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({"blocked.example"}), fwd);
        auto req = request("GET http://allowed.example/ HTTP/1.1\r\nHost: allowed.example\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.action == DispatchResult::Action::respond);
        assert(result.outcome == Outcome::forwarded);
        assert(client.seen.size() == 1);
        assert(result.response.status_line.status == 200);
    }

    // allow-list: CONNECT elsewhere is refused and no tunnel is requested
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(allow({"ok.example"}), fwd);
        auto req = request("CONNECT other.example:443 HTTP/1.1\r\nHost: other.example:443\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.action == DispatchResult::Action::respond);
        assert(result.outcome == Outcome::blocked);
        assert(result.response.status_line.status == 403);
        assert(result.tunnelTarget.host.empty());
        assert(client.seen.empty());
    }

    // allow-list: CONNECT to a listed host becomes a tunnel with a bare 200
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(allow({"ok.example"}), fwd);
        auto req = request("CONNECT ok.example:443 HTTP/1.1\r\nHost: ok.example:443\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.action == DispatchResult::Action::tunnel);
        assert(result.outcome == Outcome::tunneled);
        assert(result.tunnelTarget.host == "ok.example");
        assert(result.tunnelTarget.port == 443);
        assert(result.response.status_line.status == 200);
        assert(result.response.body.empty());
        assert(result.response.headers.empty());
        assert(client.seen.empty());
    }

    // absolute-form target reaches the origin client unchanged, response comes back as is
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(allow({"origin.example"}), fwd);
        auto req = request("GET http://origin.example/path?q=1 HTTP/1.1\r\nHost: origin.example\r\nAccept: */*\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(client.seen.size() == 1);
        assert(client.seen[0].request_line.target == "http://origin.example/path?q=1");
        assert(client.seen[0].headers.size() == 2);
        assert(client.seen[0].headers[1].value == "*/*");
        assert(result.response.status_line.status == 200);
        assert(result.response.body == "origin body");
        assert(*http::find_header(result.response.headers, "X-Origin") == "1");
    }

    // the request body stream is handed through to the origin client
    {
        class Pieces : public http::BodyReader {
        public:
            std::vector<std::string> parts{ "ab", "cd" };
            bool next(std::string& out) override {
                if (parts.empty()) return false;
                out += parts.front();
                parts.erase(parts.begin());
                return true;
            }
        } body;
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({}), fwd);
        auto req = request("POST http://origin.example/up HTTP/1.1\r\nContent-Length: 4\r\n\r\n");
        auto result = dispatcher.dispatch(req, &body);
        assert(client.streamed == "abcd");
        assert(!result.body);
    }

    // a blocked request never touches its body
    {
        class Untouchable : public http::BodyReader {
        public:
            bool next(std::string&) override { assert(false && "body read for a blocked request"); return false; }
        } body;
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({"blocked.example"}), fwd);
        auto req = request("POST http://blocked.example/up HTTP/1.1\r\nContent-Length: 4\r\n\r\n");
        auto result = dispatcher.dispatch(req, &body);
        assert(result.outcome == Outcome::blocked);
    }

    // rewrite keeps the port and supplies "/" when there is no path
    {
        http::HttpRequestLine line{ "GET", "http://origin.example:8080", "HTTP/1.1" };
        assert(HttpForwarder::absolute_target(line) == "http://origin.example:8080/");
        http::HttpRequestLine https{ "GET", "https://secure.example/a?b", "HTTP/1.1" };
        assert(HttpForwarder::absolute_target(https) == "http://secure.example/a?b");
    }

    // no authority and no Host header: a request error, not a bypass
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({"blocked.example"}), fwd);
        auto req = request("GET /x HTTP/1.1\r\n\r\n");
        bool threw = false;
        try { dispatcher.dispatch(req); } catch (const util::RequestError&) { threw = true; }
        assert(threw);
        assert(client.seen.empty());
    }

    // same under an allow-list: the empty host is simply not listed
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(allow({"ok.example"}), fwd);
        auto req = request("GET /x HTTP/1.1\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.outcome == Outcome::blocked);
        assert(result.response.body == "Access to  is blocked by proxy filter rules");
    }

    // origin-form with a Host header passes the filter but cannot be forwarded
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({}), fwd);
        auto req = request("GET /x HTTP/1.1\r\nHost: plain.example\r\n\r\n");
        bool threw = false;
        try { dispatcher.dispatch(req); } catch (const util::RequestError&) { threw = true; }
        assert(threw);
        assert(client.seen.empty());
    }

    // the Host header is what the filter sees when the target has no authority
    {
        RecordingClient client; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({"blocked.example"}), fwd);
        auto req = request("GET /x HTTP/1.1\r\nHost: blocked.example:8080\r\n\r\n");
        auto result = dispatcher.dispatch(req);
        assert(result.outcome == Outcome::blocked);
        assert(result.host == "blocked.example:8080");
    }

    // transport failures propagate, no retry
    {
        RecordingClient client; client.fail = true; HttpForwarder fwd(client);
        RequestDispatcher dispatcher(deny({}), fwd);
        auto req = request("POST http://down.example/submit HTTP/1.1\r\nHost: down.example\r\n\r\n");
        bool threw = false;
        try { dispatcher.dispatch(req); } catch (const util::TransportError&) { threw = true; }
        assert(threw);
        assert(client.seen.size() == 1);
    }

    // CONNECT target parsing
    {
        auto t1 = TunnelEstablisher::target_of(request("CONNECT ok.example HTTP/1.1\r\n\r\n"));
        assert(t1.host == "ok.example" && t1.port == 443);
        bool threw = false;
        try { TunnelEstablisher::target_of(request("CONNECT ok.example:notaport HTTP/1.1\r\n\r\n")); }
        catch (const util::RequestError&) { threw = true; }
        assert(threw);
        threw = false;
        try { TunnelEstablisher::target_of(request("CONNECT /path HTTP/1.1\r\nHost: ok.example\r\n\r\n")); }
        catch (const util::RequestError&) { threw = true; }
        assert(threw);
    }
    return 0;
}
