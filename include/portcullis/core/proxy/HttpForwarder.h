#pragma once
#include <memory>
#include <string>
#include "portcullis/core/http/BodyReader.h"
#include "portcullis/core/http/HttpParser.h"
#include "portcullis/core/proxy/Config.h"

namespace portcullis::core::proxy {
// Origin answer with its body still on the wire. head.body carries bytes
// already at hand (local responses, test doubles); body, when set, yields
// the rest.
struct ForwardedResponse {
    http::HttpResponse head;
    std::unique_ptr<http::BodyReader> body;
};

// Outbound HTTP capability: send a request whose target is absolute-form,
// streaming request_body (may be null) after its head, and get the origin's
// response back as soon as its head arrived. Throws util::TransportError.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual ForwardedResponse send(const http::HttpRequest& req, http::BodyReader* request_body) = 0;
};

// One TCP connection per exchange, closed once the response body was read.
class UpstreamHttpClient : public HttpClient {
public:
    explicit UpstreamHttpClient(Config cfg = {});
    ForwardedResponse send(const http::HttpRequest& req, http::BodyReader* request_body) override;
private:
    Config config;
};

class HttpForwarder {
public:
    explicit HttpForwarder(HttpClient& client);
    // "http://{authority}{path?query or /}". Throws util::RequestError without an authority.
    static std::string absolute_target(const http::HttpRequestLine& line);
    // Rewrites req's target in place, then sends it. Headers and body are untouched.
    ForwardedResponse forward(http::HttpRequest& req, http::BodyReader* request_body = nullptr);
private:
    HttpClient& client;
};
}
