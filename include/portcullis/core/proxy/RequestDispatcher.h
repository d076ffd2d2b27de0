#pragma once
#include <memory>
#include <string>
#include "portcullis/core/http/BodyReader.h"
#include "portcullis/core/http/HostUtil.h"
#include "portcullis/core/http/HttpParser.h"
#include "portcullis/core/proxy/FilterRules.h"
#include "portcullis/core/proxy/HttpForwarder.h"
#include "portcullis/core/proxy/Transaction.h"

namespace portcullis::core::proxy {
struct DispatchResult {
    enum class Action { respond, tunnel };
    Action action { Action::respond };
    Outcome outcome { Outcome::forwarded };
    std::string host;
    http::HttpResponse response;     // for tunnel: the acknowledgment to send first
    std::unique_ptr<http::BodyReader> body; // rest of a forwarded response body, if any
    http::Authority tunnelTarget;    // only meaningful for Action::tunnel
};

// Per request: filter check, then CONNECT -> tunnel, anything else -> forward.
class RequestDispatcher {
public:
    RequestDispatcher(std::shared_ptr<const FilterRules> rules, HttpForwarder& forwarder);
    // request_body streams what follows req's head on the client connection;
    // it is only consumed when the request is forwarded.
    // Throws util::RequestError / util::TransportError from the chosen route.
    DispatchResult dispatch(http::HttpRequest& req, http::BodyReader* request_body = nullptr);
private:
    std::shared_ptr<const FilterRules> filter;
    HttpForwarder& forwarder;
};
}
