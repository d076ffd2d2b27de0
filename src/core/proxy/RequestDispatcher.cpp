#include "portcullis/core/proxy/RequestDispatcher.h"
#include "portcullis/core/proxy/Tunnel.h"
#include "portcullis/core/util/Logger.h"
#include <fmt/format.h>

namespace portcullis::core::proxy {
RequestDispatcher::RequestDispatcher(std::shared_ptr<const FilterRules> rules, HttpForwarder& fwd)
    : filter(std::move(rules)), forwarder(fwd) {}

DispatchResult RequestDispatcher::dispatch(http::HttpRequest& req, http::BodyReader* request_body) {
    DispatchResult result;
    result.host = http::extract_host(req);
    const auto& method = req.request_line.method;

    if (!filter->is_allowed(result.host)) {
        util::log_warn(fmt::format("BLOCKED: {} {} (host '{}', {})", method, req.request_line.target, result.host, to_string(filter->mode())));
        result.outcome = Outcome::blocked;
        result.response = blocked_response(result.host);
        return result;
    }
    util::log_info(fmt::format("{} {} allowed", method, req.request_line.target));

    if (method == "CONNECT") {
        result.tunnelTarget = TunnelEstablisher::target_of(req);
        util::log_info(fmt::format("HTTPS CONNECT: {}:{}", result.tunnelTarget.host, result.tunnelTarget.port));
        result.action = DispatchResult::Action::tunnel;
        result.outcome = Outcome::tunneled;
        result.response = TunnelEstablisher::acknowledgment();
        return result;
    }
    auto forwarded = forwarder.forward(req, request_body);
    result.response = std::move(forwarded.head);
    result.body = std::move(forwarded.body);
    return result;
}
}
