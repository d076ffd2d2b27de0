#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include "portcullis/core/http/HttpParser.h"

namespace portcullis::core::http {
struct Authority {
    std::string host; // brackets stripped for IPv6 literals
    uint16_t port{80};
};

struct HostTarget {
    std::string host;
    uint16_t port{80};
    std::string path;
};

// "host", "host:port" or "[v6]:port". nullopt for an empty host or a bad port.
std::optional<Authority> split_authority(std::string_view authority, uint16_t default_port);

// Authority carried by the request target itself: the authority of an
// absolute-form URI, or the whole target of a CONNECT. Empty when the target
// is origin-form ("/path") or asterisk-form.
std::string uri_authority(const HttpRequestLine& line);

// "/path?query" of an origin-form or absolute-form target; "" when there is none.
std::string path_and_query(std::string_view target);

// URI authority, else the Host header, else "".
std::string extract_host(const HttpRequest& req);

// Where to connect for a request whose target is already absolute-form.
std::optional<HostTarget> extract_host_target(const HttpRequest& req);
}
