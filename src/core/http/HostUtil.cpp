#include "portcullis/core/http/HostUtil.h"
#include <algorithm>
#include <cctype>

namespace portcullis::core::http {
namespace {
// Returns the offset just past "scheme://", or npos for non absolute-form targets.
size_t authority_start(std::string_view target) {
    auto sep = target.find("://");
    if (sep == std::string_view::npos || sep == 0) return std::string_view::npos;
    auto scheme = target.substr(0, sep);
    bool ok = std::isalpha(static_cast<unsigned char>(scheme[0])) != 0 && std::all_of(scheme.begin(), scheme.end(), [](char c){
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
    return ok ? sep + 3 : std::string_view::npos;
}

std::optional<uint16_t> parse_port(std::string_view digits) {
    if (digits.empty() || digits.size() > 5) return std::nullopt;
    unsigned long value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return std::nullopt;
    return static_cast<uint16_t>(value);
}

uint16_t default_port_for(std::string_view target) {
    return target.rfind("https://", 0) == 0 ? 443 : 80;
}
}

std::optional<Authority> split_authority(std::string_view authority, uint16_t default_port) {
    Authority out; out.port = default_port;
    if (authority.empty()) return std::nullopt;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        out.host = std::string(authority.substr(1, close - 1));
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            auto p = parse_port(rest.substr(1));
            if (!p) return std::nullopt;
            out.port = *p;
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            auto p = parse_port(authority.substr(colon + 1));
            if (!p) return std::nullopt;
            out.port = *p;
            authority = authority.substr(0, colon);
        }
        out.host = std::string(authority);
    }
    if (out.host.empty()) return std::nullopt;
    return out;
}

std::string uri_authority(const HttpRequestLine& line) {
    std::string_view target = line.target;
    if (line.method == "CONNECT") {
        return target.find('/') == std::string_view::npos ? std::string(target) : std::string();
    }
    auto start = authority_start(target);
    if (start == std::string_view::npos) return {};
    auto end = target.find_first_of("/?#", start);
    auto authority = target.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) authority.remove_prefix(at + 1);
    return std::string(authority);
}

std::string path_and_query(std::string_view target) {
    auto start = authority_start(target);
    if (start == std::string_view::npos) {
        return !target.empty() && target.front() == '/' ? std::string(target) : std::string();
    }
    auto rest = target.find_first_of("/?#", start);
    if (rest == std::string_view::npos) return {};
    auto tail = target.substr(rest);
    auto hash = tail.find('#');
    if (hash != std::string_view::npos) tail = tail.substr(0, hash);
    if (!tail.empty() && tail.front() == '?') return "/" + std::string(tail);
    return std::string(tail);
}

std::string extract_host(const HttpRequest& req) {
    auto authority = uri_authority(req.request_line);
    if (!authority.empty()) return authority;
    auto host_header = find_header(req.headers, "Host");
    return host_header ? *host_header : std::string();
}

std::optional<HostTarget> extract_host_target(const HttpRequest& req) {
    auto authority = uri_authority(req.request_line);
    auto split = split_authority(authority, default_port_for(req.request_line.target));
    if (!split) return std::nullopt;
    auto path = path_and_query(req.request_line.target);
    return HostTarget{ split->host, split->port, path.empty() ? std::string("/") : path };
}
}
