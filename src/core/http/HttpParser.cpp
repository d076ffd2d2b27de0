#include "portcullis/core/http/HttpParser.h"
#include <algorithm>
#include <cctype>
#include <string_view>

namespace portcullis::core::http {
namespace {
bool is_token_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}
bool is_token(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_token_char);
}
std::string_view trim(std::string_view v) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.remove_suffix(1);
    return v;
}
bool valid_version(std::string_view v) {
    return v.size() == 8 && v.substr(0, 5) == "HTTP/" && std::isdigit(static_cast<unsigned char>(v[5])) && v[6] == '.' && std::isdigit(static_cast<unsigned char>(v[7]));
}
}

std::optional<HttpRequestLine> HttpParser::parse_request_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos) return std::nullopt;
    HttpRequestLine rl;
    rl.method = std::string(line.substr(0, first_space));
    rl.target = std::string(line.substr(first_space + 1, second_space - first_space - 1));
    rl.version = std::string(line.substr(second_space + 1));
    if (!is_token(rl.method) || rl.target.empty() || !valid_version(rl.version)) return std::nullopt;
    return rl;
}

std::optional<HttpStatusLine> HttpParser::parse_status_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    HttpStatusLine sl;
    sl.version = std::string(line.substr(0, first_space));
    if (!valid_version(sl.version)) return std::nullopt;
    auto rest = line.substr(first_space + 1);
    auto second_space = rest.find(' ');
    auto code = rest.substr(0, second_space);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(), [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; })) return std::nullopt;
    sl.status = (code[0] - '0') * 100 + (code[1] - '0') * 10 + (code[2] - '0');
    if (second_space != std::string_view::npos) sl.reason = std::string(rest.substr(second_space + 1));
    return sl;
}

std::optional<HttpHeaders> HttpParser::parse_headers(std::string_view block) {
    HttpHeaders headers;
    size_t pos = 0;
    while (pos < block.size()) {
        auto next = block.find("\r\n", pos);
        auto line = block.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        pos = next == std::string_view::npos ? block.size() : next + 2;
        if (line.empty()) break;
        // obsolete line folding is rejected
        if (line.front() == ' ' || line.front() == '\t') return std::nullopt;
        auto colon = line.find(':');
        if (colon == std::string_view::npos) return std::nullopt;
        auto name = line.substr(0, colon);
        if (!is_token(name)) return std::nullopt;
        headers.push_back(HttpHeader{ std::string(name), std::string(trim(line.substr(colon + 1))) });
    }
    return headers;
}

std::optional<HttpRequest> HttpParser::parse_request(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers + 2);
    auto first_eol = head.find("\r\n");
    auto rl_opt = parse_request_line(head.substr(0, first_eol));
    if (!rl_opt) return std::nullopt;
    auto headers = parse_headers(head.substr(first_eol + 2));
    if (!headers) return std::nullopt;
    HttpRequest req; req.request_line = std::move(*rl_opt); req.headers = std::move(*headers);
    return req;
}

std::optional<HttpResponse> HttpParser::parse_response(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers + 2);
    auto first_eol = head.find("\r\n");
    auto sl_opt = parse_status_line(head.substr(0, first_eol));
    if (!sl_opt) return std::nullopt;
    auto headers = parse_headers(head.substr(first_eol + 2));
    if (!headers) return std::nullopt;
    HttpResponse resp; resp.status_line = std::move(*sl_opt); resp.headers = std::move(*headers);
    return resp;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::optional<std::string> find_header(const HttpHeaders& headers, std::string_view name) {
    for (auto& h : headers) {
        if (iequals(h.name, name)) return h.value;
    }
    return std::nullopt;
}

bool header_has_token(const HttpHeaders& headers, std::string_view name, std::string_view token) {
    for (auto& h : headers) {
        if (!iequals(h.name, name)) continue;
        std::string_view value = h.value;
        while (!value.empty()) {
            auto comma = value.find(',');
            auto item = trim(value.substr(0, comma));
            if (iequals(item, token)) return true;
            if (comma == std::string_view::npos) break;
            value.remove_prefix(comma + 1);
        }
    }
    return false;
}

namespace {
void append_headers(std::string& out, const HttpHeaders& headers) {
    for (auto& h : headers) {
        out += h.name;
        out += ": ";
        out += h.value;
        out += "\r\n";
    }
    out += "\r\n";
}
}

std::string serialize_head(const HttpRequest& req) {
    std::string out = req.request_line.method + " " + req.request_line.target + " " + req.request_line.version + "\r\n";
    append_headers(out, req.headers);
    return out;
}

std::string serialize_head(const HttpResponse& resp) {
    std::string out = resp.status_line.version + " " + std::to_string(resp.status_line.status) + " " + resp.status_line.reason + "\r\n";
    append_headers(out, resp.headers);
    return out;
}

std::string serialize(const HttpResponse& resp) {
    return serialize_head(resp) + resp.body;
}

HttpResponse make_response(int status, std::string reason, std::string body, std::string_view content_type) {
    HttpResponse resp;
    resp.status_line = HttpStatusLine{ "HTTP/1.1", status, std::move(reason) };
    if (!content_type.empty()) resp.headers.push_back(HttpHeader{ "Content-Type", std::string(content_type) });
    resp.headers.push_back(HttpHeader{ "Content-Length", std::to_string(body.size()) });
    resp.body = std::move(body);
    return resp;
}
}
