#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>

namespace portcullis::core::http {
struct HttpHeader { std::string name; std::string value; };
using HttpHeaders = std::vector<HttpHeader>;
struct HttpRequestLine { std::string method; std::string target; std::string version; };
// body holds the raw bytes as they travel on the wire (chunked framing kept).
struct HttpRequest { HttpRequestLine request_line; HttpHeaders headers; std::string body; };
struct HttpStatusLine { std::string version; int status{0}; std::string reason; };
struct HttpResponse {
    HttpStatusLine status_line;
    HttpHeaders headers;
    std::string body;
    bool close_delimited{false}; // body ended with the origin closing the connection
};

class HttpParser {
public:
    std::optional<HttpRequestLine> parse_request_line(std::string_view line);
    std::optional<HttpStatusLine> parse_status_line(std::string_view line);
    // Both take the head up to and including the blank line; the body is not touched.
    std::optional<HttpRequest> parse_request(std::string_view data);
    std::optional<HttpResponse> parse_response(std::string_view data);
private:
    std::optional<HttpHeaders> parse_headers(std::string_view block);
};

bool iequals(std::string_view a, std::string_view b);
std::optional<std::string> find_header(const HttpHeaders& headers, std::string_view name);
// Comma separated token lists, e.g. "Connection: keep-alive, Upgrade".
bool header_has_token(const HttpHeaders& headers, std::string_view name, std::string_view token);

std::string serialize_head(const HttpRequest& req);
std::string serialize_head(const HttpResponse& resp);
std::string serialize(const HttpResponse& resp);

HttpResponse make_response(int status, std::string reason, std::string body = {}, std::string_view content_type = {});
}
