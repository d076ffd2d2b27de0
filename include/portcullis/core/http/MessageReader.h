#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "portcullis/core/http/BodyReader.h"
#include "portcullis/core/http/ChunkedDecoder.h"
#include "portcullis/core/http/HttpParser.h"
#include "portcullis/core/net/Socket.h"

namespace portcullis::core::http {
// Reads framed HTTP/1.x messages off a blocking socket. A head is parsed in
// full; the body that follows is handed out slice by slice in its wire form
// (chunk framing kept) through next(), so it can be relayed as it arrives.
class MessageReader : public BodyReader {
public:
    explicit MessageReader(net::Socket& socket, std::size_t max_header_bytes = 64 * 1024);

    // nullopt when the peer closed the connection before starting a new message.
    // Throws util::ProtocolError on malformed or truncated input, or a body
    // framing the proxy cannot follow.
    std::optional<HttpRequest> read_request_head();
    // Skips interim 1xx responses. Throws util::TransportError.
    HttpResponse read_response_head(std::string_view request_method);

    // Body of the message whose head was read last. Throws util::ProtocolError
    // for requests, util::TransportError for responses.
    bool next(std::string& out) override;
    // Reads and drops what is left of the current body.
    void discard_body();
    bool body_pending() const { return framing != Framing::none; }
    // Body bytes handed out (or discarded) for the current message.
    uint64_t body_bytes() const { return body_count; }

    // Bytes that arrived after the last message head (e.g. a TLS ClientHello
    // sent right behind a CONNECT head). Clears the internal buffer.
    std::string take_buffered();

private:
    enum class Framing { none, length, chunked, until_close };
    net::Socket& sock;
    std::size_t max_header;
    std::vector<char> chunk;
    std::string pending;
    HttpParser parser;
    Framing framing{Framing::none};
    uint64_t remaining{0};
    uint64_t body_count{0};
    ChunkedDecoder decoder{false};
    bool reading_response{false};

    bool fill();
    // Returns an error description, or nullopt on success.
    std::optional<std::string> read_head(std::string& head, bool& clean_close);
    void start_body(Framing f, uint64_t length = 0);
    [[noreturn]] void body_failed(const std::string& what);
};

// Content-Length as a number; nullopt when absent, -1 when malformed.
std::optional<long long> content_length(const HttpHeaders& headers);
}
