#include "portcullis/core/http/MessageReader.h"
#include "portcullis/core/util/Error.h"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace portcullis::core::http {
using util::ProtocolError;
using util::TransportError;

std::optional<long long> content_length(const HttpHeaders& headers) {
    std::optional<long long> result;
    for (auto& h : headers) {
        if (!iequals(h.name, "Content-Length")) continue;
        const auto& v = h.value;
        if (v.empty() || v.size() > 18 || !std::all_of(v.begin(), v.end(), [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; })) return -1;
        long long n = std::stoll(v);
        // repeated headers must agree
        if (result && *result != n) return -1;
        result = n;
    }
    return result;
}

MessageReader::MessageReader(net::Socket& socket, std::size_t max_header_bytes)
    : sock(socket), max_header(max_header_bytes) {
    chunk.resize(16384);
}

bool MessageReader::fill() {
    auto r = sock.recv_some(chunk);
    if (!r) return false;
    pending.append(chunk.data(), static_cast<size_t>(*r));
    return true;
}

std::optional<std::string> MessageReader::read_head(std::string& head, bool& clean_close) {
    clean_close = false;
    size_t scanned = 0;
    for (;;) {
        // tolerate stray CRLFs between pipelined messages
        while (pending.size() >= 2 && pending[0] == '\r' && pending[1] == '\n') pending.erase(0, 2);
        auto end = pending.find("\r\n\r\n", scanned > 3 ? scanned - 3 : 0);
        if (end != std::string::npos) {
            head = pending.substr(0, end + 4);
            pending.erase(0, end + 4);
            return std::nullopt;
        }
        scanned = pending.size();
        if (pending.size() > max_header) return fmt::format("header section exceeds {} bytes", max_header);
        if (!fill()) {
            if (pending.empty() && sock.eof()) { clean_close = true; return std::nullopt; }
            return sock.eof() ? std::string("connection closed inside message head") : sock.error_text();
        }
    }
}

void MessageReader::start_body(Framing f, uint64_t length) {
    framing = f;
    remaining = length;
    body_count = 0;
    if (f == Framing::length && length == 0) framing = Framing::none;
    if (f == Framing::chunked) decoder = ChunkedDecoder(false);
}

void MessageReader::body_failed(const std::string& what) {
    framing = Framing::none;
    if (reading_response) throw TransportError(what);
    throw ProtocolError(what);
}

std::optional<HttpRequest> MessageReader::read_request_head() {
    reading_response = false;
    start_body(Framing::none);
    std::string head; bool clean_close = false;
    if (auto err = read_head(head, clean_close)) throw ProtocolError(*err);
    if (clean_close) return std::nullopt;
    auto req = parser.parse_request(head);
    if (!req) throw ProtocolError("malformed request head");

    if (find_header(req->headers, "Transfer-Encoding")) {
        if (!header_has_token(req->headers, "Transfer-Encoding", "chunked")) throw ProtocolError("unsupported transfer-encoding");
        start_body(Framing::chunked);
        return req;
    }
    auto length = content_length(req->headers);
    if (length && *length < 0) throw ProtocolError("invalid Content-Length");
    if (length) start_body(Framing::length, static_cast<uint64_t>(*length));
    return req;
}

HttpResponse MessageReader::read_response_head(std::string_view request_method) {
    reading_response = true;
    start_body(Framing::none);
    for (;;) {
        std::string head; bool clean_close = false;
        if (auto err = read_head(head, clean_close)) throw TransportError(*err);
        if (clean_close) throw TransportError("origin closed the connection without a response");
        auto resp = parser.parse_response(head);
        if (!resp) throw TransportError("malformed response head from origin");
        int status = resp->status_line.status;
        if (status >= 100 && status < 200 && status != 101) continue;

        bool no_body = request_method == "HEAD" || (status >= 100 && status < 200) || status == 204 || status == 304;
        if (no_body) return std::move(*resp);
        if (find_header(resp->headers, "Transfer-Encoding")) {
            if (header_has_token(resp->headers, "Transfer-Encoding", "chunked")) {
                start_body(Framing::chunked);
            } else {
                start_body(Framing::until_close);
                resp->close_delimited = true;
            }
            return std::move(*resp);
        }
        auto length = content_length(resp->headers);
        if (length && *length < 0) throw TransportError("invalid Content-Length from origin");
        if (length) {
            start_body(Framing::length, static_cast<uint64_t>(*length));
        } else {
            start_body(Framing::until_close);
            resp->close_delimited = true;
        }
        return std::move(*resp);
    }
}

bool MessageReader::next(std::string& out) {
    switch (framing) {
        case Framing::none:
            return false;
        case Framing::length: {
            if (pending.empty() && !fill()) {
                body_failed(fmt::format("body truncated with {} bytes missing ({})", remaining, sock.eof() ? "connection closed" : sock.error_text()));
            }
            auto take = static_cast<size_t>(std::min<uint64_t>(remaining, pending.size()));
            out.append(pending, 0, take);
            pending.erase(0, take);
            remaining -= take;
            body_count += take;
            if (remaining == 0) framing = Framing::none;
            return true;
        }
        case Framing::chunked: {
            if (pending.empty() && !fill()) {
                body_failed(fmt::format("chunked body truncated ({})", sock.eof() ? "connection closed" : sock.error_text()));
            }
            size_t used = decoder.feed(pending.data(), pending.size());
            if (decoder.error()) body_failed("malformed chunked body");
            out.append(pending, 0, used);
            pending.erase(0, used);
            body_count += used;
            if (decoder.finished()) framing = Framing::none;
            return true;
        }
        case Framing::until_close: {
            if (pending.empty() && !fill()) {
                if (!sock.eof()) body_failed(fmt::format("body interrupted: {}", sock.error_text()));
                framing = Framing::none;
                return false;
            }
            out.append(pending);
            body_count += pending.size();
            pending.clear();
            return true;
        }
    }
    return false;
}

void MessageReader::discard_body() {
    std::string sink;
    while (next(sink)) sink.clear();
}

std::string MessageReader::take_buffered() {
    std::string out; out.swap(pending); return out;
}
}
