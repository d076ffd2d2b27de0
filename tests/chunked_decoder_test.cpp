#include "portcullis/core/http/ChunkedDecoder.h"
#include <cassert>
#include <string>
using namespace portcullis::core::http;

int main(){
    // Happy path single feed; nothing after the terminator is consumed
    {
        ChunkedDecoder dec;
        std::string msg = "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n";
        std::string in = msg + "GET /next HTTP/1.1\r\n";
        size_t used = dec.feed(in.data(), in.size());
        assert(dec.finished());
        assert(used == msg.size());
        assert(dec.take_decoded() == "Wikipedia");
    }

    // Split boundaries, including between CR and LF
    {
        ChunkedDecoder dec;
        const char* parts[] = { "4\r", "\nWi", "ki\r", "\n5\r\nped", "ia\r\n0\r", "\n", "\r", "\n" };
        for (auto part : parts) {
            std::string s(part);
            assert(dec.feed(s.data(), s.size()) == s.size());
        }
        assert(dec.finished());
        assert(dec.take_decoded() == "Wikipedia");
    }

    // With extension and trailer fields
    {
        ChunkedDecoder dec;
        std::string in = "A;foo=bar\r\nHelloWorld\r\n0\r\nExpires: never\r\nX-Sum: 1\r\n\r\n";
        assert(dec.feed(in.data(), in.size()) == in.size());
        assert(dec.finished());
        assert(dec.take_decoded() == "HelloWorld");
    }

    // Framing only: nothing decoded is kept
    {
        ChunkedDecoder dec(false);
        std::string in = "3\r\nabc\r\n0\r\n\r\n";
        dec.feed(in.data(), in.size());
        assert(dec.finished());
        assert(dec.take_decoded().empty());
    }

    // Invalid hex -> error
    {
        ChunkedDecoder dec;
        std::string in = "Q\r\n";
        dec.feed(in.data(), in.size());
        assert(dec.error());
    }

    // Missing CRLF after chunk data -> error
    {
        ChunkedDecoder dec;
        std::string in = "2\r\nabX\r\n";
        dec.feed(in.data(), in.size());
        assert(dec.error());
    }

    // Bare LF line ending -> error
    {
        ChunkedDecoder dec;
        std::string in = "2\nab\r\n";
        dec.feed(in.data(), in.size());
        assert(dec.error());
    }

    // Zero chunk immediate termination
    {
        ChunkedDecoder dec;
        std::string in = "0\r\n\r\n";
        dec.feed(in.data(), in.size());
        assert(dec.finished());
        assert(dec.take_decoded().empty());
    }

    // Partial: waiting in the middle of a chunk
    {
        ChunkedDecoder dec;
        std::string in = "10\r\n0123";
        dec.feed(in.data(), in.size());
        assert(!dec.finished() && !dec.error());
        assert(dec.state() == ChunkedDecoder::State::Data);
        assert(dec.remaining_in_chunk() == 12);
    }
    return 0;
}
