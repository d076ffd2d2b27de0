#pragma once
#include <string>
#include <string_view>
#include <cstddef>

namespace portcullis::core::http {

// Incremental HTTP/1.1 chunked transfer decoder.
// Feed raw bytes via feed(); the return value tells how many of them belong to
// the chunked message, so a caller relaying the body verbatim knows where it
// ends. Trailer fields are consumed and dropped from the decoded output.
class ChunkedDecoder {
public:
    enum class State { SizeLine, Data, DataCR, DataLF, Trailer, Done, Error };

    explicit ChunkedDecoder(bool keep_decoded = true) : keep_decoded_(keep_decoded) {}

    // Feed data; returns number of bytes consumed from input.
    size_t feed(const char* data, size_t len);

    bool finished() const { return state_ == State::Done; }
    bool error() const { return state_ == State::Error; }

    // Extract decoded bytes accumulated so far (clears internal buffer returned).
    std::string take_decoded();

    // Internal state (for tests/inspection)
    State state() const { return state_; }
    size_t remaining_in_chunk() const { return remaining_; }

private:
    static constexpr size_t kMaxLine = 8192;
    bool keep_decoded_;
    State state_ = State::SizeLine;
    std::string line_;
    size_t remaining_ = 0;
    std::string decoded_;
    void finish_size_line();
    void finish_trailer_line();
};

}
