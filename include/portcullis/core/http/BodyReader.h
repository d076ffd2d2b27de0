#pragma once
#include <string>

namespace portcullis::core::http {
// Pull side of a message body in its wire form.
class BodyReader {
public:
    virtual ~BodyReader() = default;
    // Appends the next slice of the body to out. false once the body is
    // complete; nothing is appended then.
    virtual bool next(std::string& out) = 0;
};
}
