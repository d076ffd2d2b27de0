#pragma once
#include <string>
#include <chrono>
#include <cstdint>

namespace portcullis::core::proxy {
enum class Outcome { forwarded, tunneled, blocked, failed };

struct Transaction {
    uint64_t id{0};
    std::chrono::steady_clock::time_point startTime;
    std::chrono::system_clock::time_point wallTime;
    std::chrono::milliseconds duration{0};
    std::string client;   // peer address of the client connection
    std::string method;
    std::string target;
    std::string host;     // host the filter was consulted with
    Outcome outcome{Outcome::failed};
    int status{0};        // status sent to the client, 0 if none
    uint64_t bytesIn{0};  // client -> proxy (request body, or tunnel upstream bytes)
    uint64_t bytesOut{0}; // proxy -> client (response body, or tunnel downstream bytes)
    std::string error;
};

const char* to_string(Outcome outcome);

class TransactionObserver {
public:
    virtual ~TransactionObserver() = default;
    virtual void on_transaction(const Transaction& t) = 0;
};
}
