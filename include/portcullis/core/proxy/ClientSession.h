#pragma once
#include <memory>
#include <string>
#include <chrono>
#include "portcullis/core/net/Socket.h"
#include "portcullis/core/http/HttpParser.h"
#include "portcullis/core/http/MessageReader.h"
#include "portcullis/core/proxy/Config.h"
#include "portcullis/core/proxy/FilterRules.h"
#include "portcullis/core/proxy/HttpForwarder.h"
#include "portcullis/core/proxy/RequestDispatcher.h"
#include "portcullis/core/proxy/TransactionDispatcher.h"

namespace portcullis::core::proxy {
// Drives one client connection: reads requests in order, dispatches each and
// writes the answer, until the client leaves or the connection becomes a tunnel.
class ClientSession {
public:
    ClientSession(net::Socket socket, std::shared_ptr<const FilterRules> rules, std::shared_ptr<HttpClient> client,
                  std::shared_ptr<TransactionDispatcher> events, Config cfg);
    // Runs to completion on the calling thread. Errors are logged, never thrown.
    void start();
private:
    net::Socket sock;
    std::shared_ptr<const FilterRules> rules;
    std::shared_ptr<HttpClient> http_client;
    std::shared_ptr<TransactionDispatcher> events;
    Config config;
    std::string peer;
    void process();
    void report_protocol_error(const std::string& what);
    // false when the connection cannot carry another request
    bool handle(http::MessageReader& reader, RequestDispatcher& dispatcher, http::HttpRequest& req);
    bool send_response(const http::HttpResponse& resp, Transaction& t);
    // Copies a response body to the client as it arrives from the origin.
    bool relay_body(http::BodyReader& body, Transaction& t);
    // Skips the unread part of the request body so the next request can be read.
    bool drain_request(http::MessageReader& reader);
    void finish(Transaction& t);
};
}
