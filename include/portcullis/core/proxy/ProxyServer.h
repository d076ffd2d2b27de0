#pragma once
#include <cstdint>
#include <string>
#include <thread>
#include <atomic>
#include <memory>
#include "portcullis/core/net/Socket.h"
#include "portcullis/core/proxy/Config.h"
#include "portcullis/core/proxy/FilterRules.h"
#include "portcullis/core/proxy/HttpForwarder.h"
#include "portcullis/core/proxy/TransactionDispatcher.h"

namespace portcullis::core::proxy {
class ProxyServer {
public:
    // client defaults to an UpstreamHttpClient built from cfg.
    ProxyServer(Config cfg, std::shared_ptr<const FilterRules> rules, std::shared_ptr<HttpClient> client = {});
    ~ProxyServer();
    // Binds the listen address and starts accepting on a background thread.
    // false when the address cannot be bound.
    bool start();
    void stop();
    uint16_t bound_port() const { return port.load(); }
    std::size_t active_sessions() const { return sessions->load(); }
    TransactionDispatcher& dispatcher();
private:
    Config config;
    std::shared_ptr<const FilterRules> rules;
    std::shared_ptr<HttpClient> http_client;
    std::shared_ptr<TransactionDispatcher> tx_dispatcher;
    std::shared_ptr<std::atomic<std::size_t>> sessions;
    net::Listener listener;
    std::thread io_thread;
    std::atomic<bool> active { false };
    std::atomic<uint16_t> port { 0 };
    void run_loop();
    void spawn_session(net::Socket client);
};
}
