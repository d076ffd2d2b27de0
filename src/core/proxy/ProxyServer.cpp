#include "portcullis/core/proxy/ProxyServer.h"
#include "portcullis/core/proxy/ClientSession.h"
#include "portcullis/core/util/Logger.h"
#include <chrono>
#include <system_error>
#include <fmt/format.h>
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#endif

namespace portcullis::core::proxy {
using portcullis::core::util::log_info;
using portcullis::core::net::Socket;

namespace {
struct PlatformInit {
    PlatformInit() {
#ifdef _WIN32
        WSADATA d; WSAStartup(MAKEWORD(2,2), &d);
#endif
    }
    ~PlatformInit() {
#ifdef _WIN32
        WSACleanup();
#endif
    }
};
PlatformInit& platform() { static PlatformInit init; return init; }
}

TransactionDispatcher& ProxyServer::dispatcher() { return *tx_dispatcher; }

ProxyServer::ProxyServer(Config cfg, std::shared_ptr<const FilterRules> r, std::shared_ptr<HttpClient> client)
    : config(std::move(cfg)), rules(std::move(r)), http_client(std::move(client)),
      tx_dispatcher(std::make_shared<TransactionDispatcher>()), sessions(std::make_shared<std::atomic<std::size_t>>(0)) {
    if (!rules) rules = std::make_shared<const FilterRules>(FilterRules::deny_list({}));
    if (!http_client) http_client = std::make_shared<UpstreamHttpClient>(config);
}
ProxyServer::~ProxyServer() { stop(); }

bool ProxyServer::start() {
    if (active.load()) return true;
    platform();
    if (!listener.open(config.listenAddress, config.listenPort)) {
        util::log_error(fmt::format("cannot listen on {}:{}", config.listenAddress, config.listenPort));
        return false;
    }
    port.store(listener.local_port());
    log_info(fmt::format("Server starts at http://{}:{} ({} with {} domains)", config.listenAddress, port.load(),
                         to_string(rules->mode()), rules->domains().size()));
    active.store(true);
    io_thread = std::thread(&ProxyServer::run_loop, this);
    return true;
}

void ProxyServer::stop() {
    if (!active.load()) return;
    active.store(false);
    if (io_thread.joinable()) io_thread.join();
    listener.close();
    log_info(fmt::format("proxy stopped, {} sessions still running", sessions->load()));
}

void ProxyServer::run_loop() {
    while (active.load()) {
        auto client = listener.accept();
        if (!client.valid()) { std::this_thread::sleep_for(std::chrono::milliseconds(4)); continue; }
        spawn_session(std::move(client));
    }
}

void ProxyServer::spawn_session(Socket client) {
    // Sessions share the filter, client and dispatcher by shared_ptr, so they
    // may outlive the server object.
    auto session = std::make_shared<ClientSession>(std::move(client), rules, http_client, tx_dispatcher, config);
    auto counter = sessions;
    counter->fetch_add(1);
    try {
        std::thread([session, counter]{
            session->start();
            counter->fetch_sub(1);
        }).detach();
    } catch (const std::system_error& e) {
        counter->fetch_sub(1);
        util::log_error(fmt::format("cannot start session thread: {}", e.what()));
    }
}
}
