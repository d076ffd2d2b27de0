#include "portcullis/core/proxy/ProxyServer.h"
#include "portcullis/core/proxy/FilterConfig.h"
#include "portcullis/core/proxy/TransactionLogObserver.h"
#include "portcullis/core/util/Error.h"
#include "portcullis/core/util/Logger.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>

using namespace portcullis::core::proxy;
using namespace portcullis::core::util;

namespace {
std::atomic<bool> g_stop { false };

void on_signal(int) { g_stop.store(true); }

void print_help() {
    std::cout << "Usage: portcullis_cli [--listen ADDR] [--port N|-p N] [--log-level L]" << std::endl;
    std::cout << "                      [--filter-config file.json | --deny DOMAIN... | --allow DOMAIN...]" << std::endl;
    std::cout << "                      [--connect-timeout-ms N] [--idle-timeout-s N]" << std::endl;
    std::cout << "  --deny and --allow may be repeated; they cannot be mixed or combined with --filter-config." << std::endl;
    std::cout << "  Filter config: {\"mode\": \"Blacklist\"|\"Whitelist\", \"domains\": [\"example.com\"]}" << std::endl;
}

int parse_int(const std::string& flag, const std::string& value, int lo, int hi) {
    int v = 0;
    try {
        size_t used = 0;
        v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("{} expects a number, got '{}'", flag, value));
    }
    if (v < lo || v > hi) throw ConfigError(fmt::format("{} must be between {} and {}", flag, lo, hi));
    return v;
}
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Config cfg;
    Logger::Level level = Logger::Level::info;
    std::string filterConfig;
    std::vector<std::string> denied, allowed;
    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            bool has_value = i + 1 < args.size();
            if (a == "--help" || a == "-h") { print_help(); return 0; }
            if ((a == "--port" || a == "-p") && has_value) { cfg.listenPort = static_cast<uint16_t>(parse_int(a, args[++i], 0, 65535)); continue; }
            if (a == "--listen" && has_value) { cfg.listenAddress = args[++i]; continue; }
            if (a == "--log-level" && has_value) {
                auto parsed = Logger::parse_level(args[++i]);
                if (!parsed) throw ConfigError(fmt::format("unknown log level '{}'", args[i]));
                level = *parsed; continue;
            }
            if (a == "--filter-config" && has_value) { filterConfig = args[++i]; continue; }
            if (a == "--deny" && has_value) { denied.push_back(args[++i]); continue; }
            if (a == "--allow" && has_value) { allowed.push_back(args[++i]); continue; }
            if (a == "--connect-timeout-ms" && has_value) { cfg.connectTimeoutMs = parse_int(a, args[++i], 0, 3600 * 1000); continue; }
            if (a == "--idle-timeout-s" && has_value) { cfg.idleTimeoutSec = parse_int(a, args[++i], 0, 7 * 24 * 3600); continue; }
            throw ConfigError(fmt::format("unknown or incomplete option '{}'", a));
        }
        int sources = (filterConfig.empty() ? 0 : 1) + (denied.empty() ? 0 : 1) + (allowed.empty() ? 0 : 1);
        if (sources > 1) throw ConfigError("use only one of --filter-config, --deny, --allow");
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        print_help();
        return 2;
    }
    Logger::instance().set_level(level);

    std::shared_ptr<const FilterRules> rules;
    try {
        if (!filterConfig.empty()) {
            rules = load_filter_rules(filterConfig);
            log_info(fmt::format("loaded {} filter with {} domains from {}", to_string(rules->mode()), rules->domains().size(), filterConfig));
        } else if (!allowed.empty()) {
            rules = std::make_shared<const FilterRules>(FilterRules::allow_list(allowed));
        } else {
            rules = std::make_shared<const FilterRules>(FilterRules::deny_list(denied));
        }
    } catch (const ConfigError& e) {
        Logger::instance().log(Logger::Level::critical, fmt::format("invalid filter configuration: {}", e.what()));
        return 1;
    }

#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    ProxyServer server(cfg, rules);
    auto obs = make_transaction_log_observer(server.dispatcher());
    if (!server.start()) return 1;
    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    server.stop();
    Logger::instance().log(Logger::Level::info, "stopped");
    return 0;
}
