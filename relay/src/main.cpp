#include "Log.hpp"
#include "RelayNode.hpp"
#include "RfqConfig.hpp"
#include "RfqErrors.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// ------------------- shutdown -------------------
static volatile std::sig_atomic_t g_stop = 0;
static void on_sigint(int) { g_stop = 1; }

int main(int argc, char** argv) {
    std::string config_path = "../config.json";

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    }

    RfqConfig cfg;
    try {
        cfg = load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[rfq_relay] " << e.what() << "\n";
        return 1;
    }
    apply_env_overrides(cfg);
    set_log_level(parse_log_level(cfg.log_level));

    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    RelayNode relay(cfg.relay_publish_bind, cfg.relay_subscribe_bind);
    try {
        relay.start();
    } catch (const TransportError& e) {
        LogLine(LogLevel::Error, "rfq_relay") << e.what();
        return 1;
    }

    LogLine(LogLevel::Info, "rfq_relay") << "Press Ctrl+C to stop.";
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    relay.stop();
    return 0;
}
