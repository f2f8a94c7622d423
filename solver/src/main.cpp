#include "Log.hpp"
#include "PricingEngine.hpp"
#include "RfqConfig.hpp"
#include "RfqErrors.hpp"
#include "RfqSolver.hpp"
#include "Session.hpp"
#include "ZmqMessageBus.hpp"

#include <curl/curl.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// ------------------- shutdown -------------------
static volatile std::sig_atomic_t g_stop = 0;
static void on_sigint(int) { g_stop = 1; }

// Blocks until the relay accepts a subscriber, or Ctrl+C
static bool wait_for_relay(IMessageBus& bus) {
    while (!g_stop) {
        if (bus.wait_for_peers(PeerCapability::Relay, std::chrono::seconds(2)))
            return true;
        LogLine(LogLevel::Info, "rfq_solver") << "Waiting for relay peers...";
    }
    return false;
}

int main(int argc, char** argv) {
    std::string config_path = "../config.json";

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    }

    RfqConfig cfg;
    std::unique_ptr<IPriceFeed> feed;
    try {
        cfg = load_config(config_path);
        apply_env_overrides(cfg);
        feed = make_price_feed(cfg.price_feed);
    } catch (const ConfigError& e) {
        std::cerr << "[rfq_solver] " << e.what() << "\n";
        return 1;
    }
    set_log_level(parse_log_level(cfg.log_level));

    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    int rc = 0;
    {
        ZmqMessageBus bus(cfg.bus);
        PricingEngine engine(*feed, UniformFee(cfg.fee_min, cfg.fee_max));

        try {
            RfqSolver solver(bus, make_session(), engine,
                             std::chrono::milliseconds(cfg.retry_delay_ms));

            if (wait_for_relay(bus)) {
                LogLine(LogLevel::Info, "rfq_solver") << "Connected to relay at " << cfg.bus.subscribe_endpoint;
                solver.start();

                while (!g_stop) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }

                solver.stop();
                LogLine(LogLevel::Info, "rfq_solver") << "received=" << solver.requests_received()
                                                         << " sent=" << solver.responses_sent()
                                                         << " dropped=" << solver.requests_dropped();
            }
        } catch (const IdentityError& e) {
            LogLine(LogLevel::Error, "rfq_solver") << e.what();
            rc = 1;
        }
    }

    curl_global_cleanup();
    return rc;
}
