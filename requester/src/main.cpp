#include "HttpTrigger.hpp"
#include "Log.hpp"
#include "QuoteCodec.hpp"
#include "RfqConfig.hpp"
#include "RfqErrors.hpp"
#include "RfqRequester.hpp"
#include "Session.hpp"
#include "ZmqMessageBus.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

// ------------------- shutdown -------------------
static volatile std::sig_atomic_t g_stop = 0;
static void on_sigint(int) { g_stop = 1; }

static void print_usage() {
    std::cout << "usage: rfq_requester [--config <path>] [--once]\n"
              << "  --once   send the sample request, wait for the quote, exit\n"
              << "  default  serve GET " << HttpTrigger::kSendTarget << "\n";
}

// Sends the sample request and waits for the first quote
static int run_once(RfqRequester& requester, std::chrono::milliseconds timeout) {
    try {
        requester.send_request(make_sample_request());
        QuoteResponse resp = requester.await_response(timeout);
        std::cout << encode_response(resp) << "\n";
        return 0;
    } catch (const TransportError& e) {
        LogLine(LogLevel::Error, "rfq_requester") << "request not sent: " << e.what();
    } catch (const TimeoutError& e) {
        LogLine(LogLevel::Error, "rfq_requester") << e.what();
    }
    return 1;
}

static int serve_http(RfqRequester& requester, const RfqConfig& cfg) {
    HttpTrigger http(cfg.http_address, cfg.http_port, [&requester]() {
        QuoteRequest sent = requester.send_request(make_sample_request());
        json body;
        body["status"]  = "sent";
        body["bucket"]  = sent.bucket;
        body["request"] = json::parse(encode_request(sent));
        return body.dump();
    });

    try {
        http.start();
    } catch (const TransportError& e) {
        LogLine(LogLevel::Error, "rfq_requester") << e.what();
        return 1;
    }

    LogLine(LogLevel::Info, "rfq_requester") << "Press Ctrl+C to stop.";
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http.stop();
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path = "../config.json";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (a == "--once") once = true;
        else if (a == "--help" || a == "-h") { print_usage(); return 0; }
    }

    RfqConfig cfg;
    try {
        cfg = load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[rfq_requester] " << e.what() << "\n";
        return 1;
    }
    apply_env_overrides(cfg);
    set_log_level(parse_log_level(cfg.log_level));

    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    ZmqMessageBus bus(cfg.bus);

    Session session;
    try {
        session = make_session();
    } catch (const IdentityError& e) {
        LogLine(LogLevel::Error, "rfq_requester") << e.what();
        return 1;
    }

    RequesterOptions opts;
    opts.retry_delay = std::chrono::milliseconds(cfg.retry_delay_ms);
    opts.listen_wait = std::chrono::milliseconds(cfg.listen_wait_ms);

    RfqRequester requester(bus, session, opts);
    requester.on_response = [](const QuoteResponse& r) {
        for (const auto& t : r.to.tokens) {
            LogLine(LogLevel::Info, "rfq_requester") << "  " << r.to.network << " " << t.address
                                                        << " amount=" << t.amount;
        }
    };
    requester.start();

    const int rc = once
        ? run_once(requester, std::chrono::milliseconds(cfg.response_timeout_ms))
        : serve_http(requester, cfg);

    requester.stop();
    return rc;
}
