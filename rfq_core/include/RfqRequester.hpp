#pragma once
#include "IMessageBus.hpp"
#include "QuoteTypes.hpp"
#include "Session.hpp"
#include "SubscriptionManager.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

struct RequesterOptions {
    std::chrono::milliseconds retry_delay{3000};
    // how long send_request waits for the response listener to come up
    std::chrono::milliseconds listen_wait{10000};
};

// Sends quote requests on the shared request topic and listens for the
// answer on the session's private bucket topic.
class RfqRequester {
public:
    RfqRequester(IMessageBus& bus, Session session, RequesterOptions opts = {});
    ~RfqRequester();

    RfqRequester(const RfqRequester&) = delete;
    RfqRequester& operator=(const RfqRequester&) = delete;

    // Starts listening on the response topic. Call before send_request.
    void start();
    void stop();

    bool listening() const { return responses_.subscribed(); }

    // Stamps the session bucket, publishes once. No ack, no retry.
    // Throws TransportError if the listener is not up or the publish fails.
    QuoteRequest send_request(QuoteRequest req);

    // First response for the last request sent. Later ones are logged and dropped.
    // timeout == 0 waits forever. Throws TimeoutError.
    QuoteResponse await_response(std::chrono::milliseconds timeout);

    // Decode + correlate one message from the response topic
    void handle_message(const std::string& topic, const std::string& payload);

    const Session& session() const { return session_; }
    std::uint64_t responses_discarded() const;

    // Called (on a transport thread) with each accepted response
    std::function<void(const QuoteResponse&)> on_response;

private:
    IMessageBus& bus_;
    const Session session_;
    RequesterOptions opts_;
    SubscriptionManager responses_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool awaiting_ = false;
    bool stopped_ = false;
    std::optional<QuoteResponse> latest_;
    std::uint64_t discarded_ = 0;
};

// WETH on mainnet -> 30% USDC / 70% USDT on base
QuoteRequest make_sample_request();
