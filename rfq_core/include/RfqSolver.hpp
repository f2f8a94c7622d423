#pragma once
#include "IMessageBus.hpp"
#include "PricingEngine.hpp"
#include "QuoteTypes.hpp"
#include "Session.hpp"
#include "SubscriptionManager.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

// Listens on the shared request topic, prices each request and publishes
// the answer on the requester's bucket topic.
class RfqSolver {
public:
    RfqSolver(IMessageBus& bus,
              Session session,
              PricingEngine& engine,
              std::chrono::milliseconds retry_delay = std::chrono::milliseconds(3000));
    ~RfqSolver();

    RfqSolver(const RfqSolver&) = delete;
    RfqSolver& operator=(const RfqSolver&) = delete;

    void start();
    void stop();

    bool listening() const { return requests_.subscribed(); }

    // nullopt when the request cannot be priced (no response must be sent)
    std::optional<QuoteResponse> process_request(const QuoteRequest& req);

    // Decode -> price -> publish. Every failure is logged and the message dropped.
    void handle_message(const std::string& topic, const std::string& payload);

    const Session& session() const { return session_; }

    std::uint64_t requests_received() const { return received_; }
    std::uint64_t responses_sent() const { return sent_; }
    std::uint64_t requests_dropped() const { return dropped_; }

private:
    IMessageBus& bus_;
    const Session session_;
    PricingEngine& engine_;
    SubscriptionManager requests_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> dropped_{0};
};
