#include "RfqSolver.hpp"
#include "Log.hpp"
#include "QuoteCodec.hpp"
#include "RfqErrors.hpp"

RfqSolver::RfqSolver(IMessageBus& bus,
                     Session session,
                     PricingEngine& engine,
                     std::chrono::milliseconds retry_delay)
    : bus_(bus),
      session_(std::move(session)),
      engine_(engine),
      requests_(bus, session_.request_topic,
                [this](const std::string& t, const std::string& p){ handle_message(t, p); },
                retry_delay)
{}

RfqSolver::~RfqSolver() {
    stop();
}

void RfqSolver::start() {
    LogLine(LogLevel::Info, "Solver") << "solver " << session_.identity.public_key
                                         << ", listening on " << session_.request_topic;
    requests_.start();
}

void RfqSolver::stop() {
    requests_.stop();
}

std::optional<QuoteResponse> RfqSolver::process_request(const QuoteRequest& req) {
    try {
        return engine_.quote(req, session_.identity.public_key);
    } catch (const PricingError& e) {
        LogLine(LogLevel::Error, "Solver") << "cannot price request for bucket " << req.bucket
                                              << ": " << e.what();
        return std::nullopt;
    }
}

void RfqSolver::handle_message(const std::string& topic, const std::string& payload) {
    ++received_;
    LogLine(LogLevel::Info, "Solver") << "New request for quotes received on " << topic;

    QuoteRequest req;
    try {
        req = decode_request(payload);
    } catch (const CodecError& e) {
        ++dropped_;
        LogLine(LogLevel::Warn, "Solver") << "undecodable request dropped: " << e.what();
        return;
    }

    if (!is_valid_bucket(req.bucket)) {
        ++dropped_;
        LogLine(LogLevel::Warn, "Solver") << "request with invalid bucket '" << req.bucket << "' dropped";
        return;
    }

    auto resp = process_request(req);
    if (!resp) {
        ++dropped_;
        return;
    }

    const std::string reply_topic = topic_for(req.bucket);
    try {
        LogLine(LogLevel::Info, "Solver") << "Sending response for quotes on " << reply_topic;
        bus_.publish(reply_topic, encode_response(*resp));
        ++sent_;
        LogLine(LogLevel::Info, "Solver") << "Response for quotes sent.";
    } catch (const TransportError& e) {
        ++dropped_;
        LogLine(LogLevel::Error, "Solver") << "response for bucket " << req.bucket
                                              << " not delivered: " << e.what();
    }
}
