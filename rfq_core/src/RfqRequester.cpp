#include "RfqRequester.hpp"
#include "Log.hpp"
#include "QuoteCodec.hpp"
#include "RfqErrors.hpp"

RfqRequester::RfqRequester(IMessageBus& bus, Session session, RequesterOptions opts)
    : bus_(bus),
      session_(std::move(session)),
      opts_(opts),
      responses_(bus, session_.response_topic,
                 [this](const std::string& t, const std::string& p){ handle_message(t, p); },
                 opts.retry_delay)
{}

RfqRequester::~RfqRequester() {
    stop();
}

void RfqRequester::start() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopped_ = false;
    }
    LogLine(LogLevel::Info, "Requester") << "bucket " << session_.bucket
                                            << ", listening on " << session_.response_topic;
    responses_.start();
}

void RfqRequester::stop() {
    responses_.stop();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopped_ = true;
    }
    cv_.notify_all();
}

QuoteRequest RfqRequester::send_request(QuoteRequest req) {
    // listener must be up before anything goes out
    if (!responses_.wait_subscribed(opts_.listen_wait)) {
        throw TransportError("response listener not established on " + session_.response_topic);
    }

    req.bucket = session_.bucket;
    const std::string payload = encode_request(req);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        awaiting_ = true;
        latest_.reset();
    }

    LogLine(LogLevel::Info, "Requester") << "Sending request for quotes... " << payload;
    try {
        bus_.publish(session_.request_topic, payload);
    } catch (const TransportError&) {
        std::lock_guard<std::mutex> lk(mtx_);
        awaiting_ = false;
        throw;
    }
    LogLine(LogLevel::Info, "Requester") << "Request for quotes sent.";
    return req;
}

void RfqRequester::handle_message(const std::string& topic, const std::string& payload) {
    LogLine(LogLevel::Info, "Requester") << "New response for quotes received on " << topic;

    QuoteResponse resp;
    try {
        resp = decode_response(payload);
    } catch (const CodecError& e) {
        LogLine(LogLevel::Warn, "Requester") << "undecodable response dropped: " << e.what();
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!awaiting_) {
            ++discarded_;
            LogLine(LogLevel::Warn, "Requester") << "late or unsolicited response from "
                                                    << resp.solver << " discarded";
            return;
        }
        awaiting_ = false;
        latest_   = resp;
    }
    cv_.notify_all();

    LogLine(LogLevel::Info, "Requester") << "Quote from " << resp.solver << ": " << encode_response(resp);

    if (on_response) on_response(resp);
}

QuoteResponse RfqRequester::await_response(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto ready = [this]{ return latest_.has_value() || stopped_; };

    if (timeout.count() <= 0) {
        cv_.wait(lk, ready);
    } else if (!cv_.wait_for(lk, timeout, ready)) {
        throw TimeoutError("no response within " + std::to_string(timeout.count()) + " ms");
    }
    if (!latest_) throw TimeoutError("requester stopped before a response arrived");

    QuoteResponse out = std::move(*latest_);
    latest_.reset();
    return out;
}

std::uint64_t RfqRequester::responses_discarded() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return discarded_;
}

QuoteRequest make_sample_request() {
    QuoteRequest r;
    r.from.network = "mainnet";
    r.from.tokens  = {{"0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2", 1}};      // WETH
    r.to.network   = "base";
    r.to.tokens    = {{"0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48", 30},      // USDC
                      {"0xdac17f958d2ee523a2206206994597c13d831ec7", 70}};     // USDT
    return r;
}
