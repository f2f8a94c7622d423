#pragma once
#include "IMessageBus.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

struct ZmqBusParams {
    std::string publish_endpoint   = "tcp://127.0.0.1:5555";   // relay XSUB
    std::string subscribe_endpoint = "tcp://127.0.0.1:5556";   // relay XPUB
    int peer_timeout_ms      = 5000;
    int subscribe_timeout_ms = 2000;
    int linger_ms            = 1000;
    int recv_poll_ms         = 100;
};

// Long-lived SUB socket plus its receive thread.
// close() from inside the handler hands the socket to the rx thread,
// which shuts it after the handler returns.
class ZmqSubscription : public ISubscription {
public:
    ZmqSubscription(zmq::socket_t sub, std::string topic, MessageHandler handler, int poll_ms);
    ~ZmqSubscription() override;

    ZmqSubscription(const ZmqSubscription&) = delete;
    ZmqSubscription& operator=(const ZmqSubscription&) = delete;

    const std::string& topic() const override { return ch_->topic; }
    void close() override;

private:
    // shared between the owner and the rx thread
    struct Channel {
        zmq::socket_t sub;
        std::string topic;
        MessageHandler handler;
        int poll_ms = 100;
        std::atomic<bool> running{true};
    };

    static void recv_loop(std::shared_ptr<Channel> ch);

private:
    std::shared_ptr<Channel> ch_;
    std::thread rx_;
};

// Client side of the relay. Subscriptions are long-lived, every publish
// opens its own short-lived XPUB connection.
class ZmqMessageBus : public IMessageBus {
public:
    explicit ZmqMessageBus(ZmqBusParams p);
    ~ZmqMessageBus() override;

    bool wait_for_peers(PeerCapability cap, std::chrono::milliseconds timeout) override;
    void publish(const std::string& topic, const std::string& payload) override;
    std::unique_ptr<ISubscription> subscribe(const std::string& topic,
                                             MessageHandler handler) override;

    const ZmqBusParams& params() const { return p_; }

private:
    // Connects a SUB socket and waits for the ZMTP handshake
    bool probe_relay(std::chrono::milliseconds timeout);

    // Waits for subscription interest forwarded by the relay on a fresh XPUB.
    // Returns once `topic` is subscribed, or once any interest has been seen
    // followed by a short quiet period. False on timeout.
    bool await_interest(zmq::socket_t& pub, const std::string& topic,
                        std::chrono::milliseconds timeout);

private:
    ZmqBusParams p_;
    zmq::context_t ctx_;
};
