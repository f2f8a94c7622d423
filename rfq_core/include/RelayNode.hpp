#pragma once
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

// Broadcast hub between publishers and subscribers.
//   publishers  --connect--> XSUB (publish_bind)
//   subscribers --connect--> XPUB (subscribe_bind)
// Data flows XSUB -> XPUB, subscription interest flows XPUB -> XSUB.
class RelayNode {
public:
    RelayNode(std::string publish_bind, std::string subscribe_bind);
    ~RelayNode();

    RelayNode(const RelayNode&) = delete;
    RelayNode& operator=(const RelayNode&) = delete;

    // Binds both sockets and starts the forwarding thread. Throws TransportError.
    void start();
    void stop();

    bool running() const { return running_; }
    std::uint64_t forwarded() const { return forwarded_; }

private:
    void run();

private:
    std::string publish_bind_;
    std::string subscribe_bind_;

    zmq::context_t ctx_;
    zmq::socket_t xsub_;
    zmq::socket_t xpub_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> forwarded_{0};
    std::thread thread_;
};
