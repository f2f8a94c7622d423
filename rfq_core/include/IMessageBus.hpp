#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// Invoked once per received message. May run on a transport thread.
using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

enum class PeerCapability {
    Relay,      // can subscribe / receive
    LightPush   // can publish
};

class ISubscription {
public:
    virtual ~ISubscription() = default;

    virtual const std::string& topic() const = 0;

    // Stop delivery. Idempotent; no handler call is in flight after it returns.
    virtual void close() = 0;
};

// Broadcast substrate seen by the RFQ core
class IMessageBus {
public:
    virtual ~IMessageBus() = default;

    // Blocks until at least one peer with the capability is reachable
    // or the timeout expires. Returns false on timeout.
    virtual bool wait_for_peers(PeerCapability cap, std::chrono::milliseconds timeout) = 0;

    // One-shot, at-most-once. Throws TransportError.
    virtual void publish(const std::string& topic, const std::string& payload) = 0;

    // Throws SubscribeError if no peer is reachable.
    virtual std::unique_ptr<ISubscription> subscribe(const std::string& topic,
                                                     MessageHandler handler) = 0;
};
