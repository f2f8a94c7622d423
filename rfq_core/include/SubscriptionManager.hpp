#pragma once
#include "IMessageBus.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Keeps one listener alive on one topic.
//
// Unsubscribed -> Subscribed on the first successful bus.subscribe().
// Each SubscribeError is logged and retried after a fixed delay, forever,
// until stop(). Handler exceptions are logged and the message dropped;
// they never tear the subscription down.
class SubscriptionManager {
public:
    enum class State {
        Unsubscribed,
        Subscribed
    };

    SubscriptionManager(IMessageBus& bus,
                        std::string topic,
                        MessageHandler handler,
                        std::chrono::milliseconds retry_delay = std::chrono::milliseconds(3000));
    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    // Launches the subscribe/retry task. Returns immediately.
    void start();

    // Cancels a pending retry and closes the subscription
    void stop();

    State state() const;
    bool subscribed() const { return state() == State::Subscribed; }
    std::size_t attempts() const { return attempts_; }
    const std::string& topic() const { return topic_; }

    bool wait_subscribed(std::chrono::milliseconds timeout);

private:
    void run();
    void dispatch(const std::string& topic, const std::string& payload);

private:
    IMessageBus& bus_;
    std::string topic_;
    MessageHandler handler_;
    std::chrono::milliseconds retry_delay_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    State state_ = State::Unsubscribed;
    std::unique_ptr<ISubscription> sub_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> attempts_{0};
    std::thread task_;
};
