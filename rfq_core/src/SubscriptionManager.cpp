#include "SubscriptionManager.hpp"
#include "Log.hpp"
#include "RfqErrors.hpp"

SubscriptionManager::SubscriptionManager(IMessageBus& bus,
                                         std::string topic,
                                         MessageHandler handler,
                                         std::chrono::milliseconds retry_delay)
    : bus_(bus),
      topic_(std::move(topic)),
      handler_(std::move(handler)),
      retry_delay_(retry_delay)
{}

SubscriptionManager::~SubscriptionManager() {
    stop();
}

void SubscriptionManager::start() {
    if (running_.exchange(true)) return;
    task_ = std::thread([this](){ run(); });
}

void SubscriptionManager::stop() {
    if (!running_.exchange(false)) return;

    { std::lock_guard<std::mutex> lk(mtx_); }   // no lost wakeup for a waiting retry
    cv_.notify_all();
    if (task_.joinable()) task_.join();

    std::unique_ptr<ISubscription> sub;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        sub = std::move(sub_);
        state_ = State::Unsubscribed;
    }
    // close outside the lock: close() waits for an in-flight handler
    if (sub) sub->close();
}

SubscriptionManager::State SubscriptionManager::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

bool SubscriptionManager::wait_subscribed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [&]{ return state_ == State::Subscribed; });
}

void SubscriptionManager::dispatch(const std::string& topic, const std::string& payload) {
    try {
        handler_(topic, payload);
    } catch (const std::exception& e) {
        LogLine(LogLevel::Error, "Subscription") << "message on " << topic << " dropped: " << e.what();
    }
}

void SubscriptionManager::run() {
    while (running_) {
        ++attempts_;
        try {
            auto sub = bus_.subscribe(topic_, [this](const std::string& t, const std::string& p) {
                dispatch(t, p);
            });

            {
                std::lock_guard<std::mutex> lk(mtx_);
                sub_   = std::move(sub);
                state_ = State::Subscribed;
            }
            cv_.notify_all();
            LogLine(LogLevel::Info, "Subscription") << "Subscribed to " << topic_;
            return;
        } catch (const SubscribeError& e) {
            LogLine(LogLevel::Warn, "Subscription") << "Subscription retry... (" << topic_ << ": "
                                                        << e.what() << ", attempt " << attempts_.load() << ")";
        }

        // cancellable fixed delay
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, retry_delay_, [this]{ return !running_; });
    }
}
