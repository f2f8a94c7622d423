#include <gtest/gtest.h>
#include "FakeMessageBus.hpp"
#include "SubscriptionManager.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono;
using namespace std::chrono_literals;

TEST(SubscriptionManagerTest, SubscribesOnFirstTry) {
    FakeMessageBus bus;
    SubscriptionManager mgr(bus, "/iLayer/1/rfq/proto", [](const std::string&, const std::string&){});

    EXPECT_EQ(mgr.state(), SubscriptionManager::State::Unsubscribed);
    mgr.start();
    ASSERT_TRUE(mgr.wait_subscribed(2s));

    EXPECT_EQ(mgr.attempts(), 1u);
    EXPECT_EQ(bus.open_subscriptions(), 1u);
    EXPECT_EQ(mgr.topic(), "/iLayer/1/rfq/proto");
}

TEST(SubscriptionManagerTest, RetriesUntilPeerAppears) {
    LogCapture logs;
    FakeMessageBus bus;
    bus.fail_next_subscribes(3);

    SubscriptionManager mgr(bus, "/t", [](const std::string&, const std::string&){}, 10ms);
    mgr.start();
    ASSERT_TRUE(mgr.wait_subscribed(5s));

    EXPECT_EQ(mgr.attempts(), 4u);
    EXPECT_EQ(bus.subscribe_calls(), 4u);
    EXPECT_EQ(bus.open_subscriptions(), 1u);
    EXPECT_GE(logs.count_containing("Subscription retry"), 3u);
}

TEST(SubscriptionManagerTest, NoDuplicateDeliveryAfterRetries) {
    FakeMessageBus bus;
    bus.fail_next_subscribes(2);

    std::atomic<int> received{0};
    SubscriptionManager mgr(bus, "/t", [&](const std::string&, const std::string&){ ++received; }, 5ms);
    mgr.start();
    ASSERT_TRUE(mgr.wait_subscribed(5s));

    bus.publish("/t", "one");
    bus.publish("/t", "two");
    bus.publish("/other", "three");

    EXPECT_EQ(received.load(), 2);
}

TEST(SubscriptionManagerTest, HandlerExceptionDoesNotBreakSubscription) {
    FakeMessageBus bus;
    std::atomic<int> calls{0};

    SubscriptionManager mgr(bus, "/t", [&](const std::string&, const std::string& p) {
        ++calls;
        if (p == "bad") throw std::runtime_error("boom");
    });
    mgr.start();
    ASSERT_TRUE(mgr.wait_subscribed(2s));

    LogCapture logs;
    EXPECT_NO_THROW(bus.publish("/t", "bad"));
    bus.publish("/t", "good");

    EXPECT_EQ(calls.load(), 2);
    EXPECT_TRUE(mgr.subscribed());
    EXPECT_EQ(logs.count_containing("boom"), 1u);
}

TEST(SubscriptionManagerTest, StopCancelsPendingRetry) {
    FakeMessageBus bus;
    bus.fail_next_subscribes(1000);

    SubscriptionManager mgr(bus, "/t", [](const std::string&, const std::string&){}, 60s);
    mgr.start();

    // let the first attempt fail and the long wait begin
    const auto deadline = steady_clock::now() + 2s;
    while (bus.subscribe_calls() == 0 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(bus.subscribe_calls(), 1u);

    const auto t0 = steady_clock::now();
    mgr.stop();
    EXPECT_LT(steady_clock::now() - t0, 2s);

    EXPECT_EQ(mgr.state(), SubscriptionManager::State::Unsubscribed);
    EXPECT_EQ(bus.open_subscriptions(), 0u);
}

TEST(SubscriptionManagerTest, StopClosesSubscription) {
    FakeMessageBus bus;
    std::atomic<int> received{0};

    SubscriptionManager mgr(bus, "/t", [&](const std::string&, const std::string&){ ++received; });
    mgr.start();
    ASSERT_TRUE(mgr.wait_subscribed(2s));
    mgr.stop();

    bus.publish("/t", "after stop");
    EXPECT_EQ(received.load(), 0);
    EXPECT_EQ(bus.open_subscriptions(), 0u);
}

TEST(SubscriptionManagerTest, StartIsIdempotent) {
    FakeMessageBus bus;
    SubscriptionManager mgr(bus, "/t", [](const std::string&, const std::string&){});
    mgr.start();
    mgr.start();
    ASSERT_TRUE(mgr.wait_subscribed(2s));

    EXPECT_EQ(bus.subscribe_calls(), 1u);
}
