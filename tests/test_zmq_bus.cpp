#include <gtest/gtest.h>
#include "Identity.hpp"
#include "PricingEngine.hpp"
#include "QuoteCodec.hpp"
#include "RelayNode.hpp"
#include "RfqErrors.hpp"
#include "RfqRequester.hpp"
#include "RfqSolver.hpp"
#include "StaticPriceFeed.hpp"
#include "SubscriptionManager.hpp"
#include "ZmqMessageBus.hpp"

#include <chrono>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

ZmqBusParams params_for(int pub_port, int sub_port) {
    ZmqBusParams p;
    p.publish_endpoint     = "tcp://127.0.0.1:" + std::to_string(pub_port);
    p.subscribe_endpoint   = "tcp://127.0.0.1:" + std::to_string(sub_port);
    p.peer_timeout_ms      = 3000;
    p.subscribe_timeout_ms = 2000;
    p.linger_ms            = 500;
    p.recv_poll_ms         = 20;
    return p;
}

// Thread-safe inbox for messages delivered on the rx thread
class Inbox {
public:
    void push(const std::string& topic, const std::string& payload) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            msgs_.push_back({topic, payload});
        }
        cv_.notify_all();
    }

    bool wait_for(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&]{ return msgs_.size() >= n; });
    }

    std::vector<std::pair<std::string, std::string>> messages() {
        std::lock_guard<std::mutex> lk(mtx_);
        return msgs_;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<std::pair<std::string, std::string>> msgs_;
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

QuoteRequest scenario_request() {
    QuoteRequest r;
    r.from.network = "mainnet";
    r.from.tokens  = {{"0xAAA", 1000}};
    r.to.network   = "base";
    r.to.tokens    = {{"0xBBB", 30}, {"0xCCC", 70}};
    return r;
}

} // namespace

TEST(ZmqMessageBusTest, PublishReachesSubscriberThroughRelay) {
    RelayNode relay("tcp://127.0.0.1:17555", "tcp://127.0.0.1:17556");
    relay.start();

    ZmqMessageBus bus(params_for(17555, 17556));
    EXPECT_TRUE(bus.wait_for_peers(PeerCapability::Relay, 2000ms));

    Inbox inbox;
    auto sub = bus.subscribe("/iLayer/1/rfq/proto", [&](const std::string& t, const std::string& p) {
        inbox.push(t, p);
    });
    ASSERT_NE(sub, nullptr);
    EXPECT_EQ(sub->topic(), "/iLayer/1/rfq/proto");

    bus.publish("/iLayer/1/rfq/proto", R"({"bucket":"ab12cd34"})");

    ASSERT_TRUE(inbox.wait_for(1, 3000ms));
    auto msgs = inbox.messages();
    EXPECT_EQ(msgs[0].first, "/iLayer/1/rfq/proto");
    EXPECT_EQ(msgs[0].second, R"({"bucket":"ab12cd34"})");
    EXPECT_GE(relay.forwarded(), 1u);

    sub->close();
    relay.stop();
}

TEST(ZmqMessageBusTest, OnlyExactTopicIsDelivered) {
    RelayNode relay("tcp://127.0.0.1:17565", "tcp://127.0.0.1:17566");
    relay.start();

    ZmqMessageBus bus(params_for(17565, 17566));
    Inbox inbox;
    auto sub = bus.subscribe("/iLayer/1/ab12cd34/proto", [&](const std::string& t, const std::string& p) {
        inbox.push(t, p);
    });

    // shares the subscribed prefix
    bus.publish("/iLayer/1/ab12cd34/proto-extra", "prefix");
    bus.publish("/iLayer/1/ab12cd34/proto", "exact");

    ASSERT_TRUE(inbox.wait_for(1, 3000ms));
    std::this_thread::sleep_for(200ms);

    auto msgs = inbox.messages();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].second, "exact");

    sub->close();
}

TEST(ZmqMessageBusTest, LightPushPeerSeenOnceSomeoneSubscribes) {
    RelayNode relay("tcp://127.0.0.1:17575", "tcp://127.0.0.1:17576");
    relay.start();

    ZmqMessageBus bus(params_for(17575, 17576));
    auto sub = bus.subscribe("/t", [](const std::string&, const std::string&){});

    EXPECT_TRUE(bus.wait_for_peers(PeerCapability::LightPush, 3000ms));
    sub->close();
}

TEST(ZmqMessageBusTest, SubscribeWithoutRelayFails) {
    ZmqBusParams p = params_for(17585, 17586);
    p.subscribe_timeout_ms = 200;
    ZmqMessageBus bus(p);

    EXPECT_THROW(bus.subscribe("/t", [](const std::string&, const std::string&){}), SubscribeError);
}

TEST(ZmqMessageBusTest, PublishWithoutRelayFails) {
    ZmqBusParams p = params_for(17595, 17596);
    p.peer_timeout_ms = 200;
    ZmqMessageBus bus(p);

    EXPECT_THROW(bus.publish("/t", "payload"), TransportError);
}

TEST(ZmqMessageBusTest, NoRelayPeerWithoutRelay) {
    ZmqMessageBus bus(params_for(17605, 17606));
    EXPECT_FALSE(bus.wait_for_peers(PeerCapability::Relay, 200ms));
}

TEST(ZmqMessageBusTest, BadEndpointIsSubscribeError) {
    ZmqBusParams p = params_for(17615, 17616);
    p.subscribe_endpoint = "nonsense://";
    ZmqMessageBus bus(p);

    EXPECT_THROW(bus.subscribe("/t", [](const std::string&, const std::string&){}), SubscribeError);
}

TEST(RelayNodeTest, BindConflictIsTransportError) {
    RelayNode first("tcp://127.0.0.1:17625", "tcp://127.0.0.1:17626");
    first.start();
    EXPECT_TRUE(first.running());

    RelayNode second("tcp://127.0.0.1:17625", "tcp://127.0.0.1:17627");
    EXPECT_THROW(second.start(), TransportError);
    EXPECT_FALSE(second.running());
}

TEST(ZmqMessageBusTest, UnlistenedTopicIsDroppedWithoutError) {
    RelayNode relay("tcp://127.0.0.1:17635", "tcp://127.0.0.1:17636");
    relay.start();

    ZmqMessageBus bus(params_for(17635, 17636));
    Inbox inbox;
    auto sub = bus.subscribe(topic_for("cafebabe"), [&](const std::string& t, const std::string& p) {
        inbox.push(t, p);
    });
    ASSERT_TRUE(bus.wait_for_peers(PeerCapability::LightPush, 3000ms));

    // interest exists, just not for this topic: quiet period, then send into the void
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(bus.publish(topic_for("deadbeef"), "nobody"));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2000ms);

    EXPECT_FALSE(inbox.wait_for(1, 300ms));
    sub->close();
}

TEST(ZmqMessageBusTest, HandlerCanStopItsOwnSubscription) {
    RelayNode relay("tcp://127.0.0.1:17645", "tcp://127.0.0.1:17646");
    relay.start();

    ZmqMessageBus bus(params_for(17645, 17646));

    std::atomic<bool> stopped{false};
    std::unique_ptr<SubscriptionManager> mgr;
    mgr = std::make_unique<SubscriptionManager>(bus, "/t/stop", [&](const std::string&, const std::string&) {
        mgr->stop();
        stopped = true;
    }, 50ms);

    mgr->start();
    ASSERT_TRUE(mgr->wait_subscribed(3000ms));

    bus.publish("/t/stop", "bye");
    ASSERT_TRUE(eventually([&]{ return stopped.load(); }, 3000ms));

    EXPECT_FALSE(mgr->subscribed());
    mgr.reset();
}

// Solver and requester on separate buses, talking through one relay
class ZmqRfqFlowTest : public ::testing::Test {
protected:
    ZmqRfqFlowTest()
        : relay("tcp://127.0.0.1:17655", "tcp://127.0.0.1:17656"),
          feed({{"0xAAA", 1.0}, {"0xBBB", 2.0}, {"0xCCC", 5.0}}),
          engine(feed, []{ return 0.0; }),
          solver_bus(params_for(17655, 17656)),
          requester_bus(params_for(17655, 17656))
    {}

    void SetUp() override {
        relay.start();
        solver = std::make_unique<RfqSolver>(solver_bus, make_session(), engine, 50ms);
        solver->start();
        ASSERT_TRUE(eventually([&]{ return solver->listening(); }, 3000ms));
    }

    void TearDown() override {
        if (requester) requester->stop();
        solver->stop();
        requester.reset();
        solver.reset();
    }

    RelayNode relay;
    StaticPriceFeed feed;
    PricingEngine engine;
    ZmqMessageBus solver_bus;
    ZmqMessageBus requester_bus;
    std::unique_ptr<RfqSolver> solver;
    std::unique_ptr<RfqRequester> requester;
};

TEST_F(ZmqRfqFlowTest, RequestIsQuotedOverRelay) {
    requester = std::make_unique<RfqRequester>(requester_bus, make_session(),
                                               RequesterOptions{50ms, 3000ms});
    requester->start();
    ASSERT_TRUE(eventually([&]{ return requester->listening(); }, 3000ms));

    // let the relay forward both subscriptions upstream
    std::this_thread::sleep_for(200ms);

    QuoteRequest sent = requester->send_request(scenario_request());
    EXPECT_EQ(sent.bucket, requester->session().bucket);

    QuoteResponse resp = requester->await_response(5000ms);
    EXPECT_EQ(resp.solver, solver->session().identity.public_key);
    ASSERT_EQ(resp.to.tokens.size(), 2u);
    EXPECT_DOUBLE_EQ(resp.to.tokens[0].amount, 150.0);
    EXPECT_DOUBLE_EQ(resp.to.tokens[1].amount, 70.0);

    EXPECT_EQ(solver->requests_received(), 1u);
    EXPECT_EQ(solver->responses_sent(), 1u);
}

TEST_F(ZmqRfqFlowTest, RequesterStoppedFromResponseCallback) {
    requester = std::make_unique<RfqRequester>(requester_bus, make_session(),
                                               RequesterOptions{50ms, 3000ms});
    std::atomic<int> seen{0};
    requester->on_response = [&](const QuoteResponse&) {
        ++seen;
        requester->stop();
    };
    requester->start();
    ASSERT_TRUE(eventually([&]{ return requester->listening(); }, 3000ms));
    std::this_thread::sleep_for(200ms);

    requester->send_request(scenario_request());
    EXPECT_NO_THROW(requester->await_response(5000ms));
    EXPECT_EQ(seen.load(), 1);
    EXPECT_FALSE(requester->listening());
}

TEST_F(ZmqRfqFlowTest, ReplyToBucketWithoutListenerIsDropped) {
    std::this_thread::sleep_for(200ms);

    QuoteRequest r = scenario_request();
    r.bucket = "deadbeef";
    requester_bus.publish(request_topic(), encode_request(r));

    ASSERT_TRUE(eventually([&]{
        return solver->responses_sent() + solver->requests_dropped() == 1;
    }, 5000ms));
    EXPECT_EQ(solver->requests_received(), 1u);
    EXPECT_EQ(solver->responses_sent(), 1u);
    EXPECT_EQ(solver->requests_dropped(), 0u);
}
