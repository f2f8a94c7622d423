#include "ZmqMessageBus.hpp"
#include "Log.hpp"
#include "RfqErrors.hpp"
#include "core/ZmqFrames.hpp"

using namespace std::chrono;

// ================= ZmqSubscription =================

ZmqSubscription::ZmqSubscription(zmq::socket_t sub, std::string topic,
                                 MessageHandler handler, int poll_ms)
    : ch_(std::make_shared<Channel>())
{
    ch_->sub     = std::move(sub);
    ch_->topic   = std::move(topic);
    ch_->handler = std::move(handler);
    ch_->poll_ms = poll_ms;

    // socket is owned by the rx thread from here on
    rx_ = std::thread(&ZmqSubscription::recv_loop, ch_);
}

ZmqSubscription::~ZmqSubscription() {
    close();
}

void ZmqSubscription::close() {
    ch_->running = false;
    if (!rx_.joinable()) return;

    if (rx_.get_id() == std::this_thread::get_id()) {
        // called from the handler: the loop exits once it returns
        rx_.detach();
    } else {
        rx_.join();
    }
}

void ZmqSubscription::recv_loop(std::shared_ptr<Channel> ch) {
    ch->sub.set(zmq::sockopt::rcvtimeo, ch->poll_ms);

    while (ch->running) {
        std::optional<std::pair<std::string, std::string>> msg;
        try {
            msg = recv_topic_frames(ch->sub);
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) break;
            LogLine(LogLevel::Error, "ZmqBus") << "recv failed on " << ch->topic << ": " << e.what();
            continue;
        }
        if (!msg) continue;

        // SUB filters by prefix; keep exact topic only
        if (msg->first != ch->topic) continue;

        try {
            ch->handler(msg->first, msg->second);
        } catch (const std::exception& e) {
            LogLine(LogLevel::Error, "ZmqBus") << "handler failed on " << ch->topic << ": " << e.what();
        }
    }

    ch->sub.close();
}

// ================= ZmqMessageBus =================

ZmqMessageBus::ZmqMessageBus(ZmqBusParams p)
    : p_(std::move(p)), ctx_(1)
{}

ZmqMessageBus::~ZmqMessageBus() = default;

bool ZmqMessageBus::probe_relay(milliseconds timeout) {
    zmq::socket_t sub(ctx_, zmq::socket_type::sub);
    sub.set(zmq::sockopt::linger, 0);

    HandshakeMonitor mon;
    mon.init(sub, HandshakeMonitor::next_address(), ZMQ_EVENT_HANDSHAKE_SUCCEEDED);
    sub.connect(p_.subscribe_endpoint);

    const bool ok = mon.wait(timeout);
    mon.abort();
    return ok;
}

bool ZmqMessageBus::await_interest(zmq::socket_t& pub, const std::string& topic,
                                   milliseconds timeout)
{
    const auto deadline = steady_clock::now() + timeout;
    const int quiet_ms = 50;
    bool seen_any = false;

    pub.set(zmq::sockopt::rcvtimeo, quiet_ms);

    while (steady_clock::now() < deadline) {
        zmq::message_t sub_msg;
        auto res = pub.recv(sub_msg, zmq::recv_flags::none);
        if (!res.has_value()) {
            // quiet period after some interest: relay has replayed its subscriptions
            if (seen_any) return true;
            continue;
        }

        // 0x01 + prefix = subscribe, 0x00 + prefix = unsubscribe
        const auto* data = static_cast<const char*>(sub_msg.data());
        if (sub_msg.size() == 0 || data[0] != 1) continue;

        seen_any = true;
        const std::string prefix(data + 1, sub_msg.size() - 1);
        if (topic.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

bool ZmqMessageBus::wait_for_peers(PeerCapability cap, milliseconds timeout) {
    try {
        if (cap == PeerCapability::Relay) return probe_relay(timeout);

        zmq::socket_t pub(ctx_, zmq::socket_type::xpub);
        pub.set(zmq::sockopt::linger, 0);
        pub.connect(p_.publish_endpoint);
        return await_interest(pub, std::string(), timeout);
    } catch (const zmq::error_t& e) {
        LogLine(LogLevel::Error, "ZmqBus") << "peer probe failed: " << e.what();
        return false;
    }
}

void ZmqMessageBus::publish(const std::string& topic, const std::string& payload) {
    try {
        zmq::socket_t pub(ctx_, zmq::socket_type::xpub);
        pub.set(zmq::sockopt::linger, p_.linger_ms);
        pub.set(zmq::sockopt::sndhwm, 10000);
        pub.connect(p_.publish_endpoint);

        if (!await_interest(pub, topic, milliseconds(p_.peer_timeout_ms))) {
            throw TransportError("no relay peer reachable at " + p_.publish_endpoint);
        }

        if (!send_topic_frames(pub, topic, payload)) {
            throw TransportError("send would block on " + topic);
        }

        LogLine(LogLevel::Debug, "ZmqBus") << "published " << payload.size() << " bytes on " << topic;
        // socket closes here; linger lets the I/O thread flush the frames
    } catch (const zmq::error_t& e) {
        throw TransportError(std::string("zmq publish failed: ") + e.what());
    }
}

std::unique_ptr<ISubscription> ZmqMessageBus::subscribe(const std::string& topic,
                                                        MessageHandler handler)
{
    try {
        zmq::socket_t sub(ctx_, zmq::socket_type::sub);
        sub.set(zmq::sockopt::rcvhwm, 100000);
        sub.set(zmq::sockopt::linger, 0);

        {
            HandshakeMonitor mon;
            mon.init(sub, HandshakeMonitor::next_address(), ZMQ_EVENT_HANDSHAKE_SUCCEEDED);
            sub.connect(p_.subscribe_endpoint);
            sub.set(zmq::sockopt::subscribe, topic);

            const bool ok = mon.wait(milliseconds(p_.subscribe_timeout_ms));
            mon.abort();
            if (!ok) {
                throw SubscribeError("no relay peer reachable at " + p_.subscribe_endpoint);
            }
        }

        LogLine(LogLevel::Debug, "ZmqBus") << "SUB connected to " << p_.subscribe_endpoint
                                               << " topic='" << topic << "'";

        return std::make_unique<ZmqSubscription>(std::move(sub), topic,
                                                 std::move(handler), p_.recv_poll_ms);
    } catch (const zmq::error_t& e) {
        throw SubscribeError(std::string("zmq subscribe failed: ") + e.what());
    }
}
