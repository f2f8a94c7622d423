#pragma once
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Helpers shared by the bus and the relay. Wire layout: [topic][payload].

inline bool send_topic_frames(zmq::socket_t& s,
                              const std::string& topic,
                              const std::string& payload)
{
    zmq::message_t t(topic.data(), topic.size());
    zmq::message_t p(payload.data(), payload.size());

    if (!s.send(t, zmq::send_flags::sndmore)) return false;
    return s.send(p, zmq::send_flags::none).has_value();
}

// Reads one multipart message. nullopt on timeout (rcvtimeo).
// A single-frame message is returned as {"", frame}.
inline std::optional<std::pair<std::string, std::string>> recv_topic_frames(zmq::socket_t& s) {
    zmq::message_t topic_msg;
    auto res = s.recv(topic_msg, zmq::recv_flags::none);
    if (!res.has_value()) return std::nullopt;

    std::string topic = topic_msg.to_string();
    std::string payload;

    if (topic_msg.more()) {
        zmq::message_t payload_msg;
        if (!s.recv(payload_msg, zmq::recv_flags::none)) return std::nullopt;
        payload = payload_msg.to_string();

        // drain unexpected trailing frames
        while (payload_msg.more()) {
            if (!s.recv(payload_msg, zmq::recv_flags::none)) break;
        }
    } else {
        payload = std::move(topic);
        topic.clear();
    }
    return std::make_pair(std::move(topic), std::move(payload));
}

// Forwards every frame of one message from `from` to `to`. Returns frame count.
inline std::size_t forward_message(zmq::socket_t& from, zmq::socket_t& to) {
    std::size_t frames = 0;
    while (true) {
        zmq::message_t part;
        if (!from.recv(part, zmq::recv_flags::dontwait)) break;
        const bool more = part.more();
        to.send(part, more ? zmq::send_flags::sndmore : zmq::send_flags::none);
        ++frames;
        if (!more) break;
    }
    return frames;
}

// Watches a socket for a completed ZMTP handshake
class HandshakeMonitor : public zmq::monitor_t {
public:
    void on_event_handshake_succeeded(const zmq_event_t&, const char*) override {
        ok_ = true;
    }

    // Polls monitor events until a handshake succeeded or the deadline passes
    bool wait(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!ok_ && std::chrono::steady_clock::now() < deadline) {
            check_event(50);
        }
        return ok_;
    }

    static std::string next_address() {
        static std::atomic<unsigned> seq{0};
        return "inproc://rfq-monitor-" + std::to_string(seq.fetch_add(1));
    }

private:
    bool ok_ = false;
};
