#include "RelayNode.hpp"
#include "Log.hpp"
#include "RfqErrors.hpp"
#include "core/ZmqFrames.hpp"

#include <chrono>

RelayNode::RelayNode(std::string publish_bind, std::string subscribe_bind)
    : publish_bind_(std::move(publish_bind)),
      subscribe_bind_(std::move(subscribe_bind)),
      ctx_(1),
      xsub_(ctx_, zmq::socket_type::xsub),
      xpub_(ctx_, zmq::socket_type::xpub)
{}

RelayNode::~RelayNode() {
    stop();
}

void RelayNode::start() {
    if (running_.exchange(true)) return;

    try {
        xsub_.set(zmq::sockopt::linger, 0);
        xpub_.set(zmq::sockopt::linger, 0);
        // High-water mark: drop if subscriber is slow
        xpub_.set(zmq::sockopt::sndhwm, 10000);

        xsub_.bind(publish_bind_);
        xpub_.bind(subscribe_bind_);
    } catch (const zmq::error_t& e) {
        running_ = false;
        throw TransportError(std::string("relay bind failed: ") + e.what());
    }

    LogLine(LogLevel::Info, "Relay") << "publishers -> " << publish_bind_
                                        << ", subscribers -> " << subscribe_bind_;

    thread_ = std::thread([this](){ run(); });
}

void RelayNode::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();

    xsub_.close();
    xpub_.close();
    LogLine(LogLevel::Info, "Relay") << "stopped after " << forwarded_.load() << " messages";
}

void RelayNode::run() {
    zmq::pollitem_t items[] = {
        {xsub_.handle(), 0, ZMQ_POLLIN, 0},
        {xpub_.handle(), 0, ZMQ_POLLIN, 0}
    };

    while (running_) {
        try {
            zmq::poll(items, 2, std::chrono::milliseconds(100));

            // data: publishers -> subscribers
            if (items[0].revents & ZMQ_POLLIN) {
                if (forward_message(xsub_, xpub_) > 0) ++forwarded_;
            }

            // interest: subscribers -> publishers
            if (items[1].revents & ZMQ_POLLIN) {
                forward_message(xpub_, xsub_);
            }
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) break;
            LogLine(LogLevel::Error, "Relay") << "forward failed: " << e.what();
        }
    }
}
