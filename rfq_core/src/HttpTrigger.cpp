#include "HttpTrigger.hpp"
#include "Log.hpp"
#include "RfqErrors.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;
using json      = nlohmann::json;

static http::response<http::string_body> make_response(const http::request<http::string_body>& req,
                                                       const HttpTrigger::SendHandler& on_send)
{
    http::response<http::string_body> res;
    res.version(req.version());
    res.keep_alive(false);
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");

    const std::string target(req.target());
    if (target != HttpTrigger::kSendTarget) {
        res.result(http::status::not_found);
        res.body() = json{{"error", "not found"}}.dump();
    } else if (req.method() != http::verb::get) {
        res.result(http::status::method_not_allowed);
        res.body() = json{{"error", "method not allowed"}}.dump();
    } else {
        try {
            res.body() = on_send();
            res.result(http::status::ok);
        } catch (const TransportError& e) {
            LogLine(LogLevel::Error, "Http") << "send-request failed: " << e.what();
            res.result(http::status::bad_gateway);
            res.body() = json{{"error", e.what()}}.dump();
        } catch (const std::exception& e) {
            LogLine(LogLevel::Error, "Http") << "send-request failed: " << e.what();
            res.result(http::status::internal_server_error);
            res.body() = json{{"error", e.what()}}.dump();
        }
    }
    res.prepare_payload();
    return res;
}

// One request per connection: read (bounded by the timeout), answer, shut down.
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket sock,
                   const HttpTrigger::SendHandler& on_send,
                   std::chrono::milliseconds timeout)
        : stream_(std::move(sock)), on_send_(on_send), timeout_(timeout)
    {}

    void run() {
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, req_,
            beast::bind_front_handler(&HttpConnection::on_read, shared_from_this()));
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();
    }

private:
    void on_read(beast::error_code ec, std::size_t) {
        if (ec == beast::error::timeout) {
            LogLine(LogLevel::Debug, "Http") << "idle connection dropped";
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != http::error::end_of_stream)
                LogLine(LogLevel::Warn, "Http") << "read failed: " << ec.message();
            close();
            return;
        }

        res_ = make_response(req_, on_send_);

        stream_.expires_after(timeout_);
        http::async_write(stream_, res_,
            beast::bind_front_handler(&HttpConnection::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec && ec != net::error::operation_aborted)
            LogLine(LogLevel::Warn, "Http") << "write failed: " << ec.message();

        beast::error_code sec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, sec);
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    const HttpTrigger::SendHandler& on_send_;
    std::chrono::milliseconds timeout_;
};

HttpTrigger::HttpTrigger(std::string address, unsigned short port, SendHandler on_send,
                         std::chrono::milliseconds read_timeout)
    : address_(std::move(address)),
      port_(port),
      on_send_(std::move(on_send)),
      read_timeout_(read_timeout),
      acceptor_(ioc_)
{}

HttpTrigger::~HttpTrigger() {
    stop();
}

void HttpTrigger::start() {
    try {
        const tcp::endpoint ep(net::ip::make_address(address_), port_);
        acceptor_.open(ep.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(net::socket_base::max_listen_connections);
    } catch (const beast::system_error& e) {
        throw TransportError("http bind " + address_ + ":" + std::to_string(port_) +
                             " failed: " + e.code().message());
    }

    LogLine(LogLevel::Info, "Http") << "GET http://" << address_ << ":" << port() << kSendTarget;

    do_accept();
    thread_ = std::thread([this](){ ioc_.run(); });
}

void HttpTrigger::stop() {
    if (thread_.joinable()) {
        // runs after the handler in progress, if any
        net::post(ioc_, [this]() {
            close_all();
            ioc_.stop();
        });
        thread_.join();
    } else {
        close_all();
    }
}

void HttpTrigger::close_all() {
    beast::error_code ec;
    acceptor_.close(ec);

    for (auto& weak : conns_) {
        if (auto conn = weak.lock()) conn->close();
    }
    conns_.clear();
}

unsigned short HttpTrigger::port() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? port_ : ep.port();
}

void HttpTrigger::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket sock) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            LogLine(LogLevel::Warn, "Http") << "accept failed: " << ec.message();
        } else {
            auto conn = std::make_shared<HttpConnection>(std::move(sock), on_send_, read_timeout_);

            conns_.erase(std::remove_if(conns_.begin(), conns_.end(),
                                        [](const std::weak_ptr<HttpConnection>& w) { return w.expired(); }),
                         conns_.end());
            conns_.push_back(conn);
            conn->run();
        }
        do_accept();
    });
}
