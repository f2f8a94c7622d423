#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class HttpConnection;

// Minimal HTTP/1.1 endpoint that fires the sample RFQ:
//   GET /user/waku/send-request  -> 200 {"status":"sent",...}
//                                   502 {"error":...} on TransportError
//   other targets -> 404, other methods -> 405
// Connections are served asynchronously on one io thread; a client that
// sends nothing is dropped after the read timeout.
class HttpTrigger {
public:
    // Returns the JSON body for a successful send. May throw TransportError.
    using SendHandler = std::function<std::string()>;

    static constexpr const char* kSendTarget = "/user/waku/send-request";

    HttpTrigger(std::string address, unsigned short port, SendHandler on_send,
                std::chrono::milliseconds read_timeout = std::chrono::seconds(10));
    ~HttpTrigger();

    HttpTrigger(const HttpTrigger&) = delete;
    HttpTrigger& operator=(const HttpTrigger&) = delete;

    // Binds and serves on a background thread. Throws TransportError on bind failure.
    void start();

    // Closes the listener and every open connection, then joins the io thread
    void stop();

    // Actual port (useful when constructed with port 0)
    unsigned short port() const;

private:
    void do_accept();
    void close_all();

private:
    std::string address_;
    unsigned short port_;
    SendHandler on_send_;
    std::chrono::milliseconds read_timeout_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::weak_ptr<HttpConnection>> conns_;   // io thread only
    std::thread thread_;
};
