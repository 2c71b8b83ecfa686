#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <functional>
#include <string>

#include "stream/connection_gateway.hpp"

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// HTTP + WebSocket listener. Upgrade requests on the stream path become
// gateway sessions; every other request goes to the plain HTTP handler.
// Gateway calls that may block (admission, unsubscribe) run on a small
// thread pool so they never stall socket I/O.
class StreamServer {
public:
    using HandlerFn = std::function<void(const http::request<http::string_body>&,
                                         http::response<http::string_body>&)>;

    struct Options {
        std::size_t send_queue_limit = 64;  // frames queued per connection
        std::size_t blocking_threads = 4;
    };

    StreamServer(boost::asio::io_context& ioc, tcp::endpoint ep,
                 ConnectionGateway& gateway, HandlerFn http_handler, Options opts);
    ~StreamServer();

    void run();
    // Stops accepting and waits for queued gateway work.
    void stop();

    unsigned short port() const;

private:
    void do_accept();

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    ConnectionGateway& gateway_;
    HandlerFn handler_;
    Options opts_;
    boost::asio::thread_pool blocking_;
};
