#include "server/ws_server.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

namespace {

std::atomic<ConnectionId> g_conn_seq{1};

// One accepted stream client. All socket work happens on the session's
// strand; send() and close() may be called from any thread.
class WsSession final : public IConnection, public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, http::request<http::string_body> req, StreamTarget target,
              ConnectionGateway& gw, net::thread_pool& blocking, std::size_t queue_limit)
        : ws_(std::move(socket)), req_(std::move(req)), target_(std::move(target)),
          id_(g_conn_seq.fetch_add(1)), gw_(gw), blocking_(blocking), queue_limit_(queue_limit) {}

    ConnectionId id() const override { return id_; }
    const Principal& principal() const override { return principal_; }
    TopicId topic() const override { return target_.topic; }
    bool alive() const override { return alive_.load(); }

    void run() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "watchlist-stream/0.1");
        }));
        auto self = shared_from_this();
        ws_.async_accept(req_, [self](beast::error_code ec) { self->on_accept(ec); });
    }

    bool send(const std::string& text) override {
        if (!alive_.load()) return false;
        if (queued_.fetch_add(1) >= queue_limit_) {
            queued_.fetch_sub(1);
            return false;
        }
        auto self = shared_from_this();
        auto msg = std::make_shared<const std::string>(text);
        net::post(ws_.get_executor(), [self, msg] {
            if (self->close_pending_) {
                self->queued_.fetch_sub(1);
                return;
            }
            self->queue_.push_back(msg);
            if (!self->writing_) self->do_write();
        });
        return true;
    }

    void close(int code, const std::string& reason) override {
        alive_.store(false);
        auto self = shared_from_this();
        net::post(ws_.get_executor(), [self, code, reason] {
            if (self->close_pending_) return;
            self->close_pending_ = true;
            self->close_reason_ = websocket::close_reason(
                static_cast<websocket::close_code>(code), reason);
            // Beast allows one outstanding write; close after the queue drains
            if (!self->writing_) self->do_close();
        });
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cerr << "[server] websocket accept: " << ec.message() << std::endl;
            return;
        }
        auto self = shared_from_this();
        net::post(blocking_, [self] {
            AdmitResult r;
            try {
                r = self->gw_.admit(self->target_);
            } catch (const std::exception& e) {
                std::cerr << "[server] admission failed: " << e.what() << std::endl;
                r = Rejection{close_code::internal_error, "Internal server error"};
            }
            if (auto* rej = std::get_if<Rejection>(&r)) {
                std::cout << "[gateway] rejected watchlist " << self->target_.topic << ": "
                          << rej->reason << std::endl;
                self->close(rej->code, rej->reason);
                return;
            }
            auto& adm = std::get<Admission>(r);
            self->principal_ = adm.principal;
            self->alive_.store(true);
            if (!self->gw_.open(self, adm.initial_frame)) return;
            // Reading starts only after open(), so on_close always follows it
            net::post(self->ws_.get_executor(), [self] { self->do_read(); });
        });
    }

    void do_read() {
        auto self = shared_from_this();
        ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
            if (ec) return self->on_disconnect(ec);
            if (self->ws_.got_text()) {
                const std::string text = beast::buffers_to_string(self->buffer_.data());
                self->gw_.on_frame(self, text);
            }
            self->buffer_.consume(self->buffer_.size());
            self->do_read();
        });
    }

    void do_write() {
        if (queue_.empty()) {
            writing_ = false;
            if (close_pending_) do_close();
            return;
        }
        writing_ = true;
        ws_.text(true);
        auto self = shared_from_this();
        ws_.async_write(net::buffer(*queue_.front()), [self](beast::error_code ec, std::size_t) {
            self->queue_.pop_front();
            self->queued_.fetch_sub(1);
            if (ec) {
                self->writing_ = false;
                return self->fail("write", ec);
            }
            self->do_write();
        });
    }

    void do_close() {
        if (close_started_) return;
        close_started_ = true;
        auto self = shared_from_this();
        ws_.async_close(close_reason_, [self](beast::error_code ec) {
            if (ec && ec != net::error::operation_aborted) {
                self->fail("close", ec);
            }
        });
    }

    void fail(const char* what, beast::error_code ec) {
        alive_.store(false);
        std::cerr << "[server] connection " << id_ << " " << what << ": " << ec.message() << std::endl;
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

    void on_disconnect(beast::error_code ec) {
        alive_.store(false);
        if (ec != websocket::error::closed && ec != net::error::operation_aborted &&
            ec != beast::error::timeout) {
            std::cerr << "[server] connection " << id_ << " read: " << ec.message() << std::endl;
        }
        if (disconnected_) return;
        disconnected_ = true;
        auto self = shared_from_this();
        net::post(blocking_, [self] { self->gw_.on_close(self); });
    }

    websocket::stream<beast::tcp_stream> ws_;
    http::request<http::string_body> req_;
    StreamTarget target_;
    const ConnectionId id_;
    Principal principal_;
    ConnectionGateway& gw_;
    net::thread_pool& blocking_;
    const std::size_t queue_limit_;

    beast::flat_buffer buffer_;
    std::atomic<bool> alive_{false};
    std::atomic<std::size_t> queued_{0};

    // strand-only state
    std::deque<std::shared_ptr<const std::string>> queue_;
    bool writing_{false};
    bool close_pending_{false};
    bool close_started_{false};
    bool disconnected_{false};
    websocket::close_reason close_reason_;
};

// Plain HTTP request/response, or hand-off to WsSession on upgrade.
struct HttpSession : public std::enable_shared_from_this<HttpSession> {
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    ConnectionGateway& gw_;
    StreamServer::HandlerFn& handler_;
    net::thread_pool& blocking_;
    std::size_t queue_limit_;
    http::request<http::string_body> req_;

    HttpSession(tcp::socket s, ConnectionGateway& gw, StreamServer::HandlerFn& h,
                net::thread_pool& blocking, std::size_t queue_limit)
        : socket_(std::move(s)), gw_(gw), handler_(h), blocking_(blocking), queue_limit_(queue_limit) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        http::async_read(socket_, buffer_, req_,
            [self](beast::error_code ec, std::size_t) {
                if (ec == http::error::end_of_stream) return self->do_close();
                if (ec) return;
                self->on_request();
            });
    }

    void on_request() {
        if (websocket::is_upgrade(req_)) {
            std::string_view target{req_.target().data(), req_.target().size()};
            if (auto st = ConnectionGateway::parse_target(target)) {
                std::make_shared<WsSession>(std::move(socket_), std::move(req_), std::move(*st),
                                            gw_, blocking_, queue_limit_)->run();
                return;
            }
        }

        auto self = shared_from_this();
        auto res = std::make_shared<http::response<http::string_body>>();
        res->version(req_.version());
        res->keep_alive(false);
        handler_(req_, *res);
        // CORS
        res->set(http::field::access_control_allow_origin, "*");
        res->set(http::field::access_control_allow_headers, "*");
        res->set(http::field::access_control_allow_methods, "GET, OPTIONS");
        if (req_.method() == http::verb::options) {
            res->result(http::status::ok);
            res->set(http::field::content_type, "text/plain");
            res->body() = "";
        }
        res->prepare_payload();
        http::async_write(socket_, *res,
            [self, res](beast::error_code, std::size_t) { self->do_close(); });
    }

    void do_close() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

StreamServer::StreamServer(net::io_context& ioc, tcp::endpoint ep, ConnectionGateway& gateway,
                           HandlerFn http_handler, Options opts)
    : ioc_(ioc), acceptor_(ioc), gateway_(gateway), handler_(std::move(http_handler)),
      opts_(opts), blocking_(opts.blocking_threads) {
    beast::error_code ec;
    acceptor_.open(ep.protocol(), ec);
    if (ec) throw std::runtime_error("open: " + ec.message());
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("set_option: " + ec.message());
    acceptor_.bind(ep, ec);
    if (ec) throw std::runtime_error("bind: " + ec.message());
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("listen: " + ec.message());
}

StreamServer::~StreamServer() {
    stop();
}

void StreamServer::run() { do_accept(); }

void StreamServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    blocking_.join();
}

unsigned short StreamServer::port() const {
    beast::error_code ec;
    return acceptor_.local_endpoint(ec).port();
}

void StreamServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket s) {
            if (ec == net::error::operation_aborted) return;
            if (!ec) {
                std::make_shared<HttpSession>(std::move(s), gateway_, handler_, blocking_,
                                              opts_.send_queue_limit)->run();
            }
            do_accept();
        });
}
