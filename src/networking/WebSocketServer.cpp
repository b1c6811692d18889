#include "networking/WebSocketServer.h"

#include "collab/Errors.h"
#include "util/Log.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace coedit::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using util::Log;

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& address, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(address), port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<Connection>> open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [id, c] : connections_) open.push_back(c);
            connections_.clear();
        }
        for (auto& c : open) c->close(websocket::close_code::going_away, "server shutdown");
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void send(ClientId client, const std::string& frame) {
        auto c = find(client);
        if (!c) throw collab::TransportError("connection " + std::to_string(client) + " is gone");
        c->send(frame);
    }

    void close(ClientId client, std::uint16_t code, const std::string& reason) {
        if (auto c = find(client)) c->close(code, reason);
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        ClientId id() const { return id_; }

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

            // Read the upgrade request ourselves so the query string survives.
            http::async_read(
                ws_.next_layer(), buffer_, request_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->abandon("handshake", ec);
                        if (!websocket::is_upgrade(self->request_)) {
                            return self->abandon("handshake", websocket::error::no_connection_upgrade);
                        }
                        self->do_accept();
                    }));
        }

        void send(const std::string& frame) {
            asio::post(
                strand_,
                [self = shared_from_this(), frame] {
                    if (self->closing_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(frame);
                    if (!writing) self->do_write();
                });
        }

        // Pending frames are flushed before the close frame goes out.
        void close(std::uint16_t code, const std::string& reason) {
            asio::post(
                strand_,
                [self = shared_from_this(), code, reason] {
                    if (self->closing_) return;
                    self->closing_ = true;
                    self->close_reason_ = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
                    if (self->write_queue_.empty()) self->do_close();
                });
        }

    private:
        void do_accept() {
            ws_.async_accept(
                request_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) return self->abandon("accept", ec);

                        self->connected_ = true;
                        const auto raw_target = self->request_.target();
                        std::string target(raw_target.data(), raw_target.size());
                        self->request_ = {};
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_, target);
                        self->do_read();
                    }));
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) {
                            self->do_write();
                        } else if (self->closing_) {
                            self->do_close();
                        }
                    }));
        }

        void do_close() {
            if (close_sent_) return;
            close_sent_ = true;
            ws_.async_close(
                close_reason_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) self->fail("close", ec);
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            if (disconnected_) return;
            disconnected_ = true;
            // A close frame from either side is the ordinary way out.
            if (ec != websocket::error::closed) fail("io", ec);
            server_.remove_connection(id_);
            if (connected_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        // Never reached on_connect, so there is nobody to tell.
        void abandon(const char* what, beast::error_code ec) {
            fail(what, ec);
            server_.remove_connection(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            Log::warn("Connection " + std::to_string(id_), what, ": ", ec.message());
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        std::deque<std::string> write_queue_;

        websocket::close_reason close_reason_;
        bool connected_ = false;
        bool closing_ = false;
        bool close_sent_ = false;
        bool disconnected_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // Acceptor closed during shutdown.
                    if (ec == asio::error::operation_aborted) return;
                    Log::warn("accept", ec.message());
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto connection = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = connection;
                }

                connection->start();
                do_accept();
            });
    }

    std::shared_ptr<Connection> find(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(id);
        return it == connections_.end() ? nullptr : it->second;
    }

    void remove_connection(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Connection>> connections_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const std::string& address, unsigned short port)
    : impl_(new Impl(ioc, address, port)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }

void WebSocketServer::send(ClientId client, const std::string& frame) { impl_->send(client, frame); }

void WebSocketServer::close(ClientId client, std::uint16_t code, const std::string& reason) {
    impl_->close(client, code, reason);
}

WebSocketServer::~WebSocketServer() = default;

} // namespace coedit::networking
