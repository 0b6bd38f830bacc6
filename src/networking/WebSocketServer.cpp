#include "WebSocketServer.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace pairtalk::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& address, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(address), port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Each connection reports its own disconnect once the close completes.
        std::unordered_map<ClientId, std::shared_ptr<Connection>> connections;
        {
            std::lock_guard<std::mutex> lk(mu_);
            connections.swap(connections_);
        }
        for (auto& [id, c] : connections) {
            c->close();
        }
    }

    void send(ClientId client, const std::string& msg) {
        if (auto c = find(client)) c->send(msg);
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
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

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(kMaxMessageBytes);

            ws_.async_accept(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            if (ec != asio::error::operation_aborted) self->fail("accept", ec);
                            self->server_.remove_connection(self->id_);
                            return;
                        }

                        self->accepted_ = true;
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(const std::string& msg) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg] {
                    if (self->finished_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (self->finished_) return;
                    if (!self->accepted_) {
                        // Handshake still pending: drop the socket so it fails now.
                        beast::error_code ec;
                        beast::get_lowest_layer(self->ws_).socket().close(ec);
                        return;
                    }
                    self->ws_.async_close(
                        websocket::close_code::normal,
                        asio::bind_executor(
                            self->strand_,
                            [self](beast::error_code ec) {
                                if (ec && ec != asio::error::operation_aborted) {
                                    self->fail("close", ec);
                                }
                            }));
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string data = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());
                        const bool binary = self->ws_.got_binary();

                        if (self->server_.on_message_) {
                            self->server_.on_message_(self->id_, std::move(data), binary);
                        }

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
                        if (self->finished_) return;

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            // Read and write can both fail for the same socket; report once.
            if (finished_) return;
            finished_ = true;

            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("io", ec);
            }
            server_.remove_connection(id_);
            if (accepted_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[Client " << id_ << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool accepted_ = false;
        bool finished_ = false;
    };

    std::shared_ptr<Connection> find(ClientId client) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(client);
        if (it == connections_.end()) return nullptr;
        return it->second;
    }

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    std::cerr << "[accept] " << ec.message() << "\n";
                    if (!acceptor_.is_open()) return;
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto conn = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = conn;
                }

                conn->start();
                do_accept();
            });
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

WebSocketServer::WebSocketServer(asio::io_context& ioc, const std::string& address, unsigned short port)
    : impl_(new Impl(ioc, address, port)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

void WebSocketServer::send(ClientId client, const std::string& msg) { impl_->send(client, msg); }

unsigned short WebSocketServer::port() const { return impl_->port(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace pairtalk::networking
