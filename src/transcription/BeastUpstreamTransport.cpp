#include "transcription/BeastUpstreamTransport.h"

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/http.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <iostream>

namespace pairtalk::transcription {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;

BeastUpstreamTransport::BeastUpstreamTransport(asio::io_context& ioc,
                                               ssl::context& ssl_ctx,
                                               UpstreamEndpoint endpoint,
                                               std::string authorization,
                                               asio::any_io_executor handler_executor)
    : endpoint_(std::move(endpoint)),
      authorization_(std::move(authorization)),
      handler_executor_(std::move(handler_executor)),
      resolver_(asio::make_strand(ioc)),
      ws_(resolver_.get_executor(), ssl_ctx) {}

void BeastUpstreamTransport::connect(Handlers handlers) {
    asio::post(
        ws_.get_executor(),
        [self = shared_from_this(), h = std::move(handlers)]() mutable {
            self->handlers_ = std::move(h);
            if (self->close_requested_) return self->finish("closed before connect");

            self->resolver_.async_resolve(
                self->endpoint_.host,
                self->endpoint_.port,
                beast::bind_front_handler(&BeastUpstreamTransport::on_resolve, self));
        });
}

void BeastUpstreamTransport::send_binary(std::string frame) {
    asio::post(
        ws_.get_executor(),
        [self = shared_from_this(), frame = std::move(frame)]() mutable {
            if (!self->open_ || self->close_requested_ || self->finished_) return;
            bool writing = !self->write_queue_.empty();
            self->write_queue_.push_back(std::move(frame));
            if (!writing) self->do_write();
        });
}

void BeastUpstreamTransport::close() {
    asio::post(
        ws_.get_executor(),
        [self = shared_from_this()] {
            if (self->finished_ || self->close_requested_) return;
            self->close_requested_ = true;

            if (!self->open_) {
                // Still connecting: abort whatever step is in flight. Its
                // completion handler reports operation_aborted and finishes.
                self->resolver_.cancel();
                beast::get_lowest_layer(self->ws_).cancel();
                return;
            }
            if (self->write_queue_.empty()) self->do_close();
        });
}

void BeastUpstreamTransport::on_resolve(error_code ec, tcp::resolver::results_type results) {
    if (ec) return finish("resolve: " + ec.message());
    if (close_requested_) return finish("closed before connect");

    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(
        results,
        beast::bind_front_handler(&BeastUpstreamTransport::on_connect, shared_from_this()));
}

void BeastUpstreamTransport::on_connect(error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return finish("connect: " + ec.message());
    if (close_requested_) return finish("closed before connect");

    // SNI; most TLS front ends refuse the handshake without it.
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str())) {
        error_code sni(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        return finish("sni: " + sni.message());
    }

    ws_.next_layer().async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&BeastUpstreamTransport::on_ssl_handshake, shared_from_this()));
}

void BeastUpstreamTransport::on_ssl_handshake(error_code ec) {
    if (ec) return finish("tls: " + ec.message());
    if (close_requested_) return finish("closed before connect");

    // The websocket stream has its own timeouts.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator(
        [auth = authorization_](websocket::request_type& req) {
            req.set(http::field::authorization, auth);
            req.set(http::field::user_agent, "pairtalk");
        }));

    ws_.async_handshake(
        endpoint_.host_header(),
        endpoint_.target(),
        beast::bind_front_handler(&BeastUpstreamTransport::on_handshake, shared_from_this()));
}

void BeastUpstreamTransport::on_handshake(error_code ec) {
    if (ec) return finish("handshake: " + ec.message());

    open_ = true;
    if (close_requested_) return do_close();

    post_open();
    do_read();
}

void BeastUpstreamTransport::do_read() {
    ws_.async_read(
        buffer_,
        [self = shared_from_this()](error_code ec, std::size_t) {
            if (ec) {
                if (ec == websocket::error::closed) return self->finish("closed by upstream");
                return self->finish("read: " + ec.message());
            }

            std::string msg = beast::buffers_to_string(self->buffer_.data());
            self->buffer_.consume(self->buffer_.size());
            self->post_message(std::move(msg));
            self->do_read();
        });
}

void BeastUpstreamTransport::do_write() {
    ws_.binary(true);
    ws_.async_write(
        asio::buffer(write_queue_.front()),
        [self = shared_from_this()](error_code ec, std::size_t) {
            if (ec) return self->finish("write: " + ec.message());
            if (self->finished_) return;

            self->write_queue_.pop_front();
            if (!self->write_queue_.empty()) return self->do_write();
            if (self->close_requested_) self->do_close();
        });
}

void BeastUpstreamTransport::do_close() {
    if (closing_ || finished_) return;
    closing_ = true;

    ws_.async_close(
        websocket::close_code::normal,
        [self = shared_from_this()](error_code ec) {
            if (ec && ec != asio::error::operation_aborted && ec != ssl::error::stream_truncated) {
                std::cerr << "[Upstream " << self->endpoint_.host << "] close: " << ec.message() << "\n";
            }
            self->finish("closed");
        });
}

void BeastUpstreamTransport::finish(const std::string& reason) {
    if (finished_) return;
    finished_ = true;
    open_ = false;

    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);

    if (handlers_.on_closed) {
        asio::post(handler_executor_, [h = handlers_.on_closed, reason] { h(reason); });
    }
}

void BeastUpstreamTransport::post_open() {
    if (handlers_.on_open) asio::post(handler_executor_, handlers_.on_open);
}

void BeastUpstreamTransport::post_message(std::string message) {
    if (!handlers_.on_message) return;
    asio::post(handler_executor_, [h = handlers_.on_message, m = std::move(message)]() mutable {
        h(std::move(m));
    });
}

} // namespace pairtalk::transcription
