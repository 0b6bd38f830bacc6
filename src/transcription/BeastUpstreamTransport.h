#pragma once

#include "transcription/UpstreamEndpoint.h"
#include "transcription/UpstreamTransport.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <string>

namespace pairtalk::transcription {

// wss:// client on Boost.Beast. All socket work runs on the transport's own
// strand; handlers are posted to `handler_executor` so the owner sees them
// on its strand, in order.
class BeastUpstreamTransport : public UpstreamTransport,
                               public std::enable_shared_from_this<BeastUpstreamTransport> {
public:
    BeastUpstreamTransport(boost::asio::io_context& ioc,
                           boost::asio::ssl::context& ssl_ctx,
                           UpstreamEndpoint endpoint,
                           std::string authorization,
                           boost::asio::any_io_executor handler_executor);

    void connect(Handlers handlers) override;
    void send_binary(std::string frame) override;
    void close() override;

private:
    using tcp = boost::asio::ip::tcp;
    using error_code = boost::beast::error_code;

    void on_resolve(error_code ec, tcp::resolver::results_type results);
    void on_connect(error_code ec, tcp::resolver::results_type::endpoint_type);
    void on_ssl_handshake(error_code ec);
    void on_handshake(error_code ec);
    void do_read();
    void do_write();
    void do_close();
    void finish(const std::string& reason);

    void post_open();
    void post_message(std::string message);

    UpstreamEndpoint endpoint_;
    std::string authorization_;
    boost::asio::any_io_executor handler_executor_;

    tcp::resolver resolver_;
    boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;

    Handlers handlers_;
    bool open_ = false;
    bool close_requested_ = false;
    bool closing_ = false;
    bool finished_ = false;
};

} // namespace pairtalk::transcription
