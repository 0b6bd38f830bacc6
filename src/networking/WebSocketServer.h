#pragma once

#include "networking/ClientSink.h"

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pairtalk::networking {

class WebSocketServer {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    // `binary` is true for binary frames (audio), false for text (JSON).
    using OnMessage    = std::function<void(ClientId, std::string data, bool binary)>;

    static constexpr std::size_t kMaxMessageBytes = 1024 * 1024;

    WebSocketServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting, close open connections

    // Queue a text frame for a client. Unknown clients are ignored.
    void send(ClientId client, const std::string& msg);

    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pairtalk::networking
