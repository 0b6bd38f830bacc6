#include "config/ServerConfig.h"
#include "networking/WebSocketServer.h"
#include "session/SessionHub.h"
#include "transcription/BeastUpstreamTransport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace asio = boost::asio;

int main() {
    using namespace pairtalk;

    config::ServerConfig cfg;
    try {
        cfg = config::ServerConfig::from_env();
    } catch (const config::ConfigError& e) {
        std::cerr << "[PairTalk] configuration error: " << e.what() << "\n";
        return 1;
    }

    asio::io_context ioc(static_cast<int>(cfg.threads));

    asio::ssl::context ssl_ctx(asio::ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(asio::ssl::verify_peer);

    const std::string authorization = transcription::UpstreamEndpoint::authorization_value(cfg.api_key);

    std::unique_ptr<networking::WebSocketServer> server;
    try {
        server = std::make_unique<networking::WebSocketServer>(ioc, cfg.bind_address, cfg.port);
    } catch (const std::exception& e) {
        std::cerr << "[PairTalk] cannot listen on " << cfg.bind_address << ":" << cfg.port << ": " << e.what() << "\n";
        return 1;
    }

    session::SessionHub hub(
        ioc,
        [&server](networking::ClientId client, const std::string& frame) { server->send(client, frame); },
        [&](asio::any_io_executor handler_executor) -> std::shared_ptr<transcription::UpstreamTransport> {
            return std::make_shared<transcription::BeastUpstreamTransport>(
                ioc, ssl_ctx, cfg.upstream, authorization, std::move(handler_executor));
        });

    server->set_on_connect([&hub](networking::ClientId client) { hub.on_connect(client); });
    server->set_on_disconnect([&hub](networking::ClientId client) { hub.on_disconnect(client); });
    server->set_on_message([&hub](networking::ClientId client, std::string data, bool binary) {
        hub.on_message(client, std::move(data), binary);
    });

    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "\n[PairTalk] shutting down...\n";
        server->stop();
        ioc.stop();
    });

    std::cout << "[PairTalk] WS server running on " << cfg.bind_address << ":" << server->port()
              << " (" << cfg.threads << " thread" << (cfg.threads == 1 ? "" : "s") << ")\n";
    std::cout << "[PairTalk] upstream " << cfg.upstream.host_header() << cfg.upstream.target() << "\n";

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < cfg.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    std::cout << "[PairTalk] exit.\n";
    return 0;
}
