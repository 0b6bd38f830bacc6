#include "test_support.hpp"

#include "networking/WebSocketServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <future>
#include <thread>
#include <tuple>

namespace pairtalk::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;
using networking::ClientId;
using networking::WebSocketServer;
using namespace std::chrono_literals;

// Server on 127.0.0.1 with an ephemeral port, its io_context on a
// background thread. Callbacks land in the recorder.
struct Loopback : Recorder {
    asio::io_context ioc;
    WebSocketServer server{ioc, "127.0.0.1", 0};
    std::thread runner;
    bool stopped = false;

    std::vector<ClientId> connects;
    std::vector<ClientId> disconnects;
    std::vector<std::tuple<ClientId, std::string, bool>> messages;

    Loopback() {
        server.set_on_connect([this](ClientId c) { record([&] { connects.push_back(c); }); });
        server.set_on_disconnect([this](ClientId c) { record([&] { disconnects.push_back(c); }); });
        server.set_on_message([this](ClientId c, std::string data, bool binary) {
            record([&] { messages.emplace_back(c, std::move(data), binary); });
        });
        server.start();
        runner = std::thread([this] { ioc.run(); });
    }

    ~Loopback() {
        stop();
        ioc.stop();
        runner.join();
    }

    // stop() runs on the io thread, like the signal handler in main.
    void stop() {
        if (stopped) return;
        stopped = true;
        std::promise<void> done;
        asio::post(ioc, [this, &done] {
            server.stop();
            done.set_value();
        });
        done.get_future().wait();
    }

    tcp::endpoint endpoint() const {
        return {asio::ip::make_address("127.0.0.1"), server.port()};
    }
};

// Synchronous Beast client.
struct Client {
    asio::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};

    explicit Client(const tcp::endpoint& ep) {
        ws.next_layer().connect(ep);
        ws.handshake("127.0.0.1", "/");
    }
};

// Test 1: one connect, frame kinds kept apart, one disconnect
void test_connect_frames_disconnect() {
    std::cout << "\n=== Test 1: Connect, Frames, Disconnect ===" << std::endl;

    Loopback h;
    assert(h.server.port() != 0 && "ephemeral port is reported");

    Client c(h.endpoint());
    assert(h.wait([&] { return h.connects.size() == 1; }));

    const std::string join = R"({"type":"join","room":"R1"})";
    const std::string audio("\x4f\x67\x67\x53\x00\x02", 6);
    c.ws.text(true);
    c.ws.write(asio::buffer(join));
    c.ws.binary(true);
    c.ws.write(asio::buffer(audio));
    assert(h.wait([&] { return h.messages.size() == 2; }));

    ClientId id;
    {
        std::lock_guard<std::mutex> lk(h.mu);
        id = h.connects[0];
        assert(std::get<0>(h.messages[0]) == id);
        assert(std::get<1>(h.messages[0]) == join && !std::get<2>(h.messages[0]));
        assert(std::get<1>(h.messages[1]) == audio && std::get<2>(h.messages[1]) && "binary flag set for audio");
    }

    // Outbound frames are text.
    h.server.send(id, R"({"type":"welcome"})");
    beast::flat_buffer buf;
    c.ws.read(buf);
    assert(c.ws.got_text());
    assert(beast::buffers_to_string(buf.data()) == R"({"type":"welcome"})");

    // Unknown ids are ignored.
    h.server.send(id + 100, "x");

    c.ws.close(websocket::close_code::normal);
    assert(h.wait([&] { return h.disconnects.size() == 1; }));
    std::this_thread::sleep_for(200ms);
    {
        std::lock_guard<std::mutex> lk(h.mu);
        assert(h.disconnects.size() == 1 && "disconnect reported exactly once");
        assert(h.disconnects[0] == id);
    }

    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: a frame over the size cap drops the connection
void test_oversize_frame() {
    std::cout << "\n=== Test 2: Oversize Frame ===" << std::endl;

    Loopback h;
    Client c(h.endpoint());
    assert(h.wait([&] { return h.connects.size() == 1; }));

    c.ws.auto_fragment(false);
    c.ws.binary(true);
    const std::string big(WebSocketServer::kMaxMessageBytes + 1, 'x');

    // The server may hang up mid-write; either call can report it.
    beast::error_code ec;
    c.ws.write(asio::buffer(big), ec);
    beast::flat_buffer buf;
    c.ws.read(buf, ec);
    assert(ec && "connection is closed by the server");

    assert(h.wait([&] { return h.disconnects.size() == 1; }));
    {
        std::lock_guard<std::mutex> lk(h.mu);
        assert(h.messages.empty() && "oversize frame is never delivered");
    }

    // Others are unaffected.
    Client next(h.endpoint());
    next.ws.text(true);
    next.ws.write(asio::buffer(std::string(R"({"type":"join","room":"R2"})")));
    assert(h.wait([&] { return h.messages.size() == 1; }));

    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: stop() closes handshaked and half-open connections at once
void test_stop_closes_everything() {
    std::cout << "\n=== Test 3: Stop ===" << std::endl;

    Loopback h;
    const tcp::endpoint ep = h.endpoint();
    Client c(ep);
    assert(h.wait([&] { return h.connects.size() == 1; }));

    // TCP only; never sends the upgrade request.
    asio::io_context raw_ioc;
    tcp::socket raw(raw_ioc);
    raw.connect(ep);
    std::this_thread::sleep_for(200ms);

    const auto started = std::chrono::steady_clock::now();
    h.stop();

    beast::error_code ec;
    beast::flat_buffer buf;
    c.ws.read(buf, ec);
    assert(ec == websocket::error::closed);

    char byte;
    raw.read_some(asio::buffer(&byte, 1), ec);
    assert(ec && "half-open socket is closed too");
    assert(std::chrono::steady_clock::now() - started < 5s && "no wait for the handshake timeout");

    assert(h.wait([&] { return h.disconnects.size() == 1; }));
    {
        std::lock_guard<std::mutex> lk(h.mu);
        assert(h.connects.size() == 1 && "half-open socket was never reported");
    }

    // Nobody new gets in.
    tcp::socket late(raw_ioc);
    late.connect(ep, ec);
    assert(ec);

    std::cout << "✓ Test 3 PASSED" << std::endl;
}

} // namespace pairtalk::test

int main() {
    using namespace pairtalk::test;
    banner("WebSocketServer Test Suite");

    try {
        test_connect_frames_disconnect();
        test_oversize_frame();
        test_stop_closes_everything();

        all_passed();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
