#include "test_support.hpp"

#include "transcription/TranscriptionLink.h"

#include <memory>

namespace pairtalk::test {

namespace json = boost::json;
using transcription::LinkState;
using transcription::TranscriptionLink;

struct Harness {
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    int opened = 0;
    std::vector<std::string> closed_reasons;
    std::vector<std::pair<ConnectionId, json::value>> transcripts;
    std::shared_ptr<TranscriptionLink> link;

    Harness() {
        link = std::make_shared<TranscriptionLink>(
            "conn-A", "R1", transport,
            [this] { ++opened; },
            [this](const std::string& reason) { closed_reasons.push_back(reason); });
        link->on_transcript_event([this](const ConnectionId& origin, const json::value& result) {
            transcripts.emplace_back(origin, result);
        });
        link->start();
    }
};

// Test 1: nothing goes upstream before the stream is open
void test_connecting_drops_audio() {
    std::cout << "\n=== Test 1: Connecting Drops Audio ===" << std::endl;

    Harness h;
    assert(h.transport->connect_calls == 1 && "link starts connecting immediately");
    assert(h.link->state() == LinkState::Connecting);

    assert(!h.link->send_audio("F0"));
    assert(!h.link->send_audio("F1"));
    assert(h.transport->sent.empty() && "upstream must receive 0 frames while connecting");
    assert(h.link->frames_dropped() == 2);

    // Dropped frames are not replayed on open.
    h.transport->open();
    assert(h.transport->sent.empty());

    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: open is signalled exactly once
void test_open_signalled_once() {
    std::cout << "\n=== Test 2: Open Signalled Once ===" << std::endl;

    Harness h;
    assert(h.opened == 0);
    h.transport->open();
    assert(h.link->state() == LinkState::Open);
    assert(h.opened == 1);

    h.transport->open();
    assert(h.opened == 1);

    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: frames leave in arrival order
void test_audio_order() {
    std::cout << "\n=== Test 3: Audio Order ===" << std::endl;

    Harness h;
    h.transport->open();

    assert(h.link->send_audio("F1"));
    assert(h.link->send_audio("F2"));
    assert(h.link->send_audio("F3"));

    assert((h.transport->sent == std::vector<std::string>{"F1", "F2", "F3"}));
    assert(h.link->frames_forwarded() == 3);

    // An empty client frame would read as end-of-stream upstream.
    assert(!h.link->send_audio(""));
    assert(h.transport->sent.size() == 3);
    assert(h.link->frames_dropped() == 1);
    assert(h.link->state() == LinkState::Open);

    assert(h.link->send_audio("F4"));
    assert(h.transport->sent.back() == "F4");

    std::cout << "✓ Test 3 PASSED" << std::endl;
}

// Test 4: closing an open link sends end-of-stream then closes
void test_close_open_link() {
    std::cout << "\n=== Test 4: Close Open Link ===" << std::endl;

    Harness h;
    h.transport->open();
    h.link->send_audio("F1");

    h.link->close();
    assert(h.link->state() == LinkState::Closed);
    assert(h.transport->sent.size() == 2);
    assert(h.transport->sent.back().empty() && "end-of-stream is a zero-length frame");
    assert(h.transport->close_calls == 1);

    h.link->close();
    assert(h.transport->close_calls == 1 && "close is idempotent");
    assert(h.transport->sent.size() == 2);

    assert(!h.link->send_audio("late"));
    assert(h.transport->sent.size() == 2);

    // Transport confirming the close later is not reported as a failure.
    h.transport->drop("closed");
    assert(h.closed_reasons.empty());

    std::cout << "✓ Test 4 PASSED" << std::endl;
}

// Test 5: closing mid-connect aborts without end-of-stream
void test_close_while_connecting() {
    std::cout << "\n=== Test 5: Close While Connecting ===" << std::endl;

    Harness h;
    h.link->close();
    assert(h.link->state() == LinkState::Closed);
    assert(h.transport->close_calls == 1);
    assert(h.transport->sent.empty());

    // A late open must not resurrect it or tell the client to start the mic.
    h.transport->open();
    assert(h.link->state() == LinkState::Closed);
    assert(h.opened == 0);

    std::cout << "✓ Test 5 PASSED" << std::endl;
}

// Test 6: service-side close is non-fatal and gates audio
void test_upstream_closes_first() {
    std::cout << "\n=== Test 6: Upstream Closes First ===" << std::endl;

    Harness h;
    h.transport->open();
    h.link->send_audio("F1");

    h.transport->drop("read: connection reset by peer");
    assert(h.link->state() == LinkState::Closed);
    assert(h.closed_reasons.size() == 1);

    assert(!h.link->send_audio("F2"));
    assert(h.transport->sent.size() == 1);

    // Owner still tears down on disconnect; nothing more goes out.
    h.link->close();
    assert(h.transport->sent.size() == 1 && "no end-of-stream on a dead stream");

    h.transport->message(R"({"is_final":true})");
    assert(h.transcripts.empty());

    std::cout << "✓ Test 6 PASSED" << std::endl;
}

// Test 7: upstream messages are decoded and passed through with the origin
void test_transcript_passthrough() {
    std::cout << "\n=== Test 7: Transcript Passthrough ===" << std::endl;

    Harness h;
    h.transport->open();

    const std::string doc =
        R"({"channel_index":[0,1],"duration":1.02,"is_final":true,"channel":{"alternatives":[{"transcript":"Hello, Bob.","confidence":0.98}]}})";
    h.transport->message(doc);
    h.transport->message("this is not json");
    h.transport->message(R"({"is_final":false})");

    assert(h.transcripts.size() == 2 && "malformed message is dropped, not fatal");
    assert(h.transcripts[0].first == "conn-A");
    assert(h.transcripts[0].second == json::parse(doc));
    assert(h.link->messages_dropped() == 1);
    assert(h.link->state() == LinkState::Open);

    std::cout << "✓ Test 7 PASSED" << std::endl;
}

// Test 8: transport events after the link is gone are harmless
void test_events_after_destruction() {
    std::cout << "\n=== Test 8: Events After Destruction ===" << std::endl;

    auto transport = std::make_shared<ScriptedTransport>();
    int opened = 0;
    {
        auto link = TranscriptionLink::open("conn-A", "R1", transport, [&] { ++opened; });
        assert(link->room() == "R1" && link->origin() == "conn-A");
        link->close();
    }

    transport->open();
    transport->message(R"({"is_final":true})");
    transport->drop("closed");
    assert(opened == 0);

    std::cout << "✓ Test 8 PASSED" << std::endl;
}

} // namespace pairtalk::test

int main() {
    using namespace pairtalk::test;
    banner("TranscriptionLink Test Suite");

    try {
        test_connecting_drops_audio();
        test_open_signalled_once();
        test_audio_order();
        test_close_open_link();
        test_close_while_connecting();
        test_upstream_closes_first();
        test_transcript_passthrough();
        test_events_after_destruction();

        all_passed();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
