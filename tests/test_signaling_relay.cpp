#include "test_support.hpp"

#include "signaling/SignalingRelay.h"

namespace pairtalk::test {

namespace json = boost::json;
using signaling::SignalKind;
using signaling::SignalingRelay;

// Test 1: offer reaches the addressee with the sender's id
void test_forward_offer() {
    std::cout << "\n=== Test 1: Forward Offer ===" << std::endl;

    FakeSink sink;
    sink.connected = {"conn-A", "conn-B"};
    SignalingRelay relay(sink);

    const std::string payload = R"({"type":"offer","sdp":"v=0\r\ns=-\r\nt=0 0\r\n"})";
    assert(relay.forward(SignalKind::VideoOffer, "conn-A", "conn-B", payload));

    auto got = sink.of_type("conn-B", "video-offer");
    assert(got.size() == 1);
    assert(str(got[0].at("sender")) == "conn-A");
    assert(got[0].at("payload") == json::parse(payload));
    assert(sink.messages("conn-A").empty() && "sender gets nothing back");

    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: each kind keeps its name on the way out
void test_kinds() {
    std::cout << "\n=== Test 2: Message Kinds ===" << std::endl;

    FakeSink sink;
    sink.connected = {"conn-A", "conn-B"};
    SignalingRelay relay(sink);

    relay.forward(SignalKind::VideoAnswer, "conn-B", "conn-A", R"({"type":"answer"})");
    relay.forward(SignalKind::IceCandidate, "conn-B", "conn-A", R"({"candidate":"c1"})");
    relay.forward(SignalKind::IceCandidate, "conn-B", "conn-A", R"({"candidate":"c2"})");

    auto msgs = sink.messages("conn-A");
    assert(msgs.size() == 3);
    assert(str(msgs[0].at("type")) == "video-answer");
    assert(str(msgs[1].at("type")) == "ice-candidate");
    assert(str(msgs[2].at("payload").as_object().at("candidate")) == "c2" && "order is preserved");

    assert(signaling::signal_kind_from("ice-candidate") == SignalKind::IceCandidate);
    assert(!signaling::signal_kind_from("join"));

    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: unknown target is a silent drop
void test_unknown_target() {
    std::cout << "\n=== Test 3: Unknown Target ===" << std::endl;

    FakeSink sink;
    sink.connected = {"conn-A"};
    SignalingRelay relay(sink);

    const bool delivered = relay.forward(SignalKind::VideoOffer, "conn-A", "conn-gone", R"({"type":"offer"})");
    assert(!delivered);
    assert(sink.total() == 0 && "no delivery to anyone, no error to sender");

    std::cout << "✓ Test 3 PASSED" << std::endl;
}

} // namespace pairtalk::test

int main() {
    using namespace pairtalk::test;
    banner("SignalingRelay Test Suite");

    try {
        test_forward_offer();
        test_kinds();
        test_unknown_target();

        all_passed();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
