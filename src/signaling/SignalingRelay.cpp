#include "signaling/SignalingRelay.h"

#include "protocol/Protocol.h"

#include <iostream>

namespace pairtalk::signaling {

static constexpr bool DEBUG_MODE = false;

const char* to_string(SignalKind kind) noexcept {
    switch (kind) {
        case SignalKind::VideoOffer:   return "video-offer";
        case SignalKind::VideoAnswer:  return "video-answer";
        case SignalKind::IceCandidate: return "ice-candidate";
    }
    return "unknown";
}

std::optional<SignalKind> signal_kind_from(std::string_view name) noexcept {
    if (name == "video-offer")   return SignalKind::VideoOffer;
    if (name == "video-answer")  return SignalKind::VideoAnswer;
    if (name == "ice-candidate") return SignalKind::IceCandidate;
    return std::nullopt;
}

SignalingRelay::SignalingRelay(networking::ClientSink& sink) : sink_(sink) {}

bool SignalingRelay::forward(SignalKind kind,
                             const ConnectionId& sender,
                             const ConnectionId& target,
                             const std::string& payload) {
    if (!sink_.is_connected(target)) {
        if constexpr (DEBUG_MODE) {
            std::cerr << "[Relay] drop " << to_string(kind) << " " << sender << " -> " << target
                      << ": target not connected\n";
        }
        return false;
    }

    return sink_.deliver(target, protocol::encode_signal(kind, sender, payload));
}

} // namespace pairtalk::signaling
