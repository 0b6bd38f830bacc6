#pragma once

#include "networking/ClientSink.h"

#include <optional>
#include <string>
#include <string_view>

namespace pairtalk::signaling {

using networking::ConnectionId;

enum class SignalKind { VideoOffer, VideoAnswer, IceCandidate };

const char* to_string(SignalKind kind) noexcept;
std::optional<SignalKind> signal_kind_from(std::string_view name) noexcept;

// Forwards negotiation messages between connections. Holds no state of its
// own: presence and delivery both come from the sink. Payloads are opaque
// serialized JSON and are passed through untouched.
class SignalingRelay {
public:
    explicit SignalingRelay(networking::ClientSink& sink);

    // Returns false when `target` is not connected; the message is dropped
    // and the sender is not told.
    bool forward(SignalKind kind,
                 const ConnectionId& sender,
                 const ConnectionId& target,
                 const std::string& payload);

private:
    networking::ClientSink& sink_;
};

} // namespace pairtalk::signaling
