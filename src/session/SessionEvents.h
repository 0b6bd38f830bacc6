#pragma once

#include "networking/ClientSink.h"
#include "signaling/SignalingRelay.h"

#include <string>
#include <variant>

namespace pairtalk::session {

// Inbound events for one connection, in arrival order.
struct JoinRequested {
    std::string room;
};

struct SignalReceived {
    signaling::SignalKind kind;
    networking::ConnectionId target;
    std::string payload;  // serialized JSON, never inspected
};

struct AudioReceived {
    std::string frame;
};

struct Disconnected {};

using ClientEvent = std::variant<JoinRequested, SignalReceived, AudioReceived, Disconnected>;

} // namespace pairtalk::session
