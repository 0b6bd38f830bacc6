#pragma once

#include "networking/ClientSink.h"
#include "session/SessionEvents.h"
#include "signaling/SignalingRelay.h"

#include <boost/json/value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pairtalk::protocol {

using networking::ConnectionId;

// Message type names shared by both directions.
namespace type {
inline constexpr const char* kJoin        = "join";
inline constexpr const char* kWelcome     = "welcome";
inline constexpr const char* kFull        = "full";
inline constexpr const char* kUserJoined  = "user-joined";
inline constexpr const char* kBye         = "bye";
inline constexpr const char* kCanOpenMic  = "can-open-mic";
inline constexpr const char* kTranscript  = "transcript-result";
inline constexpr const char* kError       = "error";
} // namespace type

struct DecodeResult {
    std::optional<session::ClientEvent> event;
    std::string error;  // set when event is empty

    explicit operator bool() const noexcept { return event.has_value(); }
};

// Text frames carry one JSON object with a "type" member.
DecodeResult decode_text(std::string_view text);

// Binary frames are microphone-stream chunks.
session::ClientEvent decode_binary(std::string data);

std::string encode_welcome(const ConnectionId& self);
std::string encode_full(const std::string& room);

// user-joined / bye
std::string encode_peer_event(const char* type, const ConnectionId& peer);

std::string encode_can_open_mic();
std::string encode_transcript(const ConnectionId& sender, const boost::json::value& result);
std::string encode_signal(signaling::SignalKind kind, const ConnectionId& sender, const std::string& payload);
std::string encode_error(const std::string& text);

} // namespace pairtalk::protocol
