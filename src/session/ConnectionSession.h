#pragma once

#include "networking/ClientSink.h"
#include "room/RoomRegistry.h"
#include "session/SessionEvents.h"
#include "signaling/SignalingRelay.h"
#include "transcription/TranscriptionLink.h"
#include "transcription/UpstreamTransport.h"

#include <boost/json/value.hpp>

#include <functional>
#include <memory>
#include <string>

namespace pairtalk::session {

using networking::ConnectionId;

enum class SessionState { Connected, Admitted, Disconnected };

const char* to_string(SessionState state) noexcept;

// Shared collaborators handed to every session. The registry and relay are
// the only cross-connection state.
struct SessionServices {
    room::RoomRegistry& rooms;
    signaling::SignalingRelay& relay;
    networking::ClientSink& sink;
    // Fresh transport per admitted connection; may return nullptr to run
    // without transcription.
    std::function<std::shared_ptr<transcription::UpstreamTransport>()> make_transport;
};

// Lifecycle of one client connection:
//
//   Connected --join/Admitted--> Admitted --disconnect--> Disconnected
//   Connected --join/Full------> Connected (client told "full")
//   Connected --disconnect-----> Disconnected
//
// Signaling and audio are only acted on in Admitted. Disconnected is
// terminal. All calls must come from one strand.
class ConnectionSession {
public:
    ConnectionSession(ConnectionId id, SessionServices& services);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    void handle(ClientEvent event);

    const ConnectionId& id() const noexcept { return id_; }
    SessionState state() const noexcept { return state_; }
    const std::string& room() const noexcept { return room_; }

    // Null until admitted; stays set (possibly Closed) afterwards.
    const transcription::TranscriptionLink* link() const noexcept { return link_.get(); }

private:
    void on_join(const JoinRequested& ev);
    void on_signal(const SignalReceived& ev);
    void on_audio(std::string frame);
    void on_disconnect();

    void open_link();
    void on_link_open();
    void on_transcript(const ConnectionId& origin, const boost::json::value& result);
    void on_link_closed(const std::string& reason);

    ConnectionId id_;
    SessionServices& services_;

    SessionState state_ = SessionState::Connected;
    std::string room_;
    std::shared_ptr<transcription::TranscriptionLink> link_;
};

} // namespace pairtalk::session
