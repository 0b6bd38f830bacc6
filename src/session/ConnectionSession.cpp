#include "session/ConnectionSession.h"

#include "protocol/Protocol.h"

#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>

namespace pairtalk::session {

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connected:    return "connected";
        case SessionState::Admitted:     return "admitted";
        case SessionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

ConnectionSession::ConnectionSession(ConnectionId id, SessionServices& services)
    : id_(std::move(id)), services_(services) {}

ConnectionSession::~ConnectionSession() {
    // Normally already Disconnected; this covers teardown of the whole hub.
    if (state_ != SessionState::Disconnected) on_disconnect();
}

void ConnectionSession::handle(ClientEvent event) {
    std::visit(
        [this](auto&& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, JoinRequested>) {
                on_join(ev);
            } else if constexpr (std::is_same_v<T, SignalReceived>) {
                on_signal(ev);
            } else if constexpr (std::is_same_v<T, AudioReceived>) {
                on_audio(std::move(ev.frame));
            } else {
                on_disconnect();
            }
        },
        event);
}

void ConnectionSession::on_join(const JoinRequested& ev) {
    if (state_ == SessionState::Disconnected) return;

    if (state_ == SessionState::Admitted) {
        services_.sink.deliver(id_, protocol::encode_error("already in room " + room_));
        return;
    }

    if (services_.rooms.join(ev.room, id_) == room::JoinResult::Full) {
        std::cout << "[Session " << id_ << "] room " << ev.room << " is full\n";
        services_.sink.deliver(id_, protocol::encode_full(ev.room));
        return;
    }

    state_ = SessionState::Admitted;
    room_ = ev.room;
    std::cout << "[Session " << id_ << "] joined " << room_
              << " (" << services_.rooms.room_size(room_) << "/" << services_.rooms.max_members() << ")\n";

    services_.rooms.notify_peers(room_, id_, protocol::type::kUserJoined);
    open_link();
}

void ConnectionSession::on_signal(const SignalReceived& ev) {
    if (state_ != SessionState::Admitted) return;
    services_.relay.forward(ev.kind, id_, ev.target, ev.payload);
}

void ConnectionSession::on_audio(std::string frame) {
    if (state_ != SessionState::Admitted || !link_) return;
    link_->send_audio(std::move(frame));
}

void ConnectionSession::on_disconnect() {
    if (state_ == SessionState::Disconnected) return;

    const bool admitted = state_ == SessionState::Admitted;
    state_ = SessionState::Disconnected;

    if (admitted) {
        services_.rooms.notify_peers(room_, id_, protocol::type::kBye);
        services_.rooms.leave(room_, id_);
        std::cout << "[Session " << id_ << "] left " << room_ << "\n";
    }
    if (link_) link_->close();
}

void ConnectionSession::open_link() {
    std::shared_ptr<transcription::UpstreamTransport> transport;
    try {
        if (services_.make_transport) transport = services_.make_transport();
    } catch (const std::exception& e) {
        std::cerr << "[Session " << id_ << "] transcription unavailable: " << e.what() << "\n";
        return;
    }
    if (!transport) return;

    // Callbacks capture this: the link is owned here and is Closed (silent)
    // before the session goes away.
    link_ = std::make_shared<transcription::TranscriptionLink>(
        id_, room_, std::move(transport),
        [this] { on_link_open(); },
        [this](const std::string& reason) { on_link_closed(reason); });
    link_->on_transcript_event(
        [this](const ConnectionId& origin, const boost::json::value& result) { on_transcript(origin, result); });
    link_->start();
}

void ConnectionSession::on_link_open() {
    services_.sink.deliver(id_, protocol::encode_can_open_mic());
}

void ConnectionSession::on_transcript(const ConnectionId& origin, const boost::json::value& result) {
    services_.rooms.broadcast_to_room(room_, protocol::encode_transcript(origin, result));
}

void ConnectionSession::on_link_closed(const std::string& reason) {
    // No retry: the room just stops getting transcripts from this speaker.
    std::cerr << "[Session " << id_ << "] transcription stopped: " << reason << "\n";
}

} // namespace pairtalk::session
