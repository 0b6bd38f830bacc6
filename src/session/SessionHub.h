#pragma once

#include "networking/ClientSink.h"
#include "room/RoomRegistry.h"
#include "session/ConnectionSession.h"
#include "session/IDGenerator.hpp"
#include "signaling/SignalingRelay.h"
#include "transcription/UpstreamTransport.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pairtalk::session {

using networking::ClientId;

// Owns every ConnectionSession and serializes all of their work.
//
// Transport callbacks (WebSocket server and upstream links) arrive on
// arbitrary threads and are posted onto strand_, which acts as the inbound
// queue for every connection: events for one connection are handled one at
// a time and in arrival order, and sessions_/ids_ are only touched there.
class SessionHub : public networking::ClientSink {
public:
    using SendFn = std::function<void(ClientId, const std::string&)>;
    // Handlers of the returned transport must be posted to the executor given.
    using TransportFactory =
        std::function<std::shared_ptr<transcription::UpstreamTransport>(boost::asio::any_io_executor)>;

    SessionHub(boost::asio::io_context& ioc, SendFn send, TransportFactory make_transport);
    ~SessionHub() override;

    SessionHub(const SessionHub&) = delete;
    SessionHub& operator=(const SessionHub&) = delete;

    // Entry points for the WebSocket server; callable from any thread.
    void on_connect(ClientId client);
    void on_disconnect(ClientId client);
    void on_message(ClientId client, std::string data, bool binary);

    // ClientSink; strand only.
    bool deliver(const ConnectionId& id, const std::string& frame) override;
    bool is_connected(const ConnectionId& id) const override;

    // Inspection; strand only (or with the io_context stopped).
    std::optional<ConnectionId> connection_id(ClientId client) const;
    const ConnectionSession* find(const ConnectionId& id) const;
    std::size_t session_count() const noexcept { return sessions_.size(); }
    const room::RoomRegistry& rooms() const noexcept { return rooms_; }

private:
    void do_connect(ClientId client);
    void do_disconnect(ClientId client);
    void do_message(ClientId client, std::string data, bool binary);
    void dispatch(ClientId client, ClientEvent event);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    SendFn send_;
    TransportFactory make_transport_;
    IDGenerator idgen_;

    room::RoomRegistry rooms_;
    signaling::SignalingRelay relay_;
    SessionServices services_;

    // Declared last: sessions leave their rooms on destruction.
    std::unordered_map<ConnectionId, ClientId> ids_;
    std::unordered_map<ClientId, std::unique_ptr<ConnectionSession>> sessions_;
};

} // namespace pairtalk::session
