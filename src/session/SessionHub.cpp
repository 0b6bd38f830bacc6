#include "session/SessionHub.h"

#include "protocol/Protocol.h"

#include <boost/asio/post.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace pairtalk::session {

namespace asio = boost::asio;

SessionHub::SessionHub(asio::io_context& ioc, SendFn send, TransportFactory make_transport)
    : strand_(asio::make_strand(ioc)),
      send_(std::move(send)),
      make_transport_(std::move(make_transport)),
      rooms_(*this),
      relay_(*this),
      services_{rooms_, relay_, *this, {}} {
    if (make_transport_) {
        services_.make_transport = [this] { return make_transport_(strand_); };
    }
}

SessionHub::~SessionHub() {
    // Leave rooms while ids_ still resolves peers for the bye messages.
    for (auto& [client, session] : sessions_) session->handle(Disconnected{});
    sessions_.clear();
}

void SessionHub::on_connect(ClientId client) {
    asio::post(strand_, [this, client] { do_connect(client); });
}

void SessionHub::on_disconnect(ClientId client) {
    asio::post(strand_, [this, client] { do_disconnect(client); });
}

void SessionHub::on_message(ClientId client, std::string data, bool binary) {
    asio::post(strand_, [this, client, data = std::move(data), binary]() mutable {
        do_message(client, std::move(data), binary);
    });
}

bool SessionHub::deliver(const ConnectionId& id, const std::string& frame) {
    auto it = ids_.find(id);
    if (it == ids_.end()) return false;
    send_(it->second, frame);
    return true;
}

bool SessionHub::is_connected(const ConnectionId& id) const {
    return ids_.find(id) != ids_.end();
}

std::optional<ConnectionId> SessionHub::connection_id(ClientId client) const {
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return std::nullopt;
    return it->second->id();
}

const ConnectionSession* SessionHub::find(const ConnectionId& id) const {
    auto it = ids_.find(id);
    if (it == ids_.end()) return nullptr;
    auto sit = sessions_.find(it->second);
    return sit == sessions_.end() ? nullptr : sit->second.get();
}

void SessionHub::do_connect(ClientId client) {
    if (sessions_.count(client)) return;

    ConnectionId id = idgen_.next();
    ids_.emplace(id, client);
    sessions_.emplace(client, std::make_unique<ConnectionSession>(id, services_));

    std::cout << "[Hub] " << id << " connected (client " << client << ")\n";
    send_(client, protocol::encode_welcome(id));
}

void SessionHub::do_disconnect(ClientId client) {
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return;

    dispatch(client, Disconnected{});

    const ConnectionId id = it->second->id();
    sessions_.erase(it);
    ids_.erase(id);
    std::cout << "[Hub] " << id << " disconnected\n";
}

void SessionHub::do_message(ClientId client, std::string data, bool binary) {
    if (!sessions_.count(client)) return;

    if (binary) return dispatch(client, protocol::decode_binary(std::move(data)));

    auto decoded = protocol::decode_text(data);
    if (!decoded) {
        send_(client, protocol::encode_error(decoded.error));
        return;
    }
    dispatch(client, std::move(*decoded.event));
}

void SessionHub::dispatch(ClientId client, ClientEvent event) {
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return;

    // One connection's failure stays with that connection.
    try {
        it->second->handle(std::move(event));
    } catch (const std::exception& e) {
        std::cerr << "[Hub] " << it->second->id() << ": " << e.what() << "\n";
    }
}

} // namespace pairtalk::session
