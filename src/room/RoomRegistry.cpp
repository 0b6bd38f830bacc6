#include "room/RoomRegistry.h"

#include "protocol/Protocol.h"

#include <exception>
#include <iostream>

namespace pairtalk::room {

RoomRegistry::RoomRegistry(networking::ClientSink& sink, std::size_t max_members)
    : sink_(sink), max_members_(max_members) {}

JoinResult RoomRegistry::join(const std::string& room, const ConnectionId& id) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = rooms_.find(room);
    if (it != rooms_.end()) {
        if (it->second.count(id)) return JoinResult::Admitted;
        if (it->second.size() >= max_members_) return JoinResult::Full;
        it->second.insert(id);
        return JoinResult::Admitted;
    }

    if (max_members_ == 0) return JoinResult::Full;
    rooms_[room].insert(id);
    return JoinResult::Admitted;
}

void RoomRegistry::leave(const std::string& room, const ConnectionId& id) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = rooms_.find(room);
    if (it == rooms_.end()) return;

    it->second.erase(id);
    if (it->second.empty()) rooms_.erase(it);
}

std::size_t RoomRegistry::broadcast_to_room(const std::string& room,
                                            const std::string& frame,
                                            const std::optional<ConnectionId>& excluding) {
    // Deliver outside the lock; the sink may take its own.
    const std::vector<ConnectionId> targets = members(room);

    std::size_t delivered = 0;
    for (const auto& member : targets) {
        if (excluding && member == *excluding) continue;
        try {
            if (sink_.deliver(member, frame)) ++delivered;
        } catch (const std::exception& e) {
            std::cerr << "[Room " << room << "] delivery to " << member << " failed: " << e.what() << "\n";
        }
    }
    return delivered;
}

std::size_t RoomRegistry::notify_peers(const std::string& room, const ConnectionId& id, const char* event) {
    return broadcast_to_room(room, protocol::encode_peer_event(event, id), id);
}

std::vector<ConnectionId> RoomRegistry::members(const std::string& room) const {
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<ConnectionId> out;
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return out;

    out.reserve(it->second.size());
    for (const auto& id : it->second) out.push_back(id);
    return out;
}

std::size_t RoomRegistry::room_size(const std::string& room) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return 0;
    return it->second.size();
}

std::size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.size();
}

bool RoomRegistry::contains(const std::string& room) const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.find(room) != rooms_.end();
}

} // namespace pairtalk::room
