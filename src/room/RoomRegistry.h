#pragma once

#include "networking/ClientSink.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pairtalk::room {

using networking::ConnectionId;

enum class JoinResult { Admitted, Full };

// Room membership with a hard occupancy cap.
//
// A room exists only while it has members: the first admission creates the
// entry and the last leave erases it, so rooms_.size() never counts empty
// rooms. All membership changes take mu_, which makes the size check and the
// insert in join() one step even when several threads run the io_context.
class RoomRegistry {
public:
    static constexpr std::size_t kMaxMembers = 2;

    explicit RoomRegistry(networking::ClientSink& sink, std::size_t max_members = kMaxMembers);

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // No mutation on Full. Joining a room one is already in is Admitted.
    JoinResult join(const std::string& room, const ConnectionId& id);

    // Idempotent; unknown room or member is a no-op.
    void leave(const std::string& room, const ConnectionId& id);

    // Deliver a ready-encoded frame to every member except `excluding`.
    // Returns the number of members the frame was handed to.
    std::size_t broadcast_to_room(const std::string& room,
                                  const std::string& frame,
                                  const std::optional<ConnectionId>& excluding = std::nullopt);

    // Tell the other members that `id` joined or left (`event` is the type name).
    std::size_t notify_peers(const std::string& room, const ConnectionId& id, const char* event);

    std::vector<ConnectionId> members(const std::string& room) const;
    std::size_t room_size(const std::string& room) const;
    std::size_t room_count() const;
    bool contains(const std::string& room) const;

    std::size_t max_members() const noexcept { return max_members_; }

private:
    networking::ClientSink& sink_;
    const std::size_t max_members_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::unordered_set<ConnectionId>> rooms_;
};

} // namespace pairtalk::room
