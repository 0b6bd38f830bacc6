#pragma once

#include <cstdint>
#include <string>

namespace pairtalk::networking {

using ClientId = std::uint64_t;

// Server-assigned identifier exposed to clients ("conn-<ulid>").
using ConnectionId = std::string;

// Outbound side of the client channel, addressed by connection identifier.
class ClientSink {
public:
    virtual ~ClientSink() = default;

    // Queue one text frame for a connection. Returns false when the
    // connection is unknown; the frame is dropped in that case.
    virtual bool deliver(const ConnectionId& id, const std::string& frame) = 0;

    virtual bool is_connected(const ConnectionId& id) const = 0;
};

} // namespace pairtalk::networking
