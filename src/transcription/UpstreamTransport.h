#pragma once

#include <functional>
#include <string>

namespace pairtalk::transcription {

// One outbound streaming socket. Implementations deliver handlers in the
// order events happen and never run two handlers concurrently.
class UpstreamTransport {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(std::string message)> on_message;
        std::function<void(const std::string& reason)> on_closed;  // at most once
    };

    virtual ~UpstreamTransport() = default;

    virtual void connect(Handlers handlers) = 0;

    // Frames leave in submission order. Ignored once closed.
    virtual void send_binary(std::string frame) = 0;

    // Graceful close after queued frames; aborts an attempt still in progress.
    virtual void close() = 0;
};

} // namespace pairtalk::transcription
