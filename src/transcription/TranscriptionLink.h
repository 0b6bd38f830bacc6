#pragma once

#include "networking/ClientSink.h"
#include "transcription/UpstreamTransport.h"

#include <boost/json/value.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pairtalk::transcription {

using networking::ConnectionId;

enum class LinkState { Connecting, Open, Closing, Closed };

const char* to_string(LinkState state) noexcept;

// One speech-to-text stream for one connection.
//
// Audio is forwarded only in Open. Nothing is buffered while Connecting:
// the client is told to start capturing only once the stream is Open,
// because its first chunk carries the codec header.
//
// Not thread-safe; the owner calls it and receives its callbacks on one
// strand. No callback fires once the link is Closed.
class TranscriptionLink : public std::enable_shared_from_this<TranscriptionLink> {
public:
    using OnOpen       = std::function<void()>;
    using OnTranscript = std::function<void(const ConnectionId& origin, const boost::json::value& result)>;
    using OnClosed     = std::function<void(const std::string& reason)>;

    TranscriptionLink(ConnectionId origin,
                      std::string room,
                      std::shared_ptr<UpstreamTransport> transport,
                      OnOpen on_open,
                      OnClosed on_closed = {});

    TranscriptionLink(const TranscriptionLink&) = delete;
    TranscriptionLink& operator=(const TranscriptionLink&) = delete;

    // Construct and start connecting in one step.
    static std::shared_ptr<TranscriptionLink> open(ConnectionId origin,
                                                   std::string room,
                                                   std::shared_ptr<UpstreamTransport> transport,
                                                   OnOpen on_open,
                                                   OnClosed on_closed = {});

    void start();

    // Called once per upstream message with the decoded JSON document.
    void on_transcript_event(OnTranscript handler);

    // True when forwarded; false when dropped because the link is not Open
    // or the frame is empty.
    bool send_audio(std::string frame);

    // Sends the end-of-stream marker if Open, then closes. Idempotent.
    void close();

    LinkState state() const noexcept { return state_; }
    const ConnectionId& origin() const noexcept { return origin_; }
    const std::string& room() const noexcept { return room_; }

    std::size_t frames_forwarded() const noexcept { return frames_forwarded_; }
    std::size_t frames_dropped() const noexcept { return frames_dropped_; }
    std::size_t messages_dropped() const noexcept { return messages_dropped_; }

private:
    void handle_open();
    void handle_message(std::string message);
    void handle_closed(const std::string& reason);

    ConnectionId origin_;
    std::string room_;
    std::shared_ptr<UpstreamTransport> transport_;

    OnOpen on_open_;
    OnClosed on_closed_;
    OnTranscript on_transcript_;

    LinkState state_ = LinkState::Connecting;
    bool started_ = false;

    std::size_t frames_forwarded_ = 0;
    std::size_t frames_dropped_ = 0;
    std::size_t messages_dropped_ = 0;
};

} // namespace pairtalk::transcription
