#include "transcription/TranscriptionLink.h"

#include <boost/json.hpp>

#include <iostream>
#include <utility>

namespace pairtalk::transcription {

namespace json = boost::json;

const char* to_string(LinkState state) noexcept {
    switch (state) {
        case LinkState::Connecting: return "connecting";
        case LinkState::Open:       return "open";
        case LinkState::Closing:    return "closing";
        case LinkState::Closed:     return "closed";
    }
    return "unknown";
}

TranscriptionLink::TranscriptionLink(ConnectionId origin,
                                     std::string room,
                                     std::shared_ptr<UpstreamTransport> transport,
                                     OnOpen on_open,
                                     OnClosed on_closed)
    : origin_(std::move(origin)),
      room_(std::move(room)),
      transport_(std::move(transport)),
      on_open_(std::move(on_open)),
      on_closed_(std::move(on_closed)) {}

std::shared_ptr<TranscriptionLink> TranscriptionLink::open(ConnectionId origin,
                                                           std::string room,
                                                           std::shared_ptr<UpstreamTransport> transport,
                                                           OnOpen on_open,
                                                           OnClosed on_closed) {
    auto link = std::make_shared<TranscriptionLink>(
        std::move(origin), std::move(room), std::move(transport), std::move(on_open), std::move(on_closed));
    link->start();
    return link;
}

void TranscriptionLink::start() {
    if (started_ || state_ != LinkState::Connecting) return;
    started_ = true;

    // The transport may outlive us; its handlers must not.
    std::weak_ptr<TranscriptionLink> weak = shared_from_this();

    UpstreamTransport::Handlers handlers;
    handlers.on_open = [weak] {
        if (auto self = weak.lock()) self->handle_open();
    };
    handlers.on_message = [weak](std::string message) {
        if (auto self = weak.lock()) self->handle_message(std::move(message));
    };
    handlers.on_closed = [weak](const std::string& reason) {
        if (auto self = weak.lock()) self->handle_closed(reason);
    };

    transport_->connect(std::move(handlers));
}

void TranscriptionLink::on_transcript_event(OnTranscript handler) {
    on_transcript_ = std::move(handler);
}

bool TranscriptionLink::send_audio(std::string frame) {
    // A zero-length frame is the end-of-stream marker upstream; only close() sends it.
    if (state_ != LinkState::Open || frame.empty()) {
        ++frames_dropped_;
        return false;
    }

    transport_->send_binary(std::move(frame));
    ++frames_forwarded_;
    return true;
}

void TranscriptionLink::close() {
    if (state_ == LinkState::Closed || state_ == LinkState::Closing) return;

    const bool was_open = state_ == LinkState::Open;
    state_ = LinkState::Closing;

    // Zero-length frame tells the service the stream is over.
    if (was_open) transport_->send_binary(std::string{});
    transport_->close();

    state_ = LinkState::Closed;
    std::cout << "[Link " << origin_ << "] closed (" << frames_forwarded_ << " frames forwarded)\n";
}

void TranscriptionLink::handle_open() {
    if (state_ != LinkState::Connecting) return;

    state_ = LinkState::Open;
    std::cout << "[Link " << origin_ << "] upstream open\n";
    if (on_open_) on_open_();
}

void TranscriptionLink::handle_message(std::string message) {
    if (state_ != LinkState::Open) return;

    json::error_code ec;
    json::value doc = json::parse(message, ec);
    if (ec) {
        ++messages_dropped_;
        std::cerr << "[Link " << origin_ << "] dropped malformed upstream message: " << ec.message() << "\n";
        return;
    }

    if (on_transcript_) on_transcript_(origin_, doc);
}

void TranscriptionLink::handle_closed(const std::string& reason) {
    // Our own close() finishes the transition itself.
    if (state_ == LinkState::Closed || state_ == LinkState::Closing) return;

    state_ = LinkState::Closed;
    std::cerr << "[Link " << origin_ << "] upstream closed: " << reason << "\n";
    if (on_closed_) on_closed_(reason);
}

} // namespace pairtalk::transcription
