#include "protocol/Protocol.h"

#include <boost/json.hpp>

#include <utility>

namespace pairtalk::protocol {

namespace json = boost::json;

namespace {

DecodeResult fail(std::string text) {
    DecodeResult r;
    r.error = std::move(text);
    return r;
}

DecodeResult ok(session::ClientEvent ev) {
    DecodeResult r;
    r.event = std::move(ev);
    return r;
}

// Non-empty string member, or nullopt.
std::optional<std::string> string_member(const json::object& obj, const char* key) {
    auto* v = obj.if_contains(key);
    if (!v || !v->is_string()) return std::nullopt;
    const auto& s = v->get_string();
    if (s.empty()) return std::nullopt;
    return std::string(s.data(), s.size());
}

std::string dump(const json::object& obj) {
    return json::serialize(obj);
}

} // namespace

DecodeResult decode_text(std::string_view text) {
    json::error_code ec;
    json::value v = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) return fail("invalid json");

    auto* obj = v.if_object();
    if (!obj) return fail("missing type");

    auto* t = obj->if_contains("type");
    if (!t || !t->is_string()) return fail("missing type");
    const auto& tname = t->get_string();
    const std::string_view name(tname.data(), tname.size());

    if (name == type::kJoin) {
        auto room = string_member(*obj, "room");
        if (!room) return fail("missing room");
        return ok(session::JoinRequested{std::move(*room)});
    }

    if (auto kind = signaling::signal_kind_from(name)) {
        auto target = string_member(*obj, "target");
        if (!target) return fail("missing target");

        // Re-serialized as-is; nothing downstream looks inside.
        std::string payload = "null";
        if (auto* p = obj->if_contains("payload")) payload = json::serialize(*p);

        return ok(session::SignalReceived{*kind, std::move(*target), std::move(payload)});
    }

    return fail("unknown type");
}

session::ClientEvent decode_binary(std::string data) {
    return session::AudioReceived{std::move(data)};
}

std::string encode_welcome(const ConnectionId& self) {
    return dump({{"type", type::kWelcome}, {"id", self}});
}

std::string encode_full(const std::string& room) {
    return dump({{"type", type::kFull}, {"room", room}});
}

std::string encode_peer_event(const char* type, const ConnectionId& peer) {
    return dump({{"type", type}, {"id", peer}});
}

std::string encode_can_open_mic() {
    json::object obj;
    obj["type"] = type::kCanOpenMic;
    return dump(obj);
}

std::string encode_transcript(const ConnectionId& sender, const json::value& result) {
    return dump({{"type", type::kTranscript}, {"id", sender}, {"result", result}});
}

std::string encode_signal(signaling::SignalKind kind, const ConnectionId& sender, const std::string& payload) {
    // payload is already serialized JSON; splice it in as the last member.
    std::string out = dump({{"type", signaling::to_string(kind)}, {"sender", sender}});
    out.pop_back();
    out.append(",\"payload\":");
    out.append(payload.empty() ? "null" : payload);
    out.push_back('}');
    return out;
}

std::string encode_error(const std::string& text) {
    return dump({{"type", type::kError}, {"text", text}});
}

} // namespace pairtalk::protocol
