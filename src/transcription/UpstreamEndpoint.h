#pragma once

#include <string>

namespace pairtalk::transcription {

// Where the speech-to-text stream goes. Only the base address is
// configurable; the query is fixed so every session streams the same format.
struct UpstreamEndpoint {
    static constexpr const char* kDefaultBase = "wss://api.deepgram.com/v1/listen";
    static constexpr const char* kEncoding    = "ogg-opus";
    static constexpr unsigned    kSampleRate  = 16000;

    std::string host;
    std::string port = "443";
    std::string path = "/";

    // Path plus the fixed query string.
    std::string target() const;

    // "host:port" as sent in the Host header.
    std::string host_header() const;

    // Accepts wss://host[:port][/path]. Throws std::invalid_argument.
    static UpstreamEndpoint parse(const std::string& url);

    static std::string authorization_value(const std::string& api_key);
};

} // namespace pairtalk::transcription
