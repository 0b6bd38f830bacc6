#include "transcription/UpstreamEndpoint.h"

#include <cctype>
#include <stdexcept>

namespace pairtalk::transcription {

std::string UpstreamEndpoint::target() const {
    std::string out = path.empty() ? "/" : path;
    out += (out.find('?') == std::string::npos) ? '?' : '&';
    out += "encoding=";
    out += kEncoding;
    out += "&sample_rate=" + std::to_string(kSampleRate);
    out += "&punctuate=true";
    return out;
}

std::string UpstreamEndpoint::host_header() const {
    if (port == "443") return host;
    return host + ":" + port;
}

UpstreamEndpoint UpstreamEndpoint::parse(const std::string& url) {
    static const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("upstream url must start with wss://: " + url);
    }

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);

    UpstreamEndpoint ep;
    if (slash != std::string::npos) ep.path = rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        ep.host = authority;
    } else {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
        if (ep.port.empty()) throw std::invalid_argument("empty port in upstream url: " + url);
        for (char c : ep.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("invalid port in upstream url: " + url);
            }
        }
    }

    if (ep.host.empty()) throw std::invalid_argument("missing host in upstream url: " + url);
    return ep;
}

std::string UpstreamEndpoint::authorization_value(const std::string& api_key) {
    return "Token " + api_key;
}

} // namespace pairtalk::transcription
