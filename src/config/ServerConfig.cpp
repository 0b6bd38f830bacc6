#include "config/ServerConfig.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace pairtalk::config {

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim_copy(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    return s.substr(start, end - start);
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

unsigned long parse_number(const char* name, const std::string& raw, unsigned long max) {
    const std::string s = trim_copy(raw);
    if (s.empty()) throw ConfigError(std::string(name) + " is empty");
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError(std::string(name) + " is not a number: " + s);
        }
    }

    unsigned long v = 0;
    try {
        v = std::stoul(s);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is out of range: " + s);
    }
    if (v > max) throw ConfigError(std::string(name) + " is out of range: " + s);
    return v;
}

} // namespace

int load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return 0;

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim_copy(line.substr(0, eq));
        std::string val = trim_copy(line.substr(eq + 1));
        if (key.empty()) continue;
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (std::getenv(key.c_str())) continue;
        if (::setenv(key.c_str(), val.c_str(), 0) == 0) ++applied;
    }
    return applied;
}

ServerConfig ServerConfig::from_env(const std::string& dotenv_path) {
    load_dotenv(dotenv_path);

    ServerConfig cfg;

    const char* key = env("DG_KEY");
    if (!key) throw ConfigError("DG_KEY must be set (environment or .env)");
    cfg.api_key = key;

    if (const char* port = env("PORT")) {
        auto v = parse_number("PORT", port, std::numeric_limits<unsigned short>::max());
        if (v == 0) throw ConfigError("PORT must be non-zero");
        cfg.port = static_cast<unsigned short>(v);
    }

    if (const char* host = env("HOST")) cfg.bind_address = host;

    if (const char* threads = env("PAIRTALK_THREADS")) {
        auto v = parse_number("PAIRTALK_THREADS", threads, 256);
        if (v == 0) throw ConfigError("PAIRTALK_THREADS must be at least 1");
        cfg.threads = static_cast<unsigned>(v);
    }

    const char* upstream = env("PAIRTALK_UPSTREAM_URL");
    try {
        cfg.upstream = transcription::UpstreamEndpoint::parse(
            upstream ? upstream : transcription::UpstreamEndpoint::kDefaultBase);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

} // namespace pairtalk::config
