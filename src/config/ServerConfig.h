#pragma once

#include "transcription/UpstreamEndpoint.h"

#include <stdexcept>
#include <string>

namespace pairtalk::config {

// Startup configuration problem; the process must not start.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string    api_key;            // DG_KEY, required
    std::string    bind_address = "0.0.0.0";
    unsigned short port = 3000;
    unsigned       threads = 1;
    transcription::UpstreamEndpoint upstream;

    // Reads the process environment after applying `dotenv_path` if it
    // exists. Throws ConfigError.
    static ServerConfig from_env(const std::string& dotenv_path = ".env");
};

// KEY=VALUE lines, '#' comments, optional double quotes around the value.
// Variables already set in the environment win. Returns the number applied;
// a missing file applies nothing.
int load_dotenv(const std::string& path);

} // namespace pairtalk::config
