#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "modes/mode_config.hpp"

namespace helm {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
    std::string file;            // Optional tee target
};

struct HttpConfig {
    bool enabled = true;             // HTTP server enabled
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8080;                 // HTTP port
    int thread_pool_size = 8;        // Worker thread pool size
};

struct StateConfig {
    std::string memory_dir = "config/memory";  // Persisted mode snapshots
};

// Text-to-speech plugin shared by message hooks and speech actions
struct SpeechConfig {
    std::string type = "log";
    nlohmann::json config = nlohmann::json::object();
};

struct RuntimeConfig {
    modes::ModeSystemConfig modes;
    LoggingConfig logging;
    HttpConfig http;
    StateConfig state;
    SpeechConfig speech;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace helm
