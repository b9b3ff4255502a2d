#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <vector>

#include "../logging/logger.hpp"

namespace helm {
namespace runtime {

namespace {

// Keys read by parse_mode_system or by load_config itself
const std::vector<std::string> kValidTopLevelKeys = {
    "name",       "default_mode",        "allow_manual_switching", "mode_memory_enabled",
    "api_key",    "robot_ip",            "URID",                   "system_governance",
    "system_prompt_examples", "cortex_llm", "global_lifecycle_hooks", "modes",
    "transition_rules", "logging",       "http",                   "state",
    "speech"};

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    if (config.state.memory_dir.empty()) {
        error = "state.memory_dir must not be empty";
        return false;
    }

    if (config.speech.type.empty()) {
        error = "speech.type must not be empty";
        return false;
    }

    return modes::validate_mode_system(config.modes, error);
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(kValidTopLevelKeys.begin(), kValidTopLevelKeys.end(), key) == kValidTopLevelKeys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (!modes::parse_mode_system(yaml, config.modes, error)) {
            return false;
        }
        config.modes.config_name = std::filesystem::path(config_path).stem().string();

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
            if (yaml["logging"]["file"]) {
                config.logging.file = yaml["logging"]["file"].as<std::string>();
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["enabled"]) {
                config.http.enabled = yaml["http"]["enabled"].as<bool>();
            }
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load state persistence config
        if (yaml["state"]) {
            if (yaml["state"]["memory_dir"]) {
                config.state.memory_dir = yaml["state"]["memory_dir"].as<std::string>();
            }
        }

        // Load speech config
        if (yaml["speech"]) {
            if (yaml["speech"]["type"]) {
                config.speech.type = yaml["speech"]["type"].as<std::string>();
            }
            if (yaml["speech"]["config"]) {
                config.speech.config = modes::yaml_to_json(yaml["speech"]["config"]);
                if (!config.speech.config.is_object()) {
                    error = "speech.config must be a mapping";
                    return false;
                }
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config.modes.modes.size() << " mode(s), "
                                    << config.modes.transition_rules.size() << " transition rule(s)");
        LOG_INFO("[Config] Default mode: " << config.modes.default_mode);

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Mode memory: " << (config.modes.mode_memory_enabled ? "enabled" : "disabled") << " ("
                                          << config.state.memory_dir << ")");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace helm
