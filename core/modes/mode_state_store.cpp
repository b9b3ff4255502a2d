#include "modes/mode_state_store.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace helm {
namespace modes {

ModeStateStore::ModeStateStore(std::string memory_dir, std::string config_name)
    : memory_dir_(std::move(memory_dir)), config_name_(std::move(config_name)) {
    if (config_name_.empty()) {
        config_name_ = "default";
    }
}

std::string ModeStateStore::state_file_path() const {
    return (std::filesystem::path(memory_dir_) / ("." + config_name_ + ".json")).string();
}

std::optional<PersistedModeState> ModeStateStore::load() const {
    const auto path = state_file_path();

    std::ifstream in(path);
    if (!in) {
        LOG_DEBUG("[ModeState] No state file found at " << path << ", using default mode");
        return std::nullopt;
    }

    try {
        auto data = nlohmann::json::parse(in);
        if (!data.is_object()) {
            LOG_WARN("[ModeState] Invalid state file format in " << path << ", using default mode");
            return std::nullopt;
        }

        PersistedModeState state;
        if (data.contains("last_active_mode") && data["last_active_mode"].is_string()) {
            state.last_active_mode = data["last_active_mode"].get<std::string>();
        }
        if (data.contains("previous_mode") && data["previous_mode"].is_string()) {
            state.previous_mode = data["previous_mode"].get<std::string>();
        }
        state.timestamp = data.value("timestamp", 0.0);
        if (data.contains("transition_history") && data["transition_history"].is_array()) {
            for (const auto &entry : data["transition_history"]) {
                if (entry.is_string()) {
                    state.transition_history.push_back(entry.get<std::string>());
                }
            }
        }
        return state;
    } catch (const nlohmann::json::exception &e) {
        LOG_WARN("[ModeState] Invalid state file format: " << e.what() << ", using default mode");
        return std::nullopt;
    }
}

bool ModeStateStore::save(const PersistedModeState &state, std::string &error) const {
    namespace fs = std::filesystem;

    const fs::path target = state_file_path();
    const fs::path temp = target.string() + ".tmp";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        error = "Cannot create " + target.parent_path().string() + ": " + ec.message();
        return false;
    }

    nlohmann::json data;
    data["last_active_mode"] = state.last_active_mode;
    data["previous_mode"] = state.previous_mode ? nlohmann::json(*state.previous_mode) : nlohmann::json(nullptr);
    data["timestamp"] = state.timestamp;
    data["transition_history"] = state.transition_history;

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            error = "Cannot open " + temp.string() + " for writing";
            return false;
        }
        out << data.dump(2);
        out.flush();
        if (!out) {
            error = "Failed writing " + temp.string();
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        error = "Cannot replace " + target.string() + ": " + ec.message();
        fs::remove(temp, ec);
        return false;
    }

    LOG_DEBUG("[ModeState] Mode state saved to " << target.string());
    return true;
}

}  // namespace modes
}  // namespace helm
