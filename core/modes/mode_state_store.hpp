#pragma once

#include <optional>
#include <string>
#include <vector>

namespace helm {
namespace modes {

// Snapshot written after every successful transition
struct PersistedModeState {
    std::string last_active_mode;
    std::optional<std::string> previous_mode;
    double timestamp = 0.0;  // Seconds since the Unix epoch
    std::vector<std::string> transition_history;
};

/**
 * ModeStateStore - persists the active mode across restarts.
 *
 * One JSON file per configuration: <memory_dir>/.<config_name>.json.
 * Writes go to a temporary file that is renamed over the old snapshot, so a
 * crash mid-write leaves the previous snapshot intact.
 */
class ModeStateStore {
public:
    ModeStateStore(std::string memory_dir, std::string config_name);

    std::string state_file_path() const;

    /**
     * Read the snapshot.
     *
     * @return std::nullopt if there is no snapshot or it cannot be parsed
     *         (logged; callers fall back to the default mode)
     */
    std::optional<PersistedModeState> load() const;

    /**
     * Write the snapshot, creating memory_dir if needed.
     */
    bool save(const PersistedModeState &state, std::string &error) const;

private:
    std::string memory_dir_;
    std::string config_name_;
};

}  // namespace modes
}  // namespace helm
