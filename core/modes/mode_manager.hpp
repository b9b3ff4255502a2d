#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "hooks/lifecycle_hook.hpp"
#include "modes/mode_config.hpp"
#include "modes/mode_state_store.hpp"

namespace helm {
namespace modes {

/**
 * Mutable state of the mode system.
 */
struct ModeRuntimeState {
    std::string current_mode;
    std::optional<std::string> previous_mode;
    std::chrono::steady_clock::time_point mode_start_time;
    std::vector<std::string> transition_history;  // "from->to:reason"
    std::chrono::system_clock::time_point last_transition_time{};
    nlohmann::json user_context = nlohmann::json::object();
};

/**
 * ModeManager - the mode state machine.
 *
 * Decides when to switch modes (timeouts, keyword rules, explicit requests),
 * runs exit and entry hooks around each switch, notifies listeners and
 * persists the outcome.
 *
 * Threading:
 * - Transitions must only be driven from one thread (the cortex event loop).
 *   Hooks and callbacks run on that thread with no lock held.
 * - Read accessors (current_mode_name, state, get_mode_info, ...) may be
 *   called from any thread.
 *
 * Every failure inside a transition is caught here; callers see false.
 */
class ModeManager {
public:
    static constexpr size_t kMaxHistory = 50;       // Trim threshold
    static constexpr size_t kTrimmedHistory = 25;   // Entries kept after a trim
    static constexpr size_t kPersistedHistory = 10;  // Entries written to the snapshot

    /**
     * Transition callback signature.
     * Called after entry hooks of the new mode have run.
     */
    using TransitionCallback = std::function<void(const std::string &from_mode, const std::string &to_mode)>;
    using CallbackId = uint64_t;

    /**
     * @param store Snapshot storage; restore/save only happen when it is set
     *              and mode_memory_enabled is true
     * @throws std::invalid_argument if default_mode is not a defined mode
     */
    ModeManager(ModeSystemConfig config, hooks::HookServices services,
                std::shared_ptr<ModeStateStore> store = nullptr);

    const ModeSystemConfig &config() const { return config_; }
    const hooks::HookServices &hook_services() const { return services_; }

    std::string current_mode_name() const;
    const ModeDefinition &current_mode_config() const;
    ModeRuntimeState state() const;
    std::vector<std::string> transition_history() const;

    CallbackId add_transition_callback(TransitionCallback callback);
    bool remove_transition_callback(CallbackId id);

    /**
     * Check the current mode's timeout.
     *
     * Once the mode has been active for timeout_seconds, on_timeout hooks run
     * (on every call while the condition holds) and the first eligible
     * time_based rule from the current mode or "*" is selected. A time_based
     * rule with its own timeout_seconds is also eligible once that much time
     * has passed, even if the mode's timeout has not.
     *
     * @return target mode, or std::nullopt
     */
    std::optional<std::string> check_time_based_transitions();

    /**
     * Match input text against input_triggered rules.
     *
     * Keywords match case-insensitively as substrings. Among eligible
     * matches the highest priority wins; ties keep configuration order.
     */
    std::optional<std::string> check_input_triggered_transitions(const std::string &input_text) const;

    /**
     * Cooldown and target check for one rule.
     * Cooldowns are keyed by "<current mode>-><to_mode>".
     */
    bool can_transition(const TransitionRule &rule) const;

    /**
     * Explicitly request a switch.
     *
     * Refused when reason is "manual" and manual switching is disabled, or
     * when the target is unknown. Requesting the current mode succeeds
     * without running any hooks.
     */
    bool request_transition(const std::string &target_mode, const std::string &reason = "manual");

    /**
     * Per-tick evaluation: timeout first, then input keywords.
     *
     * @return the new mode if a transition happened
     */
    std::optional<std::string> process_tick(const std::optional<std::string> &input_text = std::nullopt);

    // Distinct targets reachable from the current mode right now
    std::vector<std::string> get_available_transitions() const;

    nlohmann::json get_mode_info() const;

    // Merge keys into the user context
    void update_user_context(const nlohmann::json &context);
    nlohmann::json get_user_context() const;

private:
    bool execute_transition(const std::string &target_mode, const std::string &reason);
    bool can_transition_locked(const TransitionRule &rule) const;
    std::vector<std::string> available_transitions_locked() const;
    void notify_transition_callbacks(const std::string &from_mode, const std::string &to_mode);
    void load_mode_state();
    void save_mode_state();

    const ModeSystemConfig config_;
    const hooks::HookServices services_;
    std::shared_ptr<ModeStateStore> store_;

    mutable std::mutex state_mutex_;
    ModeRuntimeState state_;
    std::map<std::string, std::chrono::steady_clock::time_point> transition_cooldowns_;

    std::mutex callbacks_mutex_;
    std::vector<std::pair<CallbackId, TransitionCallback>> callbacks_;
    CallbackId next_callback_id_ = 1;
};

}  // namespace modes
}  // namespace helm
