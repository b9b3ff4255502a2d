#include "modes/mode_manager.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

#include "logging/logger.hpp"

namespace helm {
namespace modes {

namespace {

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

double to_epoch_seconds(SystemClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

double seconds_since(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void trim_history(std::vector<std::string> &history) {
    if (history.size() > ModeManager::kMaxHistory) {
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(ModeManager::kTrimmedHistory));
    }
}

bool rule_applies_to(const TransitionRule &rule, const std::string &mode) {
    return rule.from_mode == mode || rule.from_mode == kAnyMode;
}

}  // namespace

ModeManager::ModeManager(ModeSystemConfig config, hooks::HookServices services,
                         std::shared_ptr<ModeStateStore> store)
    : config_(std::move(config)), services_(std::move(services)), store_(std::move(store)) {
    if (config_.modes.find(config_.default_mode) == config_.modes.end()) {
        throw std::invalid_argument("Default mode '" + config_.default_mode + "' not found in available modes");
    }

    state_.current_mode = config_.default_mode;
    state_.mode_start_time = SteadyClock::now();

    if (config_.mode_memory_enabled && store_) {
        load_mode_state();
    }

    LOG_INFO("[ModeManager] Initialized with current mode: " << state_.current_mode);
}

std::string ModeManager::current_mode_name() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.current_mode;
}

const ModeDefinition &ModeManager::current_mode_config() const { return config_.modes.at(current_mode_name()); }

ModeRuntimeState ModeManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<std::string> ModeManager::transition_history() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.transition_history;
}

/******************************************************************************
 * Callbacks
 ******************************************************************************/

ModeManager::CallbackId ModeManager::add_transition_callback(TransitionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    CallbackId id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

bool ModeManager::remove_transition_callback(CallbackId id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [id](const std::pair<CallbackId, TransitionCallback> &entry) { return entry.first == id; });
    if (it == callbacks_.end()) {
        return false;
    }
    callbacks_.erase(it);
    return true;
}

void ModeManager::notify_transition_callbacks(const std::string &from_mode, const std::string &to_mode) {
    std::vector<std::pair<CallbackId, TransitionCallback>> callbacks_copy;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_copy = callbacks_;
    }

    for (const auto &entry : callbacks_copy) {
        try {
            entry.second(from_mode, to_mode);
        } catch (const std::exception &e) {
            LOG_ERROR("[ModeManager] Error in transition callback: " << e.what());
        }
    }
}

/******************************************************************************
 * Rule evaluation
 ******************************************************************************/

bool ModeManager::can_transition(const TransitionRule &rule) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return can_transition_locked(rule);
}

bool ModeManager::can_transition_locked(const TransitionRule &rule) const {
    const std::string key = state_.current_mode + "->" + rule.to_mode;
    auto it = transition_cooldowns_.find(key);
    if (it != transition_cooldowns_.end() && seconds_since(it->second) < rule.cooldown_seconds) {
        LOG_DEBUG("[ModeManager] Transition " << key << " still in cooldown");
        return false;
    }

    if (config_.modes.find(rule.to_mode) == config_.modes.end()) {
        LOG_WARN("[ModeManager] Target mode '" << rule.to_mode << "' not found in configuration");
        return false;
    }

    return true;
}

std::optional<std::string> ModeManager::check_time_based_transitions() {
    std::string current;
    SteadyClock::time_point started;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current = state_.current_mode;
        started = state_.mode_start_time;
    }

    const auto &mode = config_.modes.at(current);
    const double duration = seconds_since(started);
    const bool mode_timed_out = mode.timeout_seconds && *mode.timeout_seconds > 0.0 &&
                                duration >= *mode.timeout_seconds;

    if (mode_timed_out) {
        nlohmann::json timeout_context = {{"mode_name", current},
                                          {"timeout_seconds", *mode.timeout_seconds},
                                          {"actual_duration", duration},
                                          {"timestamp", to_epoch_seconds(SystemClock::now())}};
        try {
            execute_mode_hooks(mode, hooks::HookType::ON_TIMEOUT, timeout_context, services_);
        } catch (const std::exception &e) {
            LOG_ERROR("[ModeManager] Error executing timeout lifecycle hooks: " << e.what());
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto &rule : config_.transition_rules) {
        if (!rule_applies_to(rule, current) || rule.transition_type != TransitionType::TIME_BASED) {
            continue;
        }
        // Without a mode-level timeout, a rule fires on its own timeout
        const bool rule_timed_out = rule.timeout_seconds && duration >= *rule.timeout_seconds;
        if (!mode_timed_out && !rule_timed_out) {
            continue;
        }
        if (can_transition_locked(rule)) {
            LOG_INFO("[ModeManager] Time-based transition triggered: " << current << " -> " << rule.to_mode);
            return rule.to_mode;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ModeManager::check_input_triggered_transitions(const std::string &input_text) const {
    if (input_text.empty()) {
        return std::nullopt;
    }
    const std::string input_lower = to_lower(input_text);

    std::lock_guard<std::mutex> lock(state_mutex_);

    std::vector<const TransitionRule *> matching;
    for (const auto &rule : config_.transition_rules) {
        if (!rule_applies_to(rule, state_.current_mode) ||
            rule.transition_type != TransitionType::INPUT_TRIGGERED) {
            continue;
        }
        for (const auto &keyword : rule.trigger_keywords) {
            if (keyword.empty() || input_lower.find(to_lower(keyword)) == std::string::npos) {
                continue;
            }
            if (can_transition_locked(rule)) {
                matching.push_back(&rule);
            }
            break;
        }
    }

    if (matching.empty()) {
        return std::nullopt;
    }

    std::stable_sort(matching.begin(), matching.end(),
                     [](const TransitionRule *a, const TransitionRule *b) { return a->priority > b->priority; });
    const TransitionRule *best = matching.front();

    LOG_INFO("[ModeManager] Input-triggered transition: " << state_.current_mode << " -> " << best->to_mode);
    return best->to_mode;
}

std::vector<std::string> ModeManager::get_available_transitions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return available_transitions_locked();
}

std::vector<std::string> ModeManager::available_transitions_locked() const {
    std::set<std::string> available;
    for (const auto &rule : config_.transition_rules) {
        if (rule_applies_to(rule, state_.current_mode) && can_transition_locked(rule)) {
            available.insert(rule.to_mode);
        }
    }
    return std::vector<std::string>(available.begin(), available.end());
}

/******************************************************************************
 * Transitions
 ******************************************************************************/

bool ModeManager::request_transition(const std::string &target_mode, const std::string &reason) {
    if (!config_.allow_manual_switching && reason == "manual") {
        LOG_WARN("[ModeManager] Manual mode switching is disabled");
        return false;
    }

    if (config_.modes.find(target_mode) == config_.modes.end()) {
        LOG_ERROR("[ModeManager] Target mode '" << target_mode << "' not found");
        return false;
    }

    if (target_mode == current_mode_name()) {
        LOG_INFO("[ModeManager] Already in mode '" << target_mode << "'");
        return true;
    }

    return execute_transition(target_mode, reason);
}

bool ModeManager::execute_transition(const std::string &target_mode, const std::string &reason) {
    const std::string from_mode = current_mode_name();

    try {
        const std::string transition_key = from_mode + "->" + target_mode;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            transition_cooldowns_[transition_key] = SteadyClock::now();
        }

        const auto &to_config = config_.modes.at(target_mode);
        const nlohmann::json transition_context = {{"from_mode", from_mode},
                                                   {"to_mode", target_mode},
                                                   {"reason", reason},
                                                   {"timestamp", to_epoch_seconds(SystemClock::now())},
                                                   {"transition_key", transition_key}};

        auto from_it = config_.modes.find(from_mode);
        if (from_it != config_.modes.end()) {
            LOG_DEBUG("[ModeManager] Executing exit hooks for mode: " << from_mode);
            if (!execute_mode_hooks(from_it->second, hooks::HookType::ON_EXIT, transition_context, services_)) {
                LOG_WARN("[ModeManager] Some exit hooks failed for mode: " << from_mode);
            }
        }
        if (!execute_global_hooks(config_, hooks::HookType::ON_EXIT, transition_context, services_)) {
            LOG_WARN("[ModeManager] Some global exit hooks failed");
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.previous_mode = from_mode;
            state_.current_mode = target_mode;
            state_.mode_start_time = SteadyClock::now();
            state_.last_transition_time = SystemClock::now();
            state_.transition_history.push_back(transition_key + ":" + reason);
            trim_history(state_.transition_history);
        }

        LOG_INFO("[ModeManager] Mode transition: " << from_mode << " -> " << target_mode << " (reason: " << reason
                                                   << ")");

        LOG_DEBUG("[ModeManager] Executing entry hooks for mode: " << target_mode);
        if (!execute_mode_hooks(to_config, hooks::HookType::ON_ENTRY, transition_context, services_)) {
            LOG_WARN("[ModeManager] Some entry hooks failed for mode: " << target_mode);
        }
        if (!execute_global_hooks(config_, hooks::HookType::ON_ENTRY, transition_context, services_)) {
            LOG_WARN("[ModeManager] Some global entry hooks failed");
        }

        notify_transition_callbacks(from_mode, target_mode);

        save_mode_state();
        return true;
    } catch (const std::exception &e) {
        LOG_ERROR("[ModeManager] Failed to execute transition " << from_mode << " -> " << target_mode << ": "
                                                                << e.what());
        return false;
    }
}

std::optional<std::string> ModeManager::process_tick(const std::optional<std::string> &input_text) {
    auto time_target = check_time_based_transitions();
    if (time_target && execute_transition(*time_target, "timeout")) {
        return time_target;
    }

    if (input_text && !input_text->empty()) {
        auto input_target = check_input_triggered_transitions(*input_text);
        if (input_target && execute_transition(*input_target, "input_triggered")) {
            return input_target;
        }
    }

    return std::nullopt;
}

/******************************************************************************
 * Introspection
 ******************************************************************************/

nlohmann::json ModeManager::get_mode_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    const auto &mode = config_.modes.at(state_.current_mode);
    double duration = seconds_since(state_.mode_start_time);

    nlohmann::json all_modes = nlohmann::json::array();
    for (const auto &entry : config_.modes) {
        all_modes.push_back(entry.first);
    }

    const auto &history = state_.transition_history;
    auto recent_begin = history.size() > 5 ? history.end() - 5 : history.begin();

    nlohmann::json info;
    info["current_mode"] = state_.current_mode;
    info["display_name"] = mode.display_name;
    info["description"] = mode.description;
    info["mode_duration"] = duration;
    info["previous_mode"] = state_.previous_mode ? nlohmann::json(*state_.previous_mode) : nlohmann::json(nullptr);
    info["available_transitions"] = available_transitions_locked();
    info["all_modes"] = all_modes;
    info["transition_history"] = std::vector<std::string>(recent_begin, history.end());
    if (mode.timeout_seconds && *mode.timeout_seconds > 0.0) {
        info["timeout_seconds"] = *mode.timeout_seconds;
        info["time_remaining"] = *mode.timeout_seconds - duration;
    } else {
        info["timeout_seconds"] = mode.timeout_seconds ? nlohmann::json(*mode.timeout_seconds) : nlohmann::json(nullptr);
        info["time_remaining"] = nullptr;
    }
    return info;
}

void ModeManager::update_user_context(const nlohmann::json &context) {
    if (!context.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.user_context.update(context);
}

nlohmann::json ModeManager::get_user_context() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.user_context;
}

/******************************************************************************
 * Persistence
 ******************************************************************************/

void ModeManager::load_mode_state() {
    auto snapshot = store_->load();
    if (!snapshot) {
        return;
    }

    const auto &last = snapshot->last_active_mode;
    if (last.empty() || config_.modes.find(last) == config_.modes.end() || last == config_.default_mode) {
        LOG_INFO("[ModeManager] Using default mode: " << config_.default_mode);
        return;
    }

    LOG_INFO("[ModeManager] Restoring last active mode: " << last);
    state_.current_mode = last;
    state_.previous_mode = snapshot->previous_mode;
    state_.transition_history.insert(state_.transition_history.end(), snapshot->transition_history.begin(),
                                     snapshot->transition_history.end());
    trim_history(state_.transition_history);
    LOG_INFO("[ModeManager] Mode state restored from " << store_->state_file_path());
}

void ModeManager::save_mode_state() {
    if (!config_.mode_memory_enabled || !store_) {
        return;
    }

    PersistedModeState snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snapshot.last_active_mode = state_.current_mode;
        snapshot.previous_mode = state_.previous_mode;
        const auto &history = state_.transition_history;
        auto begin = history.size() > kPersistedHistory ? history.end() - kPersistedHistory : history.begin();
        snapshot.transition_history.assign(begin, history.end());
    }
    snapshot.timestamp = to_epoch_seconds(SystemClock::now());

    std::string error;
    if (!store_->save(snapshot, error)) {
        LOG_ERROR("[ModeManager] Error saving mode state: " << error);
    }
}

}  // namespace modes
}  // namespace helm
