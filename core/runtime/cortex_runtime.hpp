#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "components/component_registry.hpp"
#include "components/fuser.hpp"
#include "components/io_provider.hpp"
#include "components/mode_components.hpp"
#include "components/orchestrators.hpp"
#include "hooks/lifecycle_hook.hpp"
#include "modes/mode_config.hpp"
#include "modes/mode_manager.hpp"
#include "modes/mode_state_store.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/task.hpp"

namespace helm {
namespace runtime {

/**
 * The component graph of a newly entered mode could not be built.
 *
 * Fatal: run() finishes shutdown and rethrows it.
 */
class ModeInitializationError : public std::runtime_error {
public:
    explicit ModeInitializationError(const std::string &what) : std::runtime_error(what) {}
};

struct CortexServices {
    const components::ComponentRegistry *components = nullptr;  // Required
    hooks::HookServices hooks;
    std::shared_ptr<components::TextToSpeech> speech;  // Handed to plugin factories
    std::shared_ptr<modes::ModeStateStore> state_store;  // Optional
};

/**
 * ModeCortexRuntime - supervisor of the perception -> reasoning -> action loop.
 *
 * Owns the ModeManager and the live component graph of the active mode.
 * When the manager reports a transition, every subsystem task of the old mode
 * is cancelled and joined before the new mode's graph is instantiated and its
 * tasks started, so two modes' inputs are never live at the same time.
 *
 * Threading:
 * - run() turns the calling thread into the event loop thread. Ticks,
 *   transitions and everything posted to event_loop() execute there.
 * - stop() and event_loop().post() may be called from any thread.
 * - Without run() (tests, embedding), the thread calling startup(), tick()
 *   and shutdown() plays the loop thread.
 */
class ModeCortexRuntime {
public:
    /**
     * @throws std::invalid_argument if the default mode is not defined
     */
    ModeCortexRuntime(modes::ModeSystemConfig config, CortexServices services);
    ~ModeCortexRuntime();

    // Non-copyable, non-movable (callback captures this)
    ModeCortexRuntime(const ModeCortexRuntime &) = delete;
    ModeCortexRuntime &operator=(const ModeCortexRuntime &) = delete;

    /**
     * Run until stop() or a shutdown signal (blocking).
     *
     * Startup failures and ModeInitializationError are rethrown after the
     * shutdown hooks have run and all tasks are joined.
     */
    void run();

    // Ask run() to exit (any thread)
    void stop();

    /**
     * Run startup hooks, build the initial mode and start its tasks.
     *
     * The initial mode gets on_startup hooks, not on_entry hooks.
     *
     * @throws components::ComponentError if the initial mode cannot be built
     */
    void startup();

    /**
     * Run shutdown hooks (only after startup()), join every task and close
     * the event loop. Idempotent.
     *
     * Mode shutdown hooks are skipped when the initial mode never came up.
     */
    void shutdown();

    // One perception -> reasoning -> action cycle
    void tick();

    EventLoop &event_loop() { return event_loop_; }
    modes::ModeManager &mode_manager() { return *mode_manager_; }
    components::IoProvider &io_provider() { return io_; }

    nlohmann::json get_mode_info() const;

    // {mode name: {display_name, description, is_current}}
    nlohmann::json get_available_modes() const;

    bool request_mode_change(const std::string &target_mode);

    bool has_fatal_error() const { return static_cast<bool>(fatal_error_); }

    // Subsystem tasks that have not finished yet
    size_t live_task_count() const;

    // Number of component graphs built so far
    uint64_t activation_count() const { return activation_count_; }

    const components::ModeComponents &current_components() const { return components_; }

private:
    void on_mode_transition(const std::string &from_mode, const std::string &to_mode);
    void initialize_mode(const std::string &mode_name);
    void start_tasks();
    void stop_tasks();
    void release_components();
    bool supervise_tasks();
    bool should_stop() const;
    nlohmann::json lifecycle_context(const char *mode_key) const;

    // How long a failed tick or task waits before the loop carries on
    static constexpr std::chrono::milliseconds kErrorBackoff{1000};

    const modes::ModeSystemConfig config_;
    CortexServices services_;

    EventLoop event_loop_;
    components::IoProvider io_;
    std::unique_ptr<modes::ModeManager> mode_manager_;
    modes::ModeManager::CallbackId transition_callback_id_ = 0;

    // Live graph of the active mode. Orchestrators outlive tasks_.
    components::ModeComponents components_;
    std::unique_ptr<components::Fuser> fuser_;
    std::unique_ptr<components::InputOrchestrator> input_orchestrator_;
    std::unique_ptr<components::ActionOrchestrator> action_orchestrator_;
    std::unique_ptr<components::SimulatorOrchestrator> simulator_orchestrator_;
    std::unique_ptr<components::BackgroundOrchestrator> background_orchestrator_;
    std::vector<std::unique_ptr<SubsystemTask>> tasks_;
    std::set<const SubsystemTask *> reported_tasks_;
    std::chrono::milliseconds tick_period_{1000};
    uint64_t activation_count_ = 0;

    std::exception_ptr fatal_error_;
    std::atomic<bool> stop_requested_{false};
    bool started_ = false;       // Global startup hooks have run
    bool mode_started_ = false;  // Initial mode built and its tasks running
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace helm
