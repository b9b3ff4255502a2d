#include "runtime/cortex_runtime.hpp"

#include "logging/logger.hpp"
#include "runtime/signal_handler.hpp"

namespace helm {
namespace runtime {

namespace {

double now_epoch_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

ModeCortexRuntime::ModeCortexRuntime(modes::ModeSystemConfig config, CortexServices services)
    : config_(std::move(config)), services_(std::move(services)) {
    mode_manager_ = std::make_unique<modes::ModeManager>(config_, services_.hooks, services_.state_store);
    transition_callback_id_ = mode_manager_->add_transition_callback(
        [this](const std::string &from_mode, const std::string &to_mode) { on_mode_transition(from_mode, to_mode); });
}

ModeCortexRuntime::~ModeCortexRuntime() {
    mode_manager_->remove_transition_callback(transition_callback_id_);
    stop_tasks();
    event_loop_.close();
}

/******************************************************************************
 * Lifecycle
 ******************************************************************************/

void ModeCortexRuntime::run() {
    event_loop_.bind_to_current_thread();
    LOG_INFO("[Cortex] Starting mode-aware runtime (mode: " << mode_manager_->current_mode_name() << ")");

    try {
        startup();
    } catch (const std::exception &e) {
        LOG_ERROR("[Cortex] Startup failed: " << e.what());
        fatal_error_ = std::current_exception();
    }

    auto interrupted = [this] { return should_stop() || io_.skip_sleep_requested(); };

    while (!fatal_error_ && !should_stop()) {
        if (io_.skip_sleep_requested()) {
            event_loop_.run_pending();
        } else {
            event_loop_.run_for(tick_period_, interrupted);
        }

        if (should_stop() || fatal_error_) {
            break;
        }

        try {
            tick();
            io_.clear_skip_sleep();
        } catch (const std::exception &e) {
            LOG_ERROR("[Cortex] Error in cortex loop: " << e.what());
            event_loop_.run_for(kErrorBackoff, [this] { return should_stop(); });
        }

        if (fatal_error_) {
            break;
        }

        if (supervise_tasks()) {
            event_loop_.run_for(kErrorBackoff, [this] { return should_stop(); });
        }
    }

    if (SignalHandler::is_shutdown_requested()) {
        LOG_INFO("[Cortex] Signal received, stopping...");
    }

    shutdown();

    if (fatal_error_) {
        std::rethrow_exception(fatal_error_);
    }
}

void ModeCortexRuntime::stop() {
    stop_requested_ = true;
    event_loop_.wake();
}

bool ModeCortexRuntime::should_stop() const {
    return stop_requested_.load() || SignalHandler::is_shutdown_requested();
}

nlohmann::json ModeCortexRuntime::lifecycle_context(const char *mode_key) const {
    return {{"system_name", config_.name},
            {mode_key, mode_manager_->current_mode_name()},
            {"timestamp", now_epoch_seconds()}};
}

void ModeCortexRuntime::startup() {
    if (started_) {
        return;
    }
    started_ = true;

    const auto context = lifecycle_context("initial_mode");
    if (!modes::execute_global_hooks(config_, hooks::HookType::ON_STARTUP, context, services_.hooks)) {
        LOG_WARN("[Cortex] Some global startup hooks failed");
    }

    initialize_mode(mode_manager_->current_mode_name());

    if (!modes::execute_mode_hooks(mode_manager_->current_mode_config(), hooks::HookType::ON_STARTUP, context,
                                   services_.hooks)) {
        LOG_WARN("[Cortex] Some startup hooks failed for mode: " << mode_manager_->current_mode_name());
    }

    start_tasks();
    mode_started_ = true;
}

void ModeCortexRuntime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    LOG_INFO("[Cortex] Shutting down (mode: " << mode_manager_->current_mode_name() << ")");

    if (started_) {
        const auto context = lifecycle_context("final_mode");
        if (mode_started_ && !modes::execute_mode_hooks(mode_manager_->current_mode_config(),
                                                        hooks::HookType::ON_SHUTDOWN, context, services_.hooks)) {
            LOG_WARN("[Cortex] Some shutdown hooks failed for mode: " << mode_manager_->current_mode_name());
        }
        if (!modes::execute_global_hooks(config_, hooks::HookType::ON_SHUTDOWN, context, services_.hooks)) {
            LOG_WARN("[Cortex] Some global shutdown hooks failed");
        }
    }

    stop_tasks();
    release_components();

    // Requests still queued get their drop callbacks
    event_loop_.close();
    io_.clear();

    LOG_INFO("[Cortex] Shutdown complete");
}

/******************************************************************************
 * Component graph
 ******************************************************************************/

void ModeCortexRuntime::initialize_mode(const std::string &mode_name) {
    if (services_.components == nullptr) {
        throw components::ComponentError("No component registry available");
    }

    const auto &mode = config_.modes.at(mode_name);
    LOG_INFO("[Cortex] Initializing mode: " << mode.display_name);

    components_ = components::instantiate_components(mode.manifests, config_.global_cortex_llm,
                                                     config_.meta_for(mode_name), *services_.components,
                                                     services_.speech);

    fuser_ = std::make_unique<components::Fuser>(mode.system_prompt_base, config_.system_governance,
                                                 config_.system_prompt_examples, components_.actions);
    input_orchestrator_ = std::make_unique<components::InputOrchestrator>(components_.inputs, io_);
    action_orchestrator_ = std::make_unique<components::ActionOrchestrator>(components_.actions);
    simulator_orchestrator_ = std::make_unique<components::SimulatorOrchestrator>(components_.simulators);
    background_orchestrator_ = std::make_unique<components::BackgroundOrchestrator>(components_.backgrounds);

    tick_period_ = mode.tick_period();
    activation_count_++;

    LOG_INFO("[Cortex] Mode '" << mode_name << "' initialized successfully");
}

void ModeCortexRuntime::release_components() {
    fuser_.reset();
    input_orchestrator_.reset();
    action_orchestrator_.reset();
    simulator_orchestrator_.reset();
    background_orchestrator_.reset();
    components_ = components::ModeComponents{};
}

void ModeCortexRuntime::start_tasks() {
    if (!input_orchestrator_ || !action_orchestrator_ || !simulator_orchestrator_ || !background_orchestrator_) {
        throw std::runtime_error("No mode initialized");
    }

    tasks_.push_back(input_orchestrator_->start());
    tasks_.push_back(simulator_orchestrator_->start());
    tasks_.push_back(action_orchestrator_->start());
    tasks_.push_back(background_orchestrator_->start());

    LOG_DEBUG("[Cortex] Started " << tasks_.size() << " subsystem tasks");
}

void ModeCortexRuntime::stop_tasks() {
    if (tasks_.empty()) {
        return;
    }

    for (auto &task : tasks_) {
        task->cancel();
    }
    for (auto &task : tasks_) {
        task->join();
        if (task->failed()) {
            LOG_DEBUG("[Cortex] Task '" << task->name() << "' had failed: " << task->error());
        }
    }

    LOG_DEBUG("[Cortex] Stopped " << tasks_.size() << " subsystem tasks");
    tasks_.clear();
    reported_tasks_.clear();
}

bool ModeCortexRuntime::supervise_tasks() {
    bool failure = false;
    for (const auto &task : tasks_) {
        if (!task->done() || reported_tasks_.count(task.get()) > 0) {
            continue;
        }
        reported_tasks_.insert(task.get());

        if (task->failed()) {
            LOG_ERROR("[Cortex] Subsystem task '" << task->name() << "' failed: " << task->error());
            failure = true;
        } else if (!task->cancelled()) {
            LOG_WARN("[Cortex] Subsystem task '" << task->name() << "' exited");
        }
    }
    return failure;
}

size_t ModeCortexRuntime::live_task_count() const {
    size_t live = 0;
    for (const auto &task : tasks_) {
        if (!task->done()) {
            live++;
        }
    }
    return live;
}

/******************************************************************************
 * Transitions
 ******************************************************************************/

void ModeCortexRuntime::on_mode_transition(const std::string &from_mode, const std::string &to_mode) {
    LOG_INFO("[Cortex] Handling mode transition: " << from_mode << " -> " << to_mode);

    try {
        // Old inputs must be quiet before the new graph exists
        stop_tasks();
        release_components();

        // Readings from the old mode's sensors never reach the new mode
        io_.reset_inputs();

        initialize_mode(to_mode);
        start_tasks();

        LOG_INFO("[Cortex] Successfully transitioned to mode: " << to_mode);
    } catch (const std::exception &e) {
        LOG_ERROR("[Cortex] Error during mode transition " << from_mode << " -> " << to_mode << ": " << e.what());
        stop_tasks();
        release_components();
        fatal_error_ = std::make_exception_ptr(
            ModeInitializationError("Failed to initialize mode '" + to_mode + "': " + e.what()));
        event_loop_.wake();
        throw;
    }
}

/******************************************************************************
 * Tick
 ******************************************************************************/

void ModeCortexRuntime::tick() {
    if (fatal_error_ || !fuser_ || !action_orchestrator_ || !components_.llm) {
        LOG_WARN("[Cortex] Cortex not properly initialized, skipping tick");
        return;
    }

    auto finished = action_orchestrator_->flush_promises();
    auto inputs = io_.drain_inputs();

    auto prompt = fuser_->fuse(inputs, finished);
    if (!prompt) {
        LOG_DEBUG("[Cortex] No prompt to fuse");
        return;
    }

    auto last_input = io_.take_mode_transition_input();
    auto new_mode = mode_manager_->process_tick(last_input);
    if (new_mode) {
        LOG_INFO("[Cortex] Mode switched to: " << *new_mode);
        return;
    }

    auto output = components_.llm->ask(*prompt);
    if (!output) {
        LOG_DEBUG("[Cortex] No output from LLM");
        return;
    }

    simulator_orchestrator_->promise(output->actions);
    action_orchestrator_->promise(output->actions);
}

/******************************************************************************
 * Queries and requests
 ******************************************************************************/

nlohmann::json ModeCortexRuntime::get_mode_info() const { return mode_manager_->get_mode_info(); }

nlohmann::json ModeCortexRuntime::get_available_modes() const {
    const std::string current = mode_manager_->current_mode_name();
    nlohmann::json modes = nlohmann::json::object();
    for (const auto &entry : config_.modes) {
        modes[entry.first] = {{"display_name", entry.second.display_name},
                              {"description", entry.second.description},
                              {"is_current", entry.first == current}};
    }
    return modes;
}

bool ModeCortexRuntime::request_mode_change(const std::string &target_mode) {
    return mode_manager_->request_transition(target_mode, "manual");
}

}  // namespace runtime
}  // namespace helm
