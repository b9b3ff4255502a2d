#include "runtime.hpp"

#include "logging/logger.hpp"

namespace helm {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing helm runtime");

    if (!init_registries(error)) {
        return false;
    }

    if (!init_cortex(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_registries(std::string &error) {
    components::register_builtin_components(components_);

    try {
        components::PluginContext context;
        context.config = config_.speech.config;
        speech_ = components_.create_speech(config_.speech.type, context);
    } catch (const components::ComponentError &e) {
        error = std::string("Speech output: ") + e.what();
        return false;
    }
    LOG_INFO("[Runtime] Speech output: " << config_.speech.type);

    auto speech = speech_;
    hooks::register_builtin_hook_functions(hook_functions_, [speech]() { return speech; });

    if (!modes::validate_component_types(config_.modes, components_, error)) {
        return false;
    }
    return true;
}

bool Runtime::init_cortex(std::string &error) {
    CortexServices services;
    services.components = &components_;
    services.speech = speech_;
    auto speech = speech_;
    services.hooks.speech = [speech]() { return speech; };
    services.hooks.functions = &hook_functions_;
    services.hooks.components = &components_;
    if (config_.modes.mode_memory_enabled) {
        services.state_store =
            std::make_shared<modes::ModeStateStore>(config_.state.memory_dir, config_.modes.config_name);
        LOG_INFO("[Runtime] Mode state file: " << services.state_store->state_file_path());
    }

    try {
        cortex_ = std::make_unique<ModeCortexRuntime>(config_.modes, std::move(services));
    } catch (const std::exception &e) {
        error = std::string("Mode system initialization failed: ") + e.what();
        return false;
    }

    mailbox_ = std::make_unique<control::ResponseMailbox>();
    control::ResponseMailbox *mailbox = mailbox_.get();
    mode_status_ = std::make_unique<control::ModeStatusService>(
        cortex_->event_loop(), cortex_->mode_manager(),
        [mailbox](const control::ModeStatusResponse &response) { mailbox->deliver(response); });

    LOG_INFO("[Runtime] Mode system ready (" << config_.modes.modes.size() << " modes, current: "
                                             << cortex_->mode_manager().current_mode_name() << ")");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, *cortex_, *mode_status_, *mailbox_);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

bool Runtime::run(std::string &error) {
    if (!cortex_) {
        error = "Runtime not initialized";
        return false;
    }

    LOG_INFO("[Runtime] Starting main loop");
    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    try {
        cortex_->run();
    } catch (const std::exception &e) {
        error = e.what();
        LOG_ERROR("[Runtime] Cortex stopped: " << e.what());
        return false;
    }

    LOG_INFO("[Runtime] Main loop exited");
    return true;
}

void Runtime::stop() {
    if (cortex_) {
        cortex_->stop();
    }
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }

    // Closing the loop answers queued requests through mode_status_
    if (cortex_) {
        cortex_->shutdown();
    }
    mode_status_.reset();
    cortex_.reset();
    mailbox_.reset();
}

}  // namespace runtime
}  // namespace helm
