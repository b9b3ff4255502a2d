#pragma once

#include <memory>
#include <string>

#include "components/component_registry.hpp"
#include "config.hpp"
#include "control/mode_status_service.hpp"
#include "control/response_mailbox.hpp"
#include "cortex_runtime.hpp"
#include "hooks/hook_function_registry.hpp"
#include "http/server.hpp"

namespace helm {
namespace runtime {

/**
 * Runtime - owns every long-lived piece of the process.
 *
 * Registries and the speech output are created first and destroyed last;
 * hook threads abandoned after a timeout may still reference them.
 */
class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Build registries, the cortex, the mode-status service and HTTP
    bool initialize(std::string &error);

    /**
     * Main runtime loop (blocking).
     *
     * @return false if the cortex stopped on a fatal error
     */
    bool run(std::string &error);

    // Triggers the main loop to exit (any thread)
    void stop();

    void shutdown();

    ModeCortexRuntime &get_cortex() { return *cortex_; }
    components::ComponentRegistry &get_components() { return components_; }
    hooks::HookFunctionRegistry &get_hook_functions() { return hook_functions_; }

private:
    // Staged initialization helpers
    bool init_registries(std::string &error);
    bool init_cortex(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    components::ComponentRegistry components_;
    hooks::HookFunctionRegistry hook_functions_;
    std::shared_ptr<components::TextToSpeech> speech_;

    std::unique_ptr<control::ResponseMailbox> mailbox_;
    std::unique_ptr<ModeCortexRuntime> cortex_;
    std::unique_ptr<control::ModeStatusService> mode_status_;
    std::unique_ptr<http::HttpServer> http_server_;
};

}  // namespace runtime
}  // namespace helm
