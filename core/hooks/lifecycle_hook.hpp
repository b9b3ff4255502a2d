#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace helm {

namespace components {
class ComponentRegistry;
class TextToSpeech;
}  // namespace components

namespace hooks {

class HookFunctionRegistry;

/**
 * Points in a mode's life at which hooks run.
 */
enum class HookType {
    ON_ENTRY,     // Entering the mode during a transition
    ON_EXIT,      // Leaving the mode during a transition
    ON_STARTUP,   // Mode system starting (global hooks and the initial mode)
    ON_SHUTDOWN,  // Mode system shutting down
    ON_TIMEOUT    // Mode exceeded its timeout_seconds
};

/**
 * Convert HookType to its configuration name ("on_entry", ...).
 */
const char *hook_type_to_string(HookType type);

/**
 * Parse a configuration name. Returns std::nullopt for unknown names.
 */
std::optional<HookType> string_to_hook_type(const std::string &str);

enum class FailurePolicy {
    IGNORE,  // Record the failure, keep running later hooks
    ABORT    // Stop the batch and report failure immediately
};

struct LifecycleHook {
    HookType hook_type = HookType::ON_ENTRY;
    std::string handler_type;  // message, command, function, action
    nlohmann::json handler_config = nlohmann::json::object();
    bool async_execution = true;
    std::optional<double> timeout_seconds = 5.0;  // nullopt or 0 disables the timeout
    FailurePolicy on_failure = FailurePolicy::IGNORE;
    int priority = 0;  // Higher runs first
};

using SpeechProvider = std::function<std::shared_ptr<components::TextToSpeech>()>;

/**
 * Collaborators available to hook handlers.
 *
 * The registries are owned by the runtime and must outlive every hook
 * execution, including hooks abandoned after a timeout.
 */
struct HookServices {
    // Speech output for message hooks; may throw, which fails the hook
    SpeechProvider speech;
    const HookFunctionRegistry *functions = nullptr;
    const components::ComponentRegistry *components = nullptr;
    // How long a timed-out hook may take to honour cancellation
    std::chrono::milliseconds cancel_grace{1000};
};

/**
 * Parse hook entries from configuration.
 *
 * Entries missing hook_type or handler_type, or naming an unknown hook_type,
 * are logged and skipped. The rest keep their configured order.
 */
std::vector<LifecycleHook> parse_lifecycle_hooks(const nlohmann::json &raw_hooks);

/**
 * Run every hook of one type, highest priority first.
 *
 * Hooks of equal priority keep their configured order. The context gains a
 * "hook_type" key before it is handed to the handlers.
 *
 * A hook fails when its handler returns false, throws, cannot be created, or
 * outlives its timeout. A failing ABORT hook ends the batch at once.
 *
 * @return true if every executed hook succeeded (also true when none match)
 */
bool execute_lifecycle_hooks(const std::vector<LifecycleHook> &hooks, HookType type, nlohmann::json context,
                             const HookServices &services);

}  // namespace hooks
}  // namespace helm
