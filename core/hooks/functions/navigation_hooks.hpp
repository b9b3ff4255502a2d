#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "hooks/hook_function_registry.hpp"
#include "runtime/task.hpp"

namespace helm {
namespace hooks {
namespace functions {

/**
 * Function hooks driving the robot's local navigation services API.
 *
 * Context keys:
 * - base_url (default "http://localhost:5000")
 * - map_name (default "map", used by start_nav2 and stop_slam)
 *
 * Every hook throws std::runtime_error on a transport error or a non-200
 * reply, which fails the hook.
 */

// POST /start/nav2 {"map_name"}; announces success
std::optional<bool> start_nav2_hook(const nlohmann::json &context, const SpeechProvider &speech);

// POST /stop/nav2
std::optional<bool> stop_nav2_hook(const nlohmann::json &context);

// POST /start/slam
std::optional<bool> start_slam_hook(const nlohmann::json &context);

// POST /maps/save {"map_name"} then POST /stop/slam; announces the saved map
std::optional<bool> stop_slam_hook(const nlohmann::json &context, const SpeechProvider &speech);

// Registers module "nav2_hook" and module "slam_hook"
void register_navigation_hooks(HookFunctionRegistry &registry, SpeechProvider speech);

}  // namespace functions
}  // namespace hooks
}  // namespace helm
