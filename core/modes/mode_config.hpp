#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "components/component_registry.hpp"
#include "components/mode_components.hpp"
#include "hooks/lifecycle_hook.hpp"

namespace helm {
namespace modes {

/**
 * How a transition rule fires.
 *
 * CONTEXT_AWARE rules are carried through configuration but never fire on
 * their own; MANUAL rules only document allowed requests.
 */
enum class TransitionType { INPUT_TRIGGERED, TIME_BASED, CONTEXT_AWARE, MANUAL };

const char *transition_type_to_string(TransitionType type);
std::optional<TransitionType> string_to_transition_type(const std::string &str);

// Matches every source mode in TransitionRule::from_mode
constexpr const char *kAnyMode = "*";

struct TransitionRule {
    std::string from_mode;  // Mode name or "*"
    std::string to_mode;
    TransitionType transition_type = TransitionType::MANUAL;
    std::vector<std::string> trigger_keywords;
    int priority = 1;  // Higher wins
    double cooldown_seconds = 0.0;
    std::optional<double> timeout_seconds;
    nlohmann::json context_conditions = nlohmann::json::object();
};

struct ModeDefinition {
    std::string name;
    std::string display_name;
    std::string description;
    std::string system_prompt_base;
    double hertz = 1.0;
    std::optional<double> timeout_seconds;
    bool remember_locations = false;
    bool save_interactions = false;
    std::vector<hooks::LifecycleHook> lifecycle_hooks;
    components::ComponentManifests manifests;

    // Time between cortex ticks
    std::chrono::milliseconds tick_period() const;
};

struct ModeSystemConfig {
    std::string name = "mode_system";
    std::string default_mode;
    std::string config_name;  // Names the persisted snapshot file
    bool allow_manual_switching = true;
    bool mode_memory_enabled = true;

    std::string api_key;
    std::string robot_ip;
    std::string urid = "default";
    std::string system_governance;
    std::string system_prompt_examples;

    std::optional<components::ComponentManifest> global_cortex_llm;
    std::vector<hooks::LifecycleHook> global_lifecycle_hooks;

    std::map<std::string, ModeDefinition> modes;
    std::vector<TransitionRule> transition_rules;

    // Meta keys merged into the component configs of one mode
    components::ManifestMeta meta_for(const std::string &mode_name) const;
};

/**
 * Run a mode's hooks of one type.
 * Adds mode_name, mode_display_name and mode_description to the context.
 */
bool execute_mode_hooks(const ModeDefinition &mode, hooks::HookType type, nlohmann::json context,
                        const hooks::HookServices &services);

/**
 * Run the system-wide hooks of one type.
 * Adds system_name and is_global_hook to the context.
 */
bool execute_global_hooks(const ModeSystemConfig &config, hooks::HookType type, nlohmann::json context,
                          const hooks::HookServices &services);

/**
 * Convert a YAML node to JSON.
 *
 * Unquoted scalars become null, bool, integer or float where they parse as
 * one; everything else becomes a string.
 */
nlohmann::json yaml_to_json(const YAML::Node &node);

/**
 * Read the mode-system keys of a configuration document.
 *
 * Environment fallbacks: HELM_API_KEY when api_key is empty, ROBOT_IP when
 * robot_ip is empty, URID when URID is "default".
 */
bool parse_mode_system(const YAML::Node &root, ModeSystemConfig &config, std::string &error);

/**
 * Check references between modes, rules and LLM manifests.
 */
bool validate_mode_system(const ModeSystemConfig &config, std::string &error);

/**
 * Check that every manifest names a type the registry can build.
 */
bool validate_component_types(const ModeSystemConfig &config, const components::ComponentRegistry &registry,
                              std::string &error);

}  // namespace modes
}  // namespace helm
