#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "components/component_registry.hpp"
#include "components/plugin_types.hpp"

namespace helm {
namespace components {

// {type, config} entry from the mode configuration
struct ComponentManifest {
    std::string type;
    nlohmann::json config = nlohmann::json::object();
};

struct ActionManifest {
    std::string name;
    std::string llm_label;
    std::string connector;
    nlohmann::json config = nlohmann::json::object();
};

// Declarative description of one mode's component graph
struct ComponentManifests {
    std::vector<ComponentManifest> inputs;
    std::optional<ComponentManifest> llm;
    std::vector<ComponentManifest> simulators;
    std::vector<ActionManifest> actions;
    std::vector<ComponentManifest> backgrounds;
};

// Global keys merged into every component config
struct ManifestMeta {
    std::string api_key;
    std::string robot_ip;
    std::string urid;
    std::string mode;
};

// Live component graph of the active mode
struct ModeComponents {
    std::vector<std::shared_ptr<Sensor>> inputs;
    std::shared_ptr<LLM> llm;
    std::vector<std::shared_ptr<Simulator>> simulators;
    std::vector<AgentAction> actions;
    std::vector<std::shared_ptr<Background>> backgrounds;
};

/**
 * Copy config and add api_key, robot_ip, URID and mode.
 * Keys already present in config win.
 */
nlohmann::json add_meta(const nlohmann::json &config, const ManifestMeta &meta);

/**
 * Build a fresh component graph.
 *
 * The mode-level LLM is used when present, otherwise fallback_llm.
 * Actions are created before the LLM so the LLM sees what it may call.
 *
 * @throws ComponentError if a type is unknown, a factory fails, or no LLM
 *         manifest is available
 */
ModeComponents instantiate_components(const ComponentManifests &manifests,
                                      const std::optional<ComponentManifest> &fallback_llm, const ManifestMeta &meta,
                                      const ComponentRegistry &registry, std::shared_ptr<TextToSpeech> speech);

}  // namespace components
}  // namespace helm
