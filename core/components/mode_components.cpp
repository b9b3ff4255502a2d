#include "components/mode_components.hpp"

#include "logging/logger.hpp"

namespace helm {
namespace components {

nlohmann::json add_meta(const nlohmann::json &config, const ManifestMeta &meta) {
    nlohmann::json enriched = config.is_object() ? config : nlohmann::json::object();
    auto set_default = [&enriched](const char *key, const std::string &value) {
        if (!enriched.contains(key)) {
            enriched[key] = value;
        }
    };
    set_default("api_key", meta.api_key);
    set_default("robot_ip", meta.robot_ip);
    set_default("URID", meta.urid);
    set_default("mode", meta.mode);
    return enriched;
}

ModeComponents instantiate_components(const ComponentManifests &manifests,
                                      const std::optional<ComponentManifest> &fallback_llm, const ManifestMeta &meta,
                                      const ComponentRegistry &registry, std::shared_ptr<TextToSpeech> speech) {
    ModeComponents components;

    auto context_for = [&](const nlohmann::json &config) {
        PluginContext ctx;
        ctx.config = add_meta(config, meta);
        ctx.speech = speech;
        return ctx;
    };

    for (const auto &input : manifests.inputs) {
        components.inputs.push_back(registry.create_sensor(input.type, context_for(input.config)));
    }

    for (const auto &action : manifests.actions) {
        AgentAction agent_action;
        agent_action.name = action.name;
        agent_action.llm_label = action.llm_label.empty() ? action.name : action.llm_label;
        agent_action.connector = registry.create_connector(action.connector, context_for(action.config));
        components.actions.push_back(std::move(agent_action));
    }

    const ComponentManifest *llm = nullptr;
    if (manifests.llm) {
        llm = &*manifests.llm;
    } else if (fallback_llm) {
        llm = &*fallback_llm;
    }
    if (!llm) {
        throw ComponentError("No LLM configured for mode '" + meta.mode + "' and no global cortex_llm");
    }
    components.llm = registry.create_llm(llm->type, context_for(llm->config), components.actions);

    for (const auto &simulator : manifests.simulators) {
        components.simulators.push_back(registry.create_simulator(simulator.type, context_for(simulator.config)));
    }

    for (const auto &background : manifests.backgrounds) {
        components.backgrounds.push_back(registry.create_background(background.type, context_for(background.config)));
    }

    LOG_DEBUG("[Components] Mode '" << meta.mode << "': " << components.inputs.size() << " inputs, "
                                    << components.actions.size() << " actions, " << components.simulators.size()
                                    << " simulators, " << components.backgrounds.size() << " backgrounds");
    return components;
}

}  // namespace components
}  // namespace helm
