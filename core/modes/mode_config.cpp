#include "modes/mode_config.hpp"

#include <cmath>
#include <cstdlib>
#include <set>

#include "logging/logger.hpp"

namespace helm {
namespace modes {

const char *transition_type_to_string(TransitionType type) {
    switch (type) {
        case TransitionType::INPUT_TRIGGERED:
            return "input_triggered";
        case TransitionType::TIME_BASED:
            return "time_based";
        case TransitionType::CONTEXT_AWARE:
            return "context_aware";
        case TransitionType::MANUAL:
            return "manual";
        default:
            return "unknown";
    }
}

std::optional<TransitionType> string_to_transition_type(const std::string &str) {
    if (str == "input_triggered") {
        return TransitionType::INPUT_TRIGGERED;
    }
    if (str == "time_based") {
        return TransitionType::TIME_BASED;
    }
    if (str == "context_aware") {
        return TransitionType::CONTEXT_AWARE;
    }
    if (str == "manual") {
        return TransitionType::MANUAL;
    }
    return std::nullopt;
}

std::chrono::milliseconds ModeDefinition::tick_period() const {
    if (hertz <= 0.0) {
        return std::chrono::milliseconds(1000);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(1000.0 / hertz)));
}

components::ManifestMeta ModeSystemConfig::meta_for(const std::string &mode_name) const {
    components::ManifestMeta meta;
    meta.api_key = api_key;
    meta.robot_ip = robot_ip;
    meta.urid = urid;
    meta.mode = mode_name;
    return meta;
}

bool execute_mode_hooks(const ModeDefinition &mode, hooks::HookType type, nlohmann::json context,
                        const hooks::HookServices &services) {
    if (!context.is_object()) {
        context = nlohmann::json::object();
    }
    context["mode_name"] = mode.name;
    context["mode_display_name"] = mode.display_name;
    context["mode_description"] = mode.description;
    return hooks::execute_lifecycle_hooks(mode.lifecycle_hooks, type, std::move(context), services);
}

bool execute_global_hooks(const ModeSystemConfig &config, hooks::HookType type, nlohmann::json context,
                          const hooks::HookServices &services) {
    if (!context.is_object()) {
        context = nlohmann::json::object();
    }
    context["system_name"] = config.name;
    context["is_global_hook"] = true;
    return hooks::execute_lifecycle_hooks(config.global_lifecycle_hooks, type, std::move(context), services);
}

nlohmann::json yaml_to_json(const YAML::Node &node) {
    if (!node.IsDefined()) {
        return nullptr;
    }
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Scalar: {
            const std::string &text = node.Scalar();
            // Quoted scalars carry the "!" tag and always stay strings
            if (node.Tag() == "!") {
                return text;
            }
            if (text == "true" || text == "True" || text == "TRUE") {
                return true;
            }
            if (text == "false" || text == "False" || text == "FALSE") {
                return false;
            }
            long long integer = 0;
            if (YAML::convert<long long>::decode(node, integer)) {
                return integer;
            }
            double number = 0.0;
            if (YAML::convert<double>::decode(node, number)) {
                return number;
            }
            return text;
        }

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto &entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

namespace {

std::string env_or(const char *name, const std::string &fallback) {
    const char *value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}

nlohmann::json config_object(const YAML::Node &node) {
    if (!node || node.IsNull()) {
        return nlohmann::json::object();
    }
    auto json = yaml_to_json(node);
    return json.is_object() ? json : nlohmann::json::object();
}

bool parse_manifest(const YAML::Node &node, const std::string &where, components::ComponentManifest &manifest,
                    std::string &error) {
    if (!node.IsMap() || !node["type"]) {
        error = where + ": component entry needs a 'type'";
        return false;
    }
    manifest.type = node["type"].as<std::string>();
    manifest.config = config_object(node["config"]);
    return true;
}

bool parse_manifest_list(const YAML::Node &node, const std::string &where,
                         std::vector<components::ComponentManifest> &out, std::string &error) {
    if (!node) {
        return true;
    }
    if (!node.IsSequence()) {
        error = where + " must be a list";
        return false;
    }
    for (const auto &item : node) {
        components::ComponentManifest manifest;
        if (!parse_manifest(item, where, manifest, error)) {
            return false;
        }
        out.push_back(std::move(manifest));
    }
    return true;
}

bool parse_actions(const YAML::Node &node, const std::string &where, std::vector<components::ActionManifest> &out,
                   std::string &error) {
    if (!node) {
        return true;
    }
    if (!node.IsSequence()) {
        error = where + " must be a list";
        return false;
    }
    for (const auto &item : node) {
        if (!item.IsMap() || !item["name"] || !item["connector"]) {
            error = where + ": action entry needs 'name' and 'connector'";
            return false;
        }
        components::ActionManifest action;
        action.name = item["name"].as<std::string>();
        action.llm_label = item["llm_label"] ? item["llm_label"].as<std::string>() : action.name;
        action.connector = item["connector"].as<std::string>();
        action.config = config_object(item["config"]);
        out.push_back(std::move(action));
    }
    return true;
}

bool parse_mode(const std::string &name, const YAML::Node &node, ModeDefinition &mode, std::string &error) {
    const std::string where = "modes." + name;
    if (!node.IsMap()) {
        error = where + " must be a mapping";
        return false;
    }
    if (!node["system_prompt_base"]) {
        error = where + " missing 'system_prompt_base'";
        return false;
    }

    mode.name = name;
    mode.display_name = node["display_name"] ? node["display_name"].as<std::string>() : name;
    mode.description = node["description"] ? node["description"].as<std::string>() : "";
    mode.system_prompt_base = node["system_prompt_base"].as<std::string>();
    if (node["hertz"]) {
        mode.hertz = node["hertz"].as<double>();
    }
    if (node["timeout_seconds"] && !node["timeout_seconds"].IsNull()) {
        mode.timeout_seconds = node["timeout_seconds"].as<double>();
    }
    if (node["remember_locations"]) {
        mode.remember_locations = node["remember_locations"].as<bool>();
    }
    if (node["save_interactions"]) {
        mode.save_interactions = node["save_interactions"].as<bool>();
    }
    mode.lifecycle_hooks = hooks::parse_lifecycle_hooks(yaml_to_json(node["lifecycle_hooks"]));

    auto &manifests = mode.manifests;
    if (!parse_manifest_list(node["agent_inputs"], where + ".agent_inputs", manifests.inputs, error) ||
        !parse_manifest_list(node["simulators"], where + ".simulators", manifests.simulators, error) ||
        !parse_manifest_list(node["backgrounds"], where + ".backgrounds", manifests.backgrounds, error) ||
        !parse_actions(node["agent_actions"], where + ".agent_actions", manifests.actions, error)) {
        return false;
    }
    if (node["cortex_llm"] && !node["cortex_llm"].IsNull()) {
        components::ComponentManifest llm;
        if (!parse_manifest(node["cortex_llm"], where + ".cortex_llm", llm, error)) {
            return false;
        }
        manifests.llm = std::move(llm);
    }
    return true;
}

bool parse_rule(const YAML::Node &node, size_t index, TransitionRule &rule, std::string &error) {
    const std::string where = "transition_rules[" + std::to_string(index) + "]";
    if (!node.IsMap() || !node["from_mode"] || !node["to_mode"] || !node["transition_type"]) {
        error = where + " needs 'from_mode', 'to_mode' and 'transition_type'";
        return false;
    }

    rule.from_mode = node["from_mode"].as<std::string>();
    rule.to_mode = node["to_mode"].as<std::string>();

    auto type_name = node["transition_type"].as<std::string>();
    auto type = string_to_transition_type(type_name);
    if (!type) {
        error = where + ": invalid transition_type '" + type_name + "'";
        return false;
    }
    rule.transition_type = *type;

    if (node["trigger_keywords"]) {
        rule.trigger_keywords = node["trigger_keywords"].as<std::vector<std::string>>();
    }
    if (node["priority"]) {
        rule.priority = node["priority"].as<int>();
    }
    if (node["cooldown_seconds"]) {
        rule.cooldown_seconds = node["cooldown_seconds"].as<double>();
    }
    if (node["timeout_seconds"] && !node["timeout_seconds"].IsNull()) {
        rule.timeout_seconds = node["timeout_seconds"].as<double>();
    }
    rule.context_conditions = config_object(node["context_conditions"]);
    return true;
}

}  // namespace

bool parse_mode_system(const YAML::Node &root, ModeSystemConfig &config, std::string &error) {
    try {
        if (!root["default_mode"]) {
            error = "Config missing 'default_mode'";
            return false;
        }

        if (root["name"]) {
            config.name = root["name"].as<std::string>();
        }
        config.default_mode = root["default_mode"].as<std::string>();
        if (root["allow_manual_switching"]) {
            config.allow_manual_switching = root["allow_manual_switching"].as<bool>();
        }
        if (root["mode_memory_enabled"]) {
            config.mode_memory_enabled = root["mode_memory_enabled"].as<bool>();
        }

        config.api_key = root["api_key"] ? root["api_key"].as<std::string>() : "";
        if (config.api_key.empty()) {
            LOG_WARN("[Config] No API key found in mode config, checking HELM_API_KEY");
            config.api_key = env_or("HELM_API_KEY", config.api_key);
        }
        config.robot_ip = root["robot_ip"] ? root["robot_ip"].as<std::string>() : "";
        if (config.robot_ip.empty()) {
            LOG_WARN("[Config] No robot ip found in mode config, checking ROBOT_IP");
            config.robot_ip = env_or("ROBOT_IP", config.robot_ip);
        }
        config.urid = root["URID"] ? root["URID"].as<std::string>() : "default";
        if (config.urid == "default") {
            config.urid = env_or("URID", config.urid);
        }

        if (root["system_governance"]) {
            config.system_governance = root["system_governance"].as<std::string>();
        }
        if (root["system_prompt_examples"]) {
            config.system_prompt_examples = root["system_prompt_examples"].as<std::string>();
        }
        if (root["cortex_llm"] && !root["cortex_llm"].IsNull()) {
            components::ComponentManifest llm;
            if (!parse_manifest(root["cortex_llm"], "cortex_llm", llm, error)) {
                return false;
            }
            config.global_cortex_llm = std::move(llm);
        }
        config.global_lifecycle_hooks = hooks::parse_lifecycle_hooks(yaml_to_json(root["global_lifecycle_hooks"]));

        const auto &modes = root["modes"];
        if (modes) {
            if (!modes.IsMap()) {
                error = "'modes' must be a mapping";
                return false;
            }
            for (const auto &entry : modes) {
                ModeDefinition mode;
                auto name = entry.first.as<std::string>();
                if (!parse_mode(name, entry.second, mode, error)) {
                    return false;
                }
                config.modes[name] = std::move(mode);
            }
        }

        const auto &rules = root["transition_rules"];
        if (rules) {
            if (!rules.IsSequence()) {
                error = "'transition_rules' must be a list";
                return false;
            }
            size_t index = 0;
            for (const auto &item : rules) {
                TransitionRule rule;
                if (!parse_rule(item, index++, rule, error)) {
                    return false;
                }
                config.transition_rules.push_back(std::move(rule));
            }
        }
    } catch (const YAML::Exception &e) {
        error = std::string("Invalid mode configuration: ") + e.what();
        return false;
    }

    return true;
}

bool validate_mode_system(const ModeSystemConfig &config, std::string &error) {
    if (config.modes.empty()) {
        error = "Config must define at least one mode";
        return false;
    }
    if (config.modes.find(config.default_mode) == config.modes.end()) {
        error = "Default mode '" + config.default_mode + "' not found in available modes";
        return false;
    }

    for (const auto &entry : config.modes) {
        const auto &mode = entry.second;
        if (!(mode.hertz > 0.0)) {
            error = "Mode '" + mode.name + "' hertz must be > 0";
            return false;
        }
        if (mode.timeout_seconds && *mode.timeout_seconds < 0.0) {
            error = "Mode '" + mode.name + "' timeout_seconds must be >= 0";
            return false;
        }
        if (!mode.manifests.llm && !config.global_cortex_llm) {
            error = "No LLM configured for mode " + mode.name;
            return false;
        }
    }

    for (const auto &rule : config.transition_rules) {
        if (config.modes.find(rule.to_mode) == config.modes.end()) {
            error = "Transition rule target '" + rule.to_mode + "' is not a defined mode";
            return false;
        }
        if (rule.from_mode != kAnyMode && config.modes.find(rule.from_mode) == config.modes.end()) {
            LOG_WARN("[Config] Transition rule source '" << rule.from_mode << "' is not a defined mode");
        }
        if (rule.cooldown_seconds < 0.0) {
            error = "Transition rule " + rule.from_mode + "->" + rule.to_mode + " cooldown_seconds must be >= 0";
            return false;
        }
        if (rule.transition_type == TransitionType::INPUT_TRIGGERED && rule.trigger_keywords.empty()) {
            LOG_WARN("[Config] Input-triggered rule " << rule.from_mode << "->" << rule.to_mode
                                                      << " has no trigger_keywords and can never fire");
        }
    }

    return true;
}

bool validate_component_types(const ModeSystemConfig &config, const components::ComponentRegistry &registry,
                              std::string &error) {
    if (config.global_cortex_llm && !registry.has_llm(config.global_cortex_llm->type)) {
        error = "Unknown LLM type: " + config.global_cortex_llm->type;
        return false;
    }

    for (const auto &entry : config.modes) {
        const auto &name = entry.first;
        const auto &manifests = entry.second.manifests;
        for (const auto &input : manifests.inputs) {
            if (!registry.has_sensor(input.type)) {
                error = "Mode '" + name + "': unknown input type: " + input.type;
                return false;
            }
        }
        if (manifests.llm && !registry.has_llm(manifests.llm->type)) {
            error = "Mode '" + name + "': unknown LLM type: " + manifests.llm->type;
            return false;
        }
        for (const auto &simulator : manifests.simulators) {
            if (!registry.has_simulator(simulator.type)) {
                error = "Mode '" + name + "': unknown simulator type: " + simulator.type;
                return false;
            }
        }
        for (const auto &action : manifests.actions) {
            if (!registry.has_connector(action.connector)) {
                error = "Mode '" + name + "': unknown action connector: " + action.connector;
                return false;
            }
        }
        for (const auto &background : manifests.backgrounds) {
            if (!registry.has_background(background.type)) {
                error = "Mode '" + name + "': unknown background type: " + background.type;
                return false;
            }
        }
    }
    return true;
}

}  // namespace modes
}  // namespace helm
