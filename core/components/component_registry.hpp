#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "components/plugin_types.hpp"

namespace helm {
namespace components {

/**
 * Everything a plugin factory receives.
 *
 * config is the manifest's config object after meta enrichment
 * (api_key, robot_ip, URID, mode).
 */
struct PluginContext {
    nlohmann::json config = nlohmann::json::object();
    std::shared_ptr<TextToSpeech> speech;
};

using SensorFactory = std::function<std::shared_ptr<Sensor>(const PluginContext &)>;
using LLMFactory =
    std::function<std::shared_ptr<LLM>(const PluginContext &, const std::vector<AgentAction> &available_actions)>;
using ConnectorFactory = std::function<std::shared_ptr<ActionConnector>(const PluginContext &)>;
using SimulatorFactory = std::function<std::shared_ptr<Simulator>(const PluginContext &)>;
using BackgroundFactory = std::function<std::shared_ptr<Background>(const PluginContext &)>;
using SpeechFactory = std::function<std::shared_ptr<TextToSpeech>(const PluginContext &)>;

/**
 * ComponentRegistry - explicit type name to factory map for every plugin kind.
 *
 * Populated once at startup (register_builtin_components plus anything the
 * embedding application adds) and read-only afterwards, so lookups from hook
 * worker threads need no locking.
 *
 * create_* throws ComponentError when the type is unknown or the factory
 * fails.
 */
class ComponentRegistry {
public:
    // Registration returns false if the type name is already taken
    bool register_sensor(const std::string &type, SensorFactory factory);
    bool register_llm(const std::string &type, LLMFactory factory);
    bool register_connector(const std::string &type, ConnectorFactory factory);
    bool register_simulator(const std::string &type, SimulatorFactory factory);
    bool register_background(const std::string &type, BackgroundFactory factory);
    bool register_speech(const std::string &type, SpeechFactory factory);

    std::shared_ptr<Sensor> create_sensor(const std::string &type, const PluginContext &context) const;
    std::shared_ptr<LLM> create_llm(const std::string &type, const PluginContext &context,
                                    const std::vector<AgentAction> &available_actions) const;
    std::shared_ptr<ActionConnector> create_connector(const std::string &type, const PluginContext &context) const;
    std::shared_ptr<Simulator> create_simulator(const std::string &type, const PluginContext &context) const;
    std::shared_ptr<Background> create_background(const std::string &type, const PluginContext &context) const;
    std::shared_ptr<TextToSpeech> create_speech(const std::string &type, const PluginContext &context) const;

    bool has_sensor(const std::string &type) const { return sensors_.count(type) > 0; }
    bool has_llm(const std::string &type) const { return llms_.count(type) > 0; }
    bool has_connector(const std::string &type) const { return connectors_.count(type) > 0; }
    bool has_simulator(const std::string &type) const { return simulators_.count(type) > 0; }
    bool has_background(const std::string &type) const { return backgrounds_.count(type) > 0; }
    bool has_speech(const std::string &type) const { return speech_.count(type) > 0; }

private:
    std::map<std::string, SensorFactory> sensors_;
    std::map<std::string, LLMFactory> llms_;
    std::map<std::string, ConnectorFactory> connectors_;
    std::map<std::string, SimulatorFactory> simulators_;
    std::map<std::string, BackgroundFactory> backgrounds_;
    std::map<std::string, SpeechFactory> speech_;
};

// Register the plugins shipped with the runtime
void register_builtin_components(ComponentRegistry &registry);

}  // namespace components
}  // namespace helm
