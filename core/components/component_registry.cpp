#include "components/component_registry.hpp"

#include "logging/logger.hpp"

namespace helm {
namespace components {

namespace {

template <typename Factory>
bool add_factory(std::map<std::string, Factory> &factories, const char *kind, const std::string &type,
                 Factory factory) {
    if (type.empty() || !factory) {
        LOG_ERROR("[Components] Refusing empty " << kind << " registration");
        return false;
    }
    if (!factories.emplace(type, std::move(factory)).second) {
        LOG_WARN("[Components] Duplicate " << kind << " type: " << type);
        return false;
    }
    LOG_DEBUG("[Components] Registered " << kind << " '" << type << "'");
    return true;
}

template <typename Factory>
const Factory &find_factory(const std::map<std::string, Factory> &factories, const char *kind,
                            const std::string &type) {
    auto it = factories.find(type);
    if (it == factories.end()) {
        throw ComponentError(std::string("Unknown ") + kind + " type: " + type);
    }
    return it->second;
}

// Factories may throw anything derived from std::exception; normalize to ComponentError
template <typename Result, typename Call>
Result checked_create(const char *kind, const std::string &type, Call call) {
    Result result;
    try {
        result = call();
    } catch (const ComponentError &) {
        throw;
    } catch (const std::exception &e) {
        throw ComponentError(std::string("Failed to create ") + kind + " '" + type + "': " + e.what());
    }
    if (!result) {
        throw ComponentError(std::string("Factory for ") + kind + " '" + type + "' returned nothing");
    }
    return result;
}

}  // namespace

bool ComponentRegistry::register_sensor(const std::string &type, SensorFactory factory) {
    return add_factory(sensors_, "input", type, std::move(factory));
}

bool ComponentRegistry::register_llm(const std::string &type, LLMFactory factory) {
    return add_factory(llms_, "LLM", type, std::move(factory));
}

bool ComponentRegistry::register_connector(const std::string &type, ConnectorFactory factory) {
    return add_factory(connectors_, "action connector", type, std::move(factory));
}

bool ComponentRegistry::register_simulator(const std::string &type, SimulatorFactory factory) {
    return add_factory(simulators_, "simulator", type, std::move(factory));
}

bool ComponentRegistry::register_background(const std::string &type, BackgroundFactory factory) {
    return add_factory(backgrounds_, "background", type, std::move(factory));
}

bool ComponentRegistry::register_speech(const std::string &type, SpeechFactory factory) {
    return add_factory(speech_, "speech", type, std::move(factory));
}

std::shared_ptr<Sensor> ComponentRegistry::create_sensor(const std::string &type,
                                                         const PluginContext &context) const {
    const auto &factory = find_factory(sensors_, "input", type);
    return checked_create<std::shared_ptr<Sensor>>("input", type, [&] { return factory(context); });
}

std::shared_ptr<LLM> ComponentRegistry::create_llm(const std::string &type, const PluginContext &context,
                                                   const std::vector<AgentAction> &available_actions) const {
    const auto &factory = find_factory(llms_, "LLM", type);
    return checked_create<std::shared_ptr<LLM>>("LLM", type, [&] { return factory(context, available_actions); });
}

std::shared_ptr<ActionConnector> ComponentRegistry::create_connector(const std::string &type,
                                                                     const PluginContext &context) const {
    const auto &factory = find_factory(connectors_, "action connector", type);
    return checked_create<std::shared_ptr<ActionConnector>>("action connector", type,
                                                            [&] { return factory(context); });
}

std::shared_ptr<Simulator> ComponentRegistry::create_simulator(const std::string &type,
                                                               const PluginContext &context) const {
    const auto &factory = find_factory(simulators_, "simulator", type);
    return checked_create<std::shared_ptr<Simulator>>("simulator", type, [&] { return factory(context); });
}

std::shared_ptr<Background> ComponentRegistry::create_background(const std::string &type,
                                                                 const PluginContext &context) const {
    const auto &factory = find_factory(backgrounds_, "background", type);
    return checked_create<std::shared_ptr<Background>>("background", type, [&] { return factory(context); });
}

std::shared_ptr<TextToSpeech> ComponentRegistry::create_speech(const std::string &type,
                                                               const PluginContext &context) const {
    const auto &factory = find_factory(speech_, "speech", type);
    return checked_create<std::shared_ptr<TextToSpeech>>("speech", type, [&] { return factory(context); });
}

}  // namespace components
}  // namespace helm
