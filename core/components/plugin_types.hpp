#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "runtime/task.hpp"

namespace helm {
namespace components {

/**
 * Plugin contracts for the collaborators a mode is assembled from.
 *
 * Sensors, reasoning backends, action connectors, simulators, backgrounds and
 * speech output are external to the mode runtime. The runtime only relies on
 * the start/stop/callback surface declared here.
 */

// Raised when a component graph cannot be built from its manifests
class ComponentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One action proposed by the reasoning backend
struct Action {
    std::string type;
    std::string value;
};

struct CortexOutput {
    std::vector<Action> actions;
};

// Outcome of an executed action, fed back into the next prompt
struct ActionResult {
    std::string action;
    std::string value;
    bool success = false;
    std::string message;
};

class Sensor {
public:
    virtual ~Sensor() = default;

    // Label used when fusing this sensor's readings into the prompt
    virtual std::string descriptor() const = 0;

    /**
     * Wait briefly for a new reading.
     *
     * Called repeatedly from the input task. Implementations must return
     * within a few hundred milliseconds and as soon as token is cancelled.
     */
    virtual std::optional<std::string> poll(const runtime::StopToken &token) = 0;

    // Readings are recognized speech that may trigger a mode transition
    virtual bool feeds_mode_transitions() const { return false; }

    // A reading should cut the current tick sleep short
    virtual bool urgent() const { return false; }
};

class LLM {
public:
    virtual ~LLM() = default;
    virtual std::optional<CortexOutput> ask(const std::string &prompt) = 0;
};

class ActionConnector {
public:
    virtual ~ActionConnector() = default;
    virtual void connect(const nlohmann::json &input) = 0;
};

struct AgentAction {
    std::string name;
    std::string llm_label;
    std::shared_ptr<ActionConnector> connector;
};

class Simulator {
public:
    virtual ~Simulator() = default;
    virtual std::string name() const = 0;
    virtual void sim(const std::vector<Action> &actions) = 0;
};

class Background {
public:
    virtual ~Background() = default;
    virtual std::string name() const = 0;
    virtual std::chrono::milliseconds interval() const = 0;
    virtual void tick() = 0;
};

class TextToSpeech {
public:
    virtual ~TextToSpeech() = default;
    virtual void add_pending_message(const std::string &text) = 0;
};

}  // namespace components
}  // namespace helm
