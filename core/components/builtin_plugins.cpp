#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

#include "components/component_registry.hpp"
#include "logging/logger.hpp"

namespace helm {
namespace components {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kSensorPollSlice{100};

std::string require_string(const nlohmann::json &config, const char *key) {
    if (!config.contains(key) || !config[key].is_string() || config[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string("missing required config key '") + key + "'");
    }
    return config[key].get<std::string>();
}

std::chrono::milliseconds interval_from(const nlohmann::json &config, const char *key, int default_ms) {
    int ms = config.value(key, default_ms);
    if (ms <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
    return std::chrono::milliseconds(ms);
}

/******************************************************************************
 * Inputs
 ******************************************************************************/

// Emits a fixed text every interval_ms (or once with repeat: false)
class StaticTextSensor : public Sensor {
public:
    explicit StaticTextSensor(const nlohmann::json &config)
        : text_(require_string(config, "text")),
          descriptor_(config.value("descriptor", std::string("Static text"))),
          interval_(interval_from(config, "interval_ms", 1000)),
          repeat_(config.value("repeat", true)),
          transitions_(config.value("transitions", false)),
          urgent_(config.value("urgent", false)),
          next_due_(Clock::now()) {}

    std::string descriptor() const override { return descriptor_; }

    std::optional<std::string> poll(const runtime::StopToken &token) override {
        if (exhausted_) {
            token.wait_for(kSensorPollSlice);
            return std::nullopt;
        }

        auto now = Clock::now();
        if (now < next_due_) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next_due_ - now);
            if (token.wait_for(std::min(remaining, kSensorPollSlice)) || Clock::now() < next_due_) {
                return std::nullopt;
            }
        }

        next_due_ = Clock::now() + interval_;
        exhausted_ = !repeat_;
        return text_;
    }

    bool feeds_mode_transitions() const override { return transitions_; }
    bool urgent() const override { return urgent_; }

private:
    std::string text_;
    std::string descriptor_;
    std::chrono::milliseconds interval_;
    bool repeat_;
    bool transitions_;
    bool urgent_;
    Clock::time_point next_due_;
    bool exhausted_ = false;
};

/**
 * Tails a text file and reports each newly completed line.
 *
 * Used for transcripts written by an external speech recognizer, so it feeds
 * mode transitions by default. A file that shrinks is read from the start.
 */
class FileTextSensor : public Sensor {
public:
    explicit FileTextSensor(const nlohmann::json &config)
        : path_(require_string(config, "path")),
          descriptor_(config.value("descriptor", std::string("Voice"))),
          transitions_(config.value("transitions", true)),
          urgent_(config.value("urgent", true)) {
        // Only lines written after startup count
        std::ifstream in(path_, std::ios::binary | std::ios::ate);
        if (in) {
            offset_ = static_cast<std::streamoff>(in.tellg());
        }
    }

    std::string descriptor() const override { return descriptor_; }

    std::optional<std::string> poll(const runtime::StopToken &token) override {
        auto line = read_new_line();
        if (!line) {
            token.wait_for(kSensorPollSlice);
        }
        return line;
    }

    bool feeds_mode_transitions() const override { return transitions_; }
    bool urgent() const override { return urgent_; }

private:
    std::optional<std::string> read_new_line() {
        std::ifstream in(path_, std::ios::binary | std::ios::ate);
        if (!in) {
            return std::nullopt;
        }
        std::streamoff size = static_cast<std::streamoff>(in.tellg());
        if (size < offset_) {
            offset_ = 0;
            partial_.clear();
        }
        if (size == offset_) {
            return std::nullopt;
        }

        in.seekg(offset_);
        std::string chunk(static_cast<size_t>(size - offset_), '\0');
        in.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
        offset_ = size;
        partial_ += chunk;

        std::optional<std::string> latest;
        size_t newline;
        while ((newline = partial_.find('\n')) != std::string::npos) {
            std::string line = partial_.substr(0, newline);
            partial_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                latest = line;
            }
        }
        return latest;
    }

    std::string path_;
    std::string descriptor_;
    bool transitions_;
    bool urgent_;
    std::streamoff offset_ = 0;
    std::string partial_;
};

/******************************************************************************
 * Reasoning
 ******************************************************************************/

// Answers every prompt with one configured action
class EchoLLM : public LLM {
public:
    EchoLLM(const nlohmann::json &config, const std::vector<AgentAction> &available_actions)
        : action_(config.value("action", std::string("speak"))),
          reply_(config.value("reply", std::string("I am listening."))) {
        bool known = std::any_of(available_actions.begin(), available_actions.end(),
                                 [this](const AgentAction &a) { return a.llm_label == action_; });
        if (!known) {
            LOG_WARN("[EchoLLM] Action '" << action_ << "' is not offered by the current mode");
        }
    }

    std::optional<CortexOutput> ask(const std::string &prompt) override {
        LOG_DEBUG("[EchoLLM] Prompt:\n" << prompt);
        CortexOutput output;
        output.actions.push_back(Action{action_, reply_});
        return output;
    }

private:
    std::string action_;
    std::string reply_;
};

/******************************************************************************
 * Action connectors
 ******************************************************************************/

class LogConnector : public ActionConnector {
public:
    explicit LogConnector(const nlohmann::json &config)
        : label_(config.value("label", std::string("action"))) {}

    void connect(const nlohmann::json &input) override { LOG_INFO("[Action] " << label_ << ": " << input.dump()); }

private:
    std::string label_;
};

class SpeakConnector : public ActionConnector {
public:
    explicit SpeakConnector(std::shared_ptr<TextToSpeech> speech) : speech_(std::move(speech)) {
        if (!speech_) {
            throw std::invalid_argument("speak connector requires a speech output");
        }
    }

    void connect(const nlohmann::json &input) override {
        std::string text;
        if (input.is_string()) {
            text = input.get<std::string>();
        } else if (input.is_object() && input.contains("value") && input["value"].is_string()) {
            text = input["value"].get<std::string>();
        } else {
            text = input.dump();
        }
        speech_->add_pending_message(text);
    }

private:
    std::shared_ptr<TextToSpeech> speech_;
};

/******************************************************************************
 * Simulators, backgrounds, speech
 ******************************************************************************/

class LogSimulator : public Simulator {
public:
    std::string name() const override { return "log"; }

    void sim(const std::vector<Action> &actions) override {
        for (const auto &action : actions) {
            LOG_INFO("[Simulator] " << action.type << " -> " << action.value);
        }
    }
};

class HeartbeatBackground : public Background {
public:
    explicit HeartbeatBackground(const nlohmann::json &config)
        : interval_(interval_from(config, "interval_ms", 5000)),
          mode_(config.value("mode", std::string())) {}

    std::string name() const override { return "heartbeat"; }
    std::chrono::milliseconds interval() const override { return interval_; }

    void tick() override { LOG_INFO("[Heartbeat] Mode '" << mode_ << "' alive (" << ++beats_ << ")"); }

private:
    std::chrono::milliseconds interval_;
    std::string mode_;
    uint64_t beats_ = 0;
};

class LogSpeech : public TextToSpeech {
public:
    void add_pending_message(const std::string &text) override { LOG_INFO("[TTS] " << text); }
};

}  // namespace

void register_builtin_components(ComponentRegistry &registry) {
    registry.register_sensor("static_text",
                             [](const PluginContext &ctx) { return std::make_shared<StaticTextSensor>(ctx.config); });
    registry.register_sensor("file_text",
                             [](const PluginContext &ctx) { return std::make_shared<FileTextSensor>(ctx.config); });

    registry.register_llm("echo", [](const PluginContext &ctx, const std::vector<AgentAction> &actions) {
        return std::make_shared<EchoLLM>(ctx.config, actions);
    });

    registry.register_connector("log",
                                [](const PluginContext &ctx) { return std::make_shared<LogConnector>(ctx.config); });
    registry.register_connector("speak",
                                [](const PluginContext &ctx) { return std::make_shared<SpeakConnector>(ctx.speech); });

    registry.register_simulator("log", [](const PluginContext &) { return std::make_shared<LogSimulator>(); });

    registry.register_background(
        "heartbeat", [](const PluginContext &ctx) { return std::make_shared<HeartbeatBackground>(ctx.config); });

    registry.register_speech("log", [](const PluginContext &) { return std::make_shared<LogSpeech>(); });
}

}  // namespace components
}  // namespace helm
