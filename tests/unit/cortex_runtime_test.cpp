/**
 * cortex_runtime_test.cpp - ModeCortexRuntime supervision tests
 *
 * Tests:
 * - Startup builds the initial graph and runs startup (not entry) hooks
 * - Transitions tear down and rebuild the component graph
 * - Tick flow: fuse, transition check, LLM, action dispatch
 * - A mode that cannot be built is fatal
 * - Shutdown hooks, idempotent shutdown, run()/stop() from another thread
 */

#include "runtime/cortex_runtime.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "hooks/hook_function_registry.hpp"
#include "mocks/mock_plugins.hpp"

using namespace helm::runtime;
using helm::components::Action;
using helm::components::ActionManifest;
using helm::components::ComponentManifest;
using helm::components::CortexOutput;
using helm::hooks::HookType;
using helm::modes::ModeDefinition;
using helm::modes::TransitionRule;
using helm::modes::TransitionType;
using helm::tests::CallTrace;
using helm::tests::function_hook;
using helm::tests::ScriptedSensor;

namespace {

bool wait_until(const std::function<bool()> &condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// LLM that records prompts and answers every prompt with the configured reply
class ScriptedLLM : public helm::components::LLM {
public:
    ScriptedLLM(std::string reply, std::vector<std::string> &prompts, std::mutex &mutex)
        : reply_(std::move(reply)), prompts_(prompts), mutex_(mutex) {}

    std::optional<CortexOutput> ask(const std::string &prompt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts_.push_back(prompt);
        if (reply_.empty()) {
            return std::nullopt;
        }
        CortexOutput output;
        output.actions.push_back(Action{"speak", reply_});
        return output;
    }

private:
    std::string reply_;
    std::vector<std::string> &prompts_;
    std::mutex &mutex_;
};

class RecordingConnector : public helm::components::ActionConnector {
public:
    RecordingConnector(std::vector<nlohmann::json> &calls, std::mutex &mutex) : calls_(calls), mutex_(mutex) {}

    void connect(const nlohmann::json &input) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(input);
    }

private:
    std::vector<nlohmann::json> &calls_;
    std::mutex &mutex_;
};

ModeDefinition make_mode(const std::string &name) {
    ModeDefinition mode;
    mode.name = name;
    mode.display_name = name + " mode";
    mode.description = "The " + name + " mode";
    mode.system_prompt_base = "You are in " + name + " mode.";
    mode.hertz = 50.0;
    mode.manifests.inputs.push_back(ComponentManifest{"script", {{"descriptor", "Voice"}}});
    mode.manifests.llm = ComponentManifest{"scripted", {{"reply", "hello from " + name}}};
    mode.manifests.actions.push_back(ActionManifest{"speak", "speak", "record", nlohmann::json::object()});
    return mode;
}

}  // namespace

/**
 * Test Fixture: CortexRuntimeTest
 *
 * Modes home, patrol, emergency and broken. Anything says "help" to reach
 * emergency; broken has a sensor whose factory always fails.
 */
class CortexRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.register_sensor("script", [this](const helm::components::PluginContext &context) {
            auto sensor = std::make_shared<ScriptedSensor>(context.config.value("descriptor", "Voice"), true);
            std::lock_guard<std::mutex> lock(mutex_);
            sensors_.push_back(sensor);
            return sensor;
        });
        registry_.register_sensor("broken", [](const helm::components::PluginContext &)
                                                -> std::shared_ptr<helm::components::Sensor> {
            throw std::runtime_error("camera not found");
        });
        registry_.register_llm("scripted", [this](const helm::components::PluginContext &context,
                                                  const std::vector<helm::components::AgentAction> &) {
            return std::make_shared<ScriptedLLM>(context.config.value("reply", ""), prompts_, mutex_);
        });
        registry_.register_connector("record", [this](const helm::components::PluginContext &) {
            return std::make_shared<RecordingConnector>(connector_calls_, mutex_);
        });

        config_.name = "test_robot";
        config_.default_mode = "home";
        config_.mode_memory_enabled = false;
        config_.modes["home"] = make_mode("home");
        config_.modes["patrol"] = make_mode("patrol");
        config_.modes["emergency"] = make_mode("emergency");
        config_.modes["broken"] = make_mode("broken");
        config_.modes["broken"].manifests.inputs[0].type = "broken";

        TransitionRule help;
        help.from_mode = helm::modes::kAnyMode;
        help.to_mode = "emergency";
        help.transition_type = TransitionType::INPUT_TRIGGERED;
        help.trigger_keywords = {"help"};
        help.priority = 10;
        config_.transition_rules.push_back(help);

        for (const char *name : {"global_startup", "home_startup", "home_entry", "home_shutdown",
                                 "global_shutdown", "emergency_entry"}) {
            trace_.register_recorder(functions_, name);
        }
        config_.global_lifecycle_hooks.push_back(function_hook(HookType::ON_STARTUP, "global_startup"));
        config_.global_lifecycle_hooks.push_back(function_hook(HookType::ON_SHUTDOWN, "global_shutdown"));
        config_.modes["home"].lifecycle_hooks.push_back(function_hook(HookType::ON_STARTUP, "home_startup"));
        config_.modes["home"].lifecycle_hooks.push_back(function_hook(HookType::ON_ENTRY, "home_entry"));
        config_.modes["home"].lifecycle_hooks.push_back(function_hook(HookType::ON_SHUTDOWN, "home_shutdown"));
        config_.modes["emergency"].lifecycle_hooks.push_back(function_hook(HookType::ON_ENTRY, "emergency_entry"));

        services_.components = &registry_;
        services_.hooks.functions = &functions_;
    }

    std::unique_ptr<ModeCortexRuntime> make_runtime() {
        return std::make_unique<ModeCortexRuntime>(config_, services_);
    }

    std::vector<std::string> prompts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

    std::vector<nlohmann::json> connector_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return connector_calls_;
    }

    std::shared_ptr<ScriptedSensor> latest_sensor() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sensors_.empty() ? nullptr : sensors_.back();
    }

    size_t sensor_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sensors_.size();
    }

    bool traced(const std::string &entry) const {
        auto entries = trace_.entries();
        return std::find(entries.begin(), entries.end(), entry) != entries.end();
    }

    helm::components::ComponentRegistry registry_;
    helm::hooks::HookFunctionRegistry functions_;
    helm::modes::ModeSystemConfig config_;
    CortexServices services_;
    CallTrace trace_;

    std::mutex mutex_;
    std::vector<std::shared_ptr<ScriptedSensor>> sensors_;
    std::vector<std::string> prompts_;
    std::vector<nlohmann::json> connector_calls_;
};

/******************************************************************************
 * Startup and shutdown
 ******************************************************************************/

TEST_F(CortexRuntimeTest, RejectsUnknownDefaultMode) {
    config_.default_mode = "nowhere";
    EXPECT_THROW(make_runtime(), std::invalid_argument);
}

TEST_F(CortexRuntimeTest, StartupBuildsInitialGraph) {
    auto runtime = make_runtime();
    EXPECT_EQ(runtime->activation_count(), 0u);

    runtime->startup();

    EXPECT_EQ(runtime->activation_count(), 1u);
    EXPECT_EQ(runtime->live_task_count(), 4u);
    EXPECT_EQ(runtime->current_components().inputs.size(), 1u);
    ASSERT_EQ(runtime->current_components().actions.size(), 1u);
    EXPECT_EQ(runtime->current_components().actions[0].llm_label, "speak");
    EXPECT_EQ(trace_.entries(), (std::vector<std::string>{"global_startup", "home_startup"}));
    EXPECT_FALSE(traced("home_entry"));

    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, StartupIsIdempotent) {
    auto runtime = make_runtime();
    runtime->startup();
    runtime->startup();

    EXPECT_EQ(runtime->activation_count(), 1u);
    EXPECT_EQ(runtime->live_task_count(), 4u);
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, ShutdownRunsHooksOnceAndClosesLoop) {
    auto runtime = make_runtime();
    runtime->startup();
    trace_.clear();

    runtime->shutdown();
    runtime->shutdown();

    EXPECT_EQ(trace_.entries(), (std::vector<std::string>{"home_shutdown", "global_shutdown"}));
    EXPECT_EQ(runtime->live_task_count(), 0u);
    EXPECT_TRUE(runtime->event_loop().is_closed());
    EXPECT_FALSE(runtime->event_loop().post([]() {}));
}

TEST_F(CortexRuntimeTest, ShutdownWithoutStartupSkipsHooks) {
    auto runtime = make_runtime();
    runtime->shutdown();

    EXPECT_TRUE(trace_.entries().empty());
    EXPECT_TRUE(runtime->event_loop().is_closed());
}

TEST_F(CortexRuntimeTest, FailingInitialModeThrowsFromStartup) {
    config_.default_mode = "broken";
    auto runtime = make_runtime();

    EXPECT_THROW(runtime->startup(), helm::components::ComponentError);
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, ModeThatNeverStartedGetsNoShutdownHooks) {
    config_.modes["home"].manifests.inputs[0].type = "broken";
    auto runtime = make_runtime();

    EXPECT_THROW(runtime->startup(), helm::components::ComponentError);
    runtime->shutdown();

    EXPECT_EQ(trace_.entries(), (std::vector<std::string>{"global_startup", "global_shutdown"}));
}

/******************************************************************************
 * Transitions
 ******************************************************************************/

TEST_F(CortexRuntimeTest, TransitionRebuildsGraph) {
    auto runtime = make_runtime();
    runtime->startup();
    auto old_sensor = runtime->current_components().inputs[0];

    EXPECT_TRUE(runtime->request_mode_change("patrol"));

    EXPECT_EQ(runtime->mode_manager().current_mode_name(), "patrol");
    EXPECT_EQ(runtime->activation_count(), 2u);
    EXPECT_EQ(runtime->live_task_count(), 4u);
    EXPECT_EQ(sensor_count(), 2u);
    EXPECT_NE(runtime->current_components().inputs[0], old_sensor);
    EXPECT_FALSE(runtime->has_fatal_error());

    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, OldInputsAreQuietAfterTransition) {
    auto runtime = make_runtime();
    runtime->startup();
    auto old_sensor = latest_sensor();
    ASSERT_TRUE(wait_until([&]() { return old_sensor->polls() > 0; }));

    ASSERT_TRUE(runtime->request_mode_change("patrol"));
    int polls_after_switch = old_sensor->polls();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(old_sensor->polls(), polls_after_switch);
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, UndrainedReadingsDoNotReachNextMode) {
    auto runtime = make_runtime();
    runtime->startup();

    runtime->io_provider().add_input("Voice", "stale reading from home");
    ASSERT_TRUE(runtime->request_mode_change("patrol"));
    runtime->tick();

    for (const auto &prompt : prompts()) {
        EXPECT_EQ(prompt.find("stale reading from home"), std::string::npos) << prompt;
    }
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, PendingTransitionTextDoesNotFollowManualSwitch) {
    auto runtime = make_runtime();
    runtime->startup();

    runtime->io_provider().set_mode_transition_input("help");
    ASSERT_TRUE(runtime->request_mode_change("patrol"));

    runtime->io_provider().add_input("Battery", "80%");
    runtime->tick();

    EXPECT_EQ(runtime->mode_manager().current_mode_name(), "patrol");
    EXPECT_FALSE(traced("emergency_entry"));
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, UnknownModeRequestIsRejected) {
    auto runtime = make_runtime();
    runtime->startup();

    EXPECT_FALSE(runtime->request_mode_change("nowhere"));
    EXPECT_EQ(runtime->activation_count(), 1u);
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, FailedModeBuildIsFatal) {
    auto runtime = make_runtime();
    runtime->startup();

    // The manager has committed the transition; the runtime cannot honour it
    EXPECT_TRUE(runtime->request_mode_change("broken"));

    EXPECT_TRUE(runtime->has_fatal_error());
    EXPECT_EQ(runtime->live_task_count(), 0u);
    EXPECT_TRUE(runtime->current_components().inputs.empty());

    // Ticks are refused once the runtime is broken
    runtime->io_provider().add_input("Voice", "hello");
    runtime->tick();
    EXPECT_TRUE(prompts().empty());

    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, AvailableModesMarkCurrent) {
    auto runtime = make_runtime();
    auto modes = runtime->get_available_modes();

    ASSERT_EQ(modes.size(), 4u);
    EXPECT_EQ(modes["home"]["display_name"], "home mode");
    EXPECT_EQ(modes["home"]["description"], "The home mode");
    EXPECT_TRUE(modes["home"]["is_current"].get<bool>());
    EXPECT_FALSE(modes["patrol"]["is_current"].get<bool>());
}

/******************************************************************************
 * Tick
 ******************************************************************************/

TEST_F(CortexRuntimeTest, TickWithoutInputDoesNothing) {
    auto runtime = make_runtime();
    runtime->startup();

    runtime->tick();

    EXPECT_TRUE(prompts().empty());
    EXPECT_EQ(runtime->mode_manager().current_mode_name(), "home");
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, TickBeforeStartupIsSkipped) {
    auto runtime = make_runtime();
    runtime->io_provider().add_input("Voice", "hello");

    EXPECT_NO_THROW(runtime->tick());
    EXPECT_TRUE(prompts().empty());
}

TEST_F(CortexRuntimeTest, TickSendsPromptAndDispatchesActions) {
    auto runtime = make_runtime();
    runtime->startup();

    runtime->io_provider().add_input("Voice", "good morning");
    runtime->tick();

    auto asked = prompts();
    ASSERT_EQ(asked.size(), 1u);
    EXPECT_NE(asked[0].find("You are in home mode."), std::string::npos);
    EXPECT_NE(asked[0].find("// Voice\ngood morning"), std::string::npos);

    ASSERT_TRUE(wait_until([&]() { return !connector_calls().empty(); }));
    EXPECT_EQ(connector_calls()[0], nlohmann::json({{"action", "speak"}, {"value", "hello from home"}}));

    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, TransitionInputSwitchesModeWithoutAskingLLM) {
    auto runtime = make_runtime();
    runtime->startup();

    runtime->io_provider().add_input("Voice", "HELP me please");
    runtime->io_provider().set_mode_transition_input("HELP me please");
    runtime->tick();

    EXPECT_EQ(runtime->mode_manager().current_mode_name(), "emergency");
    EXPECT_TRUE(traced("emergency_entry"));
    EXPECT_TRUE(prompts().empty());
    EXPECT_EQ(runtime->activation_count(), 2u);

    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, NonMatchingInputFallsThroughToLLM) {
    auto runtime = make_runtime();
    runtime->startup();

    runtime->io_provider().add_input("Voice", "what a nice day");
    runtime->io_provider().set_mode_transition_input("what a nice day");
    runtime->tick();

    EXPECT_EQ(runtime->mode_manager().current_mode_name(), "home");
    EXPECT_EQ(prompts().size(), 1u);
    runtime->shutdown();
}

TEST_F(CortexRuntimeTest, EmptyLLMReplyDispatchesNothing) {
    config_.modes["home"].manifests.llm = ComponentManifest{"scripted", {{"reply", ""}}};
    auto runtime = make_runtime();
    runtime->startup();

    runtime->io_provider().add_input("Voice", "anyone there?");
    runtime->tick();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(prompts().size(), 1u);
    EXPECT_TRUE(connector_calls().empty());
    runtime->shutdown();
}

/******************************************************************************
 * run() / stop()
 ******************************************************************************/

TEST_F(CortexRuntimeTest, RunUntilStopped) {
    auto runtime = make_runtime();
    std::thread loop([&]() { runtime->run(); });

    ASSERT_TRUE(wait_until([&]() { return traced("home_startup"); }));
    runtime->stop();
    loop.join();

    EXPECT_TRUE(traced("home_shutdown"));
    EXPECT_TRUE(traced("global_shutdown"));
    EXPECT_TRUE(runtime->event_loop().is_closed());
}

TEST_F(CortexRuntimeTest, SensorInputDrivesTransitionWhileRunning) {
    auto runtime = make_runtime();
    std::thread loop([&]() { runtime->run(); });

    ASSERT_TRUE(wait_until([&]() { return sensor_count() == 1; }));
    auto voice = latest_sensor();

    // A reading drained on the tick before its transition text lands is only
    // seen by the LLM, so keep talking until the switch happens
    EXPECT_TRUE(wait_until([&]() {
        if (traced("emergency_entry")) {
            return true;
        }
        voice->push("help!");
        return false;
    }));

    runtime->stop();
    loop.join();
    EXPECT_EQ(runtime->mode_manager().current_mode_name(), "emergency");
}

TEST_F(CortexRuntimeTest, RunRethrowsStartupFailure) {
    config_.default_mode = "broken";
    auto runtime = make_runtime();

    EXPECT_THROW(runtime->run(), helm::components::ComponentError);
    EXPECT_TRUE(runtime->event_loop().is_closed());
}

TEST_F(CortexRuntimeTest, PostedWorkRunsOnLoopThread) {
    auto runtime = make_runtime();
    std::atomic<bool> ran{false};
    std::thread loop([&]() { runtime->run(); });

    ASSERT_TRUE(wait_until([&]() { return traced("home_startup"); }));
    ASSERT_TRUE(runtime->event_loop().post([&]() {
        if (runtime->event_loop().in_loop_thread()) {
            ran = true;
        }
    }));

    EXPECT_TRUE(wait_until([&]() { return ran.load(); }));
    runtime->stop();
    loop.join();
}
