/**
 * hook_handlers_test.cpp - The four hook handler kinds
 *
 * Tests:
 * - message: template formatting and speech output
 * - command: exit status decides success
 * - function: registry lookup and result mapping
 * - action: connector built once, fed input_data
 * - create_hook_handler dispatch
 */

#include "hooks/hook_handlers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "components/component_registry.hpp"
#include "hooks/hook_function_registry.hpp"
#include "mocks/mock_plugins.hpp"

using namespace helm;
using namespace helm::hooks;
using helm::tests::MockActionConnector;
using helm::tests::MockTextToSpeech;
using ::testing::_;
using ::testing::Throw;

namespace {

SpeechProvider provide(std::shared_ptr<components::TextToSpeech> speech) {
    return [speech]() { return speech; };
}

}  // namespace

/******************************************************************************
 * MessageHookHandler
 ******************************************************************************/

TEST(MessageHookHandlerTest, FormatsAndSpeaks) {
    auto speech = std::make_shared<MockTextToSpeech>();
    EXPECT_CALL(*speech, add_pending_message("Entering Patrol mode"));

    MessageHookHandler handler({{"message", "Entering {mode_display_name} mode"}}, provide(speech));
    EXPECT_TRUE(handler.execute({{"mode_display_name", "Patrol"}}, runtime::StopToken()));
}

TEST(MessageHookHandlerTest, MissingContextKeyFails) {
    auto speech = std::make_shared<MockTextToSpeech>();
    EXPECT_CALL(*speech, add_pending_message(_)).Times(0);

    MessageHookHandler handler({{"message", "Hello {nobody}"}}, provide(speech));
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST(MessageHookHandlerTest, EmptyMessageSucceedsSilently) {
    auto speech = std::make_shared<MockTextToSpeech>();
    EXPECT_CALL(*speech, add_pending_message(_)).Times(0);

    MessageHookHandler handler(nlohmann::json::object(), provide(speech));
    EXPECT_TRUE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST(MessageHookHandlerTest, SpeechFailureFails) {
    auto speech = std::make_shared<MockTextToSpeech>();
    EXPECT_CALL(*speech, add_pending_message(_)).WillOnce(Throw(std::runtime_error("speaker unplugged")));

    MessageHookHandler handler({{"message", "hi"}}, provide(speech));
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST(MessageHookHandlerTest, MissingSpeechOutputFails) {
    MessageHookHandler handler({{"message", "hi"}}, nullptr);
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

/******************************************************************************
 * CommandHookHandler
 ******************************************************************************/

TEST(CommandHookHandlerTest, ZeroExitSucceeds) {
    CommandHookHandler handler(nlohmann::json{{"command", "true"}});
    EXPECT_TRUE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST(CommandHookHandlerTest, NonZeroExitFails) {
    CommandHookHandler handler(nlohmann::json{{"command", "exit 3"}});
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST(CommandHookHandlerTest, CommandIsFormattedWithContext) {
    CommandHookHandler handler(nlohmann::json{{"command", "test {mode_name} = patrol"}});
    EXPECT_TRUE(handler.execute({{"mode_name", "patrol"}}, runtime::StopToken()));
    EXPECT_FALSE(handler.execute({{"mode_name", "idle"}}, runtime::StopToken()));
}

TEST(CommandHookHandlerTest, MissingCommandFails) {
    CommandHookHandler handler(nlohmann::json::object());
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

/******************************************************************************
 * FunctionHookHandler
 ******************************************************************************/

class FunctionHookHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        functions_.register_function("robot", "ok", [](const nlohmann::json &, const runtime::StopToken &) {
            return std::optional<bool>(true);
        });
        functions_.register_function("robot", "nothing", [](const nlohmann::json &, const runtime::StopToken &) {
            return std::optional<bool>();
        });
        functions_.register_function("robot", "refuse", [](const nlohmann::json &, const runtime::StopToken &) {
            return std::optional<bool>(false);
        });
        functions_.register_function("robot", "explode",
                                     [](const nlohmann::json &, const runtime::StopToken &) -> std::optional<bool> {
                                         throw std::runtime_error("kaboom");
                                     });
    }

    bool run(const std::string &module_name, const std::string &function) {
        FunctionHookHandler handler({{"module_name", module_name}, {"function", function}}, &functions_);
        return handler.execute(nlohmann::json::object(), runtime::StopToken());
    }

    HookFunctionRegistry functions_;
};

TEST_F(FunctionHookHandlerTest, TrueAndNoResultSucceed) {
    EXPECT_TRUE(run("robot", "ok"));
    EXPECT_TRUE(run("robot", "nothing"));
}

TEST_F(FunctionHookHandlerTest, FalseAndExceptionsFail) {
    EXPECT_FALSE(run("robot", "refuse"));
    EXPECT_FALSE(run("robot", "explode"));
}

TEST_F(FunctionHookHandlerTest, UnknownModuleOrFunctionFails) {
    EXPECT_FALSE(run("vacuum", "ok"));
    EXPECT_FALSE(run("robot", "dance"));
}

TEST_F(FunctionHookHandlerTest, MissingNamesFail) {
    FunctionHookHandler no_module({{"function", "ok"}}, &functions_);
    EXPECT_FALSE(no_module.execute(nlohmann::json::object(), runtime::StopToken()));

    FunctionHookHandler no_function({{"module_name", "robot"}}, &functions_);
    EXPECT_FALSE(no_function.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST_F(FunctionHookHandlerTest, ReceivesContext) {
    std::string seen;
    functions_.register_function("robot", "capture",
                                 [&seen](const nlohmann::json &context, const runtime::StopToken &) {
                                     seen = context.value("map_name", "");
                                     return std::optional<bool>(true);
                                 });

    FunctionHookHandler handler({{"module_name", "robot"}, {"function", "capture"}}, &functions_);
    EXPECT_TRUE(handler.execute({{"map_name", "lobby"}}, runtime::StopToken()));
    EXPECT_EQ(seen, "lobby");
}

/******************************************************************************
 * ActionHookHandler
 ******************************************************************************/

class ActionHookHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        connector_ = std::make_shared<MockActionConnector>();
        registry_.register_connector("recording", [this](const components::PluginContext &context) {
            factory_calls_++;
            last_config_ = context.config;
            return connector_;
        });
    }

    components::ComponentRegistry registry_;
    std::shared_ptr<MockActionConnector> connector_;
    int factory_calls_ = 0;
    nlohmann::json last_config_;
};

TEST_F(ActionHookHandlerTest, BuildsConnectorOnceAndPassesInputData) {
    EXPECT_CALL(*connector_, connect(nlohmann::json("go home"))).Times(2);

    ActionHookHandler handler({{"action_type", "recording"}, {"action_config", {{"speed", 2}}}}, &registry_,
                              nullptr);
    EXPECT_TRUE(handler.execute({{"input_data", "go home"}}, runtime::StopToken()));
    EXPECT_TRUE(handler.execute({{"input_data", "go home"}}, runtime::StopToken()));

    EXPECT_EQ(factory_calls_, 1);
    EXPECT_EQ(last_config_["speed"], 2);
}

TEST_F(ActionHookHandlerTest, MissingInputDataPassesNull) {
    EXPECT_CALL(*connector_, connect(nlohmann::json()));

    ActionHookHandler handler({{"action_type", "recording"}}, &registry_, nullptr);
    EXPECT_TRUE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST_F(ActionHookHandlerTest, UnknownActionTypeFails) {
    ActionHookHandler handler({{"action_type", "teleport"}}, &registry_, nullptr);
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

TEST_F(ActionHookHandlerTest, ConnectorErrorFails) {
    EXPECT_CALL(*connector_, connect(_)).WillOnce(Throw(std::runtime_error("motor stalled")));

    ActionHookHandler handler({{"action_type", "recording"}}, &registry_, nullptr);
    EXPECT_FALSE(handler.execute(nlohmann::json::object(), runtime::StopToken()));
}

/******************************************************************************
 * Factory
 ******************************************************************************/

TEST(CreateHookHandlerTest, DispatchesCaseInsensitively) {
    HookServices services;

    LifecycleHook hook;
    hook.handler_type = "Message";
    EXPECT_NE(std::dynamic_pointer_cast<MessageHookHandler>(create_hook_handler(hook, services)), nullptr);

    hook.handler_type = "COMMAND";
    EXPECT_NE(std::dynamic_pointer_cast<CommandHookHandler>(create_hook_handler(hook, services)), nullptr);

    hook.handler_type = "function";
    EXPECT_NE(std::dynamic_pointer_cast<FunctionHookHandler>(create_hook_handler(hook, services)), nullptr);

    hook.handler_type = "action";
    EXPECT_NE(std::dynamic_pointer_cast<ActionHookHandler>(create_hook_handler(hook, services)), nullptr);
}

TEST(CreateHookHandlerTest, UnknownTypeReturnsNull) {
    LifecycleHook hook;
    hook.handler_type = "telegram";
    EXPECT_EQ(create_hook_handler(hook, HookServices()), nullptr);
}
