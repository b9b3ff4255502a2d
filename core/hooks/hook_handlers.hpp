#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "components/plugin_types.hpp"
#include "hooks/lifecycle_hook.hpp"
#include "runtime/task.hpp"

namespace helm {
namespace hooks {

/**
 * HookHandler - one kind of hook side effect.
 *
 * execute() returns true on success. Long-running handlers should watch the
 * token; it is cancelled when the hook times out.
 */
class HookHandler {
public:
    virtual ~HookHandler() = default;
    virtual bool execute(const nlohmann::json &context, const runtime::StopToken &token) = 0;
};

/**
 * Formats handler_config.message with the context and hands it to speech.
 * An empty message succeeds without doing anything.
 */
class MessageHookHandler : public HookHandler {
public:
    MessageHookHandler(nlohmann::json config, SpeechProvider speech);
    bool execute(const nlohmann::json &context, const runtime::StopToken &token) override;

private:
    nlohmann::json config_;
    SpeechProvider speech_;
};

/**
 * Formats handler_config.command with the context and runs it with /bin/sh.
 * Success means exit status 0.
 */
class CommandHookHandler : public HookHandler {
public:
    explicit CommandHookHandler(nlohmann::json config);
    bool execute(const nlohmann::json &context, const runtime::StopToken &token) override;

private:
    nlohmann::json config_;
};

/**
 * Calls a compiled-in function looked up by handler_config.module_name and
 * handler_config.function.
 */
class FunctionHookHandler : public HookHandler {
public:
    FunctionHookHandler(nlohmann::json config, const HookFunctionRegistry *functions);
    bool execute(const nlohmann::json &context, const runtime::StopToken &token) override;

private:
    nlohmann::json config_;
    const HookFunctionRegistry *functions_;
};

/**
 * Builds the action connector named by handler_config.action_type on first
 * use and passes context["input_data"] to it on every execution.
 */
class ActionHookHandler : public HookHandler {
public:
    ActionHookHandler(nlohmann::json config, const components::ComponentRegistry *registry, SpeechProvider speech);
    bool execute(const nlohmann::json &context, const runtime::StopToken &token) override;

private:
    nlohmann::json config_;
    const components::ComponentRegistry *registry_;
    SpeechProvider speech_;

    std::mutex mutex_;
    std::shared_ptr<components::ActionConnector> connector_;
};

/**
 * Create the handler for hook.handler_type (case-insensitive).
 *
 * @return nullptr for unknown handler types
 */
std::shared_ptr<HookHandler> create_hook_handler(const LifecycleHook &hook, const HookServices &services);

}  // namespace hooks
}  // namespace helm
