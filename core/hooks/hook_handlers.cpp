#include "hooks/hook_handlers.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "components/component_registry.hpp"
#include "hooks/command_runner.hpp"
#include "hooks/hook_function_registry.hpp"
#include "hooks/template_format.hpp"
#include "logging/logger.hpp"

namespace helm {
namespace hooks {

namespace {

std::string trim(const std::string &text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string config_string(const nlohmann::json &config, const char *key) {
    if (!config.is_object() || !config.contains(key) || !config[key].is_string()) {
        return "";
    }
    return config[key].get<std::string>();
}

}  // namespace

/******************************************************************************
 * MessageHookHandler
 ******************************************************************************/

MessageHookHandler::MessageHookHandler(nlohmann::json config, SpeechProvider speech)
    : config_(std::move(config)), speech_(std::move(speech)) {}

bool MessageHookHandler::execute(const nlohmann::json &context, const runtime::StopToken &) {
    std::string message = config_string(config_, "message");
    if (message.empty()) {
        return true;
    }

    std::string formatted;
    std::string error;
    if (!format_template(message, context, formatted, error)) {
        LOG_ERROR("[Hooks] Error formatting lifecycle message: " << error);
        return false;
    }

    LOG_INFO("[Hooks] Lifecycle hook message: " << formatted);

    try {
        if (!speech_) {
            throw std::runtime_error("no speech output configured");
        }
        auto speech = speech_();
        if (!speech) {
            throw std::runtime_error("speech output unavailable");
        }
        speech->add_pending_message(formatted);
    } catch (const std::exception &e) {
        LOG_ERROR("[Hooks] Error adding TTS message: " << e.what());
        return false;
    }
    return true;
}

/******************************************************************************
 * CommandHookHandler
 ******************************************************************************/

CommandHookHandler::CommandHookHandler(nlohmann::json config) : config_(std::move(config)) {}

bool CommandHookHandler::execute(const nlohmann::json &context, const runtime::StopToken &token) {
    std::string command = config_string(config_, "command");
    if (command.empty()) {
        LOG_WARN("[Hooks] No command specified for command hook");
        return false;
    }

    std::string formatted;
    std::string error;
    if (!format_template(command, context, formatted, error)) {
        LOG_ERROR("[Hooks] Error formatting lifecycle command: " << error);
        return false;
    }

    ShellCommand shell(formatted);
    if (!shell.run(token)) {
        LOG_ERROR("[Hooks] Error executing lifecycle command: " << shell.error());
        return false;
    }

    if (shell.exit_code() != 0) {
        LOG_ERROR("[Hooks] Hook command failed with code " << shell.exit_code() << ": "
                                                           << trim(shell.error_output()));
        return false;
    }

    auto output = trim(shell.output());
    if (!output.empty()) {
        LOG_INFO("[Hooks] Hook command output: " << output);
    }
    return true;
}

/******************************************************************************
 * FunctionHookHandler
 ******************************************************************************/

FunctionHookHandler::FunctionHookHandler(nlohmann::json config, const HookFunctionRegistry *functions)
    : config_(std::move(config)), functions_(functions) {}

bool FunctionHookHandler::execute(const nlohmann::json &context, const runtime::StopToken &token) {
    std::string module_name = config_string(config_, "module_name");
    std::string function_name = config_string(config_, "function");

    if (function_name.empty()) {
        LOG_ERROR("[Hooks] No function specified for function hook");
        return false;
    }
    if (module_name.empty()) {
        LOG_ERROR("[Hooks] No module_name specified for function hook");
        return false;
    }
    if (!functions_) {
        LOG_ERROR("[Hooks] No function hooks are available");
        return false;
    }

    std::string error;
    const HookFunction *function = functions_->find(module_name, function_name, error);
    if (!function) {
        LOG_ERROR("[Hooks] " << error);
        return false;
    }

    try {
        auto result = (*function)(context, token);
        return !result.has_value() || *result;
    } catch (const std::exception &e) {
        LOG_ERROR("[Hooks] Error executing lifecycle function: " << e.what());
        return false;
    }
}

/******************************************************************************
 * ActionHookHandler
 ******************************************************************************/

ActionHookHandler::ActionHookHandler(nlohmann::json config, const components::ComponentRegistry *registry,
                                     SpeechProvider speech)
    : config_(std::move(config)), registry_(registry), speech_(std::move(speech)) {}

bool ActionHookHandler::execute(const nlohmann::json &context, const runtime::StopToken &) {
    std::shared_ptr<components::ActionConnector> connector;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connector_) {
            std::string action_type = config_string(config_, "action_type");
            if (action_type.empty()) {
                LOG_ERROR("[Hooks] No action_type specified for action hook");
                return false;
            }
            if (!registry_) {
                LOG_ERROR("[Hooks] No action connectors are available");
                return false;
            }

            try {
                components::PluginContext plugin_context;
                if (config_.contains("action_config") && config_["action_config"].is_object()) {
                    plugin_context.config = config_["action_config"];
                }
                if (speech_) {
                    plugin_context.speech = speech_();
                }
                connector_ = registry_->create_connector(action_type, plugin_context);
            } catch (const std::exception &e) {
                LOG_ERROR("[Hooks] Error loading action for lifecycle hook: " << e.what());
                return false;
            }
        }
        connector = connector_;
    }

    try {
        connector->connect(context.is_object() && context.contains("input_data") ? context["input_data"]
                                                                                 : nlohmann::json());
        return true;
    } catch (const std::exception &e) {
        LOG_ERROR("[Hooks] Error executing lifecycle action: " << e.what());
        return false;
    }
}

/******************************************************************************
 * Factory
 ******************************************************************************/

std::shared_ptr<HookHandler> create_hook_handler(const LifecycleHook &hook, const HookServices &services) {
    std::string handler_type = hook.handler_type;
    std::transform(handler_type.begin(), handler_type.end(), handler_type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (handler_type == "message") {
        return std::make_shared<MessageHookHandler>(hook.handler_config, services.speech);
    }
    if (handler_type == "command") {
        return std::make_shared<CommandHookHandler>(hook.handler_config);
    }
    if (handler_type == "function") {
        return std::make_shared<FunctionHookHandler>(hook.handler_config, services.functions);
    }
    if (handler_type == "action") {
        return std::make_shared<ActionHookHandler>(hook.handler_config, services.components, services.speech);
    }

    LOG_ERROR("[Hooks] Unknown hook handler type: " << handler_type);
    return nullptr;
}

}  // namespace hooks
}  // namespace helm
