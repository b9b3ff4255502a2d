#include "hooks/hook_function_registry.hpp"

#include "hooks/functions/navigation_hooks.hpp"
#include "logging/logger.hpp"

namespace helm {
namespace hooks {

bool HookFunctionRegistry::register_function(const std::string &module_name, const std::string &function_name,
                                             HookFunction function) {
    if (module_name.empty() || function_name.empty() || !function) {
        LOG_ERROR("[Hooks] Refusing incomplete function hook registration");
        return false;
    }
    auto inserted = functions_.emplace(std::make_pair(module_name, function_name), std::move(function)).second;
    if (!inserted) {
        LOG_WARN("[Hooks] Function hook already registered: " << module_name << "." << function_name);
        return false;
    }
    LOG_DEBUG("[Hooks] Registered function hook " << module_name << "." << function_name);
    return true;
}

const HookFunction *HookFunctionRegistry::find(const std::string &module_name, const std::string &function_name,
                                               std::string &error) const {
    auto it = functions_.find(std::make_pair(module_name, function_name));
    if (it != functions_.end()) {
        return &it->second;
    }

    if (!has_module(module_name)) {
        error = "Hook module '" + module_name + "' is not registered";
    } else {
        error = "Function " + function_name + " not found in module " + module_name;
    }
    return nullptr;
}

bool HookFunctionRegistry::has_module(const std::string &module_name) const {
    auto it = functions_.lower_bound(std::make_pair(module_name, std::string()));
    return it != functions_.end() && it->first.first == module_name;
}

std::vector<std::pair<std::string, std::string>> HookFunctionRegistry::list() const {
    std::vector<std::pair<std::string, std::string>> names;
    names.reserve(functions_.size());
    for (const auto &entry : functions_) {
        names.push_back(entry.first);
    }
    return names;
}

void register_builtin_hook_functions(HookFunctionRegistry &registry, SpeechProvider speech) {
    functions::register_navigation_hooks(registry, std::move(speech));
}

}  // namespace hooks
}  // namespace helm
