#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "hooks/lifecycle_hook.hpp"
#include "runtime/task.hpp"

namespace helm {
namespace hooks {

/**
 * Signature of a function hook.
 *
 * std::nullopt and true mean success, false means failure. Exceptions are
 * caught by the caller and count as failure.
 */
using HookFunction = std::function<std::optional<bool>(const nlohmann::json &context, const runtime::StopToken &token)>;

/**
 * HookFunctionRegistry - (module_name, function) to HookFunction map.
 *
 * Function hooks can only reach functions registered here. Filled at startup
 * and read-only afterwards.
 */
class HookFunctionRegistry {
public:
    /**
     * @return false if either name is empty or the pair is already registered
     */
    bool register_function(const std::string &module_name, const std::string &function_name, HookFunction function);

    /**
     * Look up a function.
     *
     * @param error Set to a description when nothing is found
     * @return nullptr if the module or the function is not registered
     */
    const HookFunction *find(const std::string &module_name, const std::string &function_name,
                             std::string &error) const;

    bool has_module(const std::string &module_name) const;

    std::vector<std::pair<std::string, std::string>> list() const;

private:
    std::map<std::pair<std::string, std::string>, HookFunction> functions_;
};

/**
 * Register every function hook compiled into the runtime.
 *
 * @param speech Speech output for hooks that announce their result
 */
void register_builtin_hook_functions(HookFunctionRegistry &registry, SpeechProvider speech);

}  // namespace hooks
}  // namespace helm
