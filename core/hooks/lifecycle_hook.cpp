#include "hooks/lifecycle_hook.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "hooks/hook_handlers.hpp"
#include "logging/logger.hpp"

namespace helm {
namespace hooks {

const char *hook_type_to_string(HookType type) {
    switch (type) {
        case HookType::ON_ENTRY:
            return "on_entry";
        case HookType::ON_EXIT:
            return "on_exit";
        case HookType::ON_STARTUP:
            return "on_startup";
        case HookType::ON_SHUTDOWN:
            return "on_shutdown";
        case HookType::ON_TIMEOUT:
            return "on_timeout";
        default:
            return "unknown";
    }
}

std::optional<HookType> string_to_hook_type(const std::string &str) {
    if (str == "on_entry") {
        return HookType::ON_ENTRY;
    }
    if (str == "on_exit") {
        return HookType::ON_EXIT;
    }
    if (str == "on_startup") {
        return HookType::ON_STARTUP;
    }
    if (str == "on_shutdown") {
        return HookType::ON_SHUTDOWN;
    }
    if (str == "on_timeout") {
        return HookType::ON_TIMEOUT;
    }
    return std::nullopt;
}

std::vector<LifecycleHook> parse_lifecycle_hooks(const nlohmann::json &raw_hooks) {
    std::vector<LifecycleHook> hooks;
    if (raw_hooks.is_null()) {
        return hooks;
    }
    if (!raw_hooks.is_array()) {
        LOG_ERROR("[Hooks] Lifecycle hooks must be a list");
        return hooks;
    }

    for (const auto &entry : raw_hooks) {
        try {
            if (!entry.is_object()) {
                LOG_ERROR("[Hooks] Error parsing lifecycle hook: entry is not a mapping");
                continue;
            }
            if (!entry.contains("hook_type")) {
                LOG_ERROR("[Hooks] Error parsing lifecycle hook: missing 'hook_type'");
                continue;
            }
            auto type_name = entry.at("hook_type").get<std::string>();
            auto type = string_to_hook_type(type_name);
            if (!type) {
                LOG_ERROR("[Hooks] Error parsing lifecycle hook: '" << type_name << "' is not a valid hook type");
                continue;
            }
            if (!entry.contains("handler_type")) {
                LOG_ERROR("[Hooks] Error parsing lifecycle hook: missing 'handler_type'");
                continue;
            }

            LifecycleHook hook;
            hook.hook_type = *type;
            hook.handler_type = entry.at("handler_type").get<std::string>();
            if (entry.contains("handler_config") && !entry["handler_config"].is_null()) {
                hook.handler_config = entry["handler_config"];
            }
            hook.async_execution = entry.value("async_execution", true);
            if (entry.contains("timeout_seconds")) {
                const auto &timeout = entry["timeout_seconds"];
                hook.timeout_seconds =
                    timeout.is_null() ? std::nullopt : std::optional<double>(timeout.get<double>());
            }
            auto policy = entry.value("on_failure", std::string("ignore"));
            if (policy == "abort") {
                hook.on_failure = FailurePolicy::ABORT;
            } else if (policy != "ignore") {
                LOG_WARN("[Hooks] Unknown on_failure policy '" << policy << "', treating as ignore");
            }
            hook.priority = entry.value("priority", 0);

            hooks.push_back(std::move(hook));
        } catch (const nlohmann::json::exception &e) {
            LOG_ERROR("[Hooks] Error parsing lifecycle hook: " << e.what());
        }
    }

    return hooks;
}

namespace {

enum class HookOutcome { SUCCEEDED, FAILED, TIMED_OUT };

// State shared with a hook worker that may outlive the call
struct HookRun {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    bool success = false;
    std::string error;
};

HookOutcome run_inline(const std::shared_ptr<HookHandler> &handler, const nlohmann::json &context) {
    try {
        return handler->execute(context, runtime::StopToken()) ? HookOutcome::SUCCEEDED : HookOutcome::FAILED;
    } catch (const std::exception &e) {
        LOG_ERROR("[Hooks] Error executing lifecycle hook: " << e.what());
        return HookOutcome::FAILED;
    }
}

/**
 * Run the handler on a worker thread bounded by timeout.
 *
 * On timeout the handler's token is cancelled and the worker gets
 * services.cancel_grace to return. A worker that ignores cancellation is
 * detached; it owns copies of everything it touches.
 */
HookOutcome run_with_timeout(const std::shared_ptr<HookHandler> &handler, const nlohmann::json &context,
                             double timeout_seconds, const HookServices &services) {
    auto run = std::make_shared<HookRun>();
    runtime::StopSource stop;

    std::thread worker([handler, context, run, token = stop.token()]() {
        bool success = false;
        std::string error;
        try {
            success = handler->execute(context, token);
        } catch (const std::exception &e) {
            error = e.what();
        }
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->finished = true;
            run->success = success;
            run->error = std::move(error);
        }
        run->cv.notify_all();
    });

    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(timeout_seconds));

    std::unique_lock<std::mutex> lock(run->mutex);
    if (run->cv.wait_for(lock, timeout, [&run] { return run->finished; })) {
        lock.unlock();
        worker.join();
        if (!run->error.empty()) {
            LOG_ERROR("[Hooks] Error executing lifecycle hook: " << run->error);
            return HookOutcome::FAILED;
        }
        return run->success ? HookOutcome::SUCCEEDED : HookOutcome::FAILED;
    }

    LOG_ERROR("[Hooks] Lifecycle hook timed out after " << timeout_seconds << " seconds");
    stop.request_stop();

    bool stopped = run->cv.wait_for(lock, services.cancel_grace, [&run] { return run->finished; });
    lock.unlock();
    if (stopped) {
        worker.join();
    } else {
        LOG_WARN("[Hooks] Timed-out hook ignored cancellation, abandoning it");
        worker.detach();
    }
    return HookOutcome::TIMED_OUT;
}

}  // namespace

bool execute_lifecycle_hooks(const std::vector<LifecycleHook> &hooks, HookType type, nlohmann::json context,
                             const HookServices &services) {
    if (!context.is_object()) {
        context = nlohmann::json::object();
    }
    context["hook_type"] = hook_type_to_string(type);

    std::vector<const LifecycleHook *> relevant;
    for (const auto &hook : hooks) {
        if (hook.hook_type == type) {
            relevant.push_back(&hook);
        }
    }
    std::stable_sort(relevant.begin(), relevant.end(),
                     [](const LifecycleHook *a, const LifecycleHook *b) { return a->priority > b->priority; });

    if (relevant.empty()) {
        return true;
    }

    LOG_INFO("[Hooks] Executing " << relevant.size() << " " << hook_type_to_string(type) << " hooks");

    bool all_successful = true;
    for (const auto *hook : relevant) {
        auto handler = create_hook_handler(*hook, services);
        if (!handler) {
            LOG_ERROR("[Hooks] Failed to create handler for lifecycle hook: " << hook->handler_type);
            all_successful = false;
            continue;
        }

        HookOutcome outcome = HookOutcome::FAILED;
        try {
            if (hook->async_execution && hook->timeout_seconds && *hook->timeout_seconds > 0) {
                outcome = run_with_timeout(handler, context, *hook->timeout_seconds, services);
            } else {
                outcome = run_inline(handler, context);
            }
        } catch (const std::exception &e) {
            LOG_ERROR("[Hooks] Error executing lifecycle hook: " << e.what());
        }

        if (outcome != HookOutcome::SUCCEEDED) {
            all_successful = false;
            if (hook->on_failure == FailurePolicy::ABORT) {
                LOG_ERROR("[Hooks] Lifecycle hook failed with abort policy, stopping execution");
                return false;
            }
        }
    }

    return all_successful;
}

}  // namespace hooks
}  // namespace helm
