#include "hooks/functions/navigation_hooks.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <httplib.h>

#include "components/plugin_types.hpp"
#include "logging/logger.hpp"

namespace helm {
namespace hooks {
namespace functions {

namespace {

constexpr std::chrono::seconds kServiceTimeout{5};
constexpr std::chrono::seconds kMapSaveTimeout{10};

std::string base_url_from(const nlohmann::json &context) {
    return context.value("base_url", std::string("http://localhost:5000"));
}

std::string map_name_from(const nlohmann::json &context) { return context.value("map_name", std::string("map")); }

std::string reply_message(const std::string &body, const std::string &fallback) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return fallback;
}

/**
 * POST a JSON body and return the reply message.
 * Throws std::runtime_error on transport failure or a non-200 status.
 */
std::string post_json(const nlohmann::json &context, const std::string &path, const nlohmann::json &body,
                      std::chrono::seconds timeout, const std::string &service, const std::string &verb) {
    auto client = std::make_unique<httplib::Client>(base_url_from(context));
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);

    auto result = client->Post(path, body.is_null() ? std::string() : body.dump(), "application/json");
    if (!result) {
        std::string error = "Error calling " + service + " API: " + httplib::to_string(result.error());
        LOG_ERROR("[Hooks] " << error);
        throw std::runtime_error(error);
    }

    if (result->status != 200) {
        std::string error =
            "Failed to " + verb + " " + service + ": " + reply_message(result->body, "Unknown error");
        LOG_ERROR("[Hooks] " << error);
        throw std::runtime_error(error);
    }

    return reply_message(result->body, "Success");
}

void announce(const SpeechProvider &speech, const std::string &text) {
    if (!speech) {
        return;
    }
    auto output = speech();
    if (output) {
        output->add_pending_message(text);
    }
}

}  // namespace

std::optional<bool> start_nav2_hook(const nlohmann::json &context, const SpeechProvider &speech) {
    auto message = post_json(context, "/start/nav2", {{"map_name", map_name_from(context)}}, kServiceTimeout,
                             "Nav2", "start");
    LOG_INFO("[Hooks] Nav2 started successfully: " << message);
    announce(speech, "Navigation system has started successfully.");
    return std::nullopt;
}

std::optional<bool> stop_nav2_hook(const nlohmann::json &context) {
    auto message = post_json(context, "/stop/nav2", nullptr, kServiceTimeout, "Nav2", "stop");
    LOG_INFO("[Hooks] Nav2 stopped successfully: " << message);
    return std::nullopt;
}

std::optional<bool> start_slam_hook(const nlohmann::json &context) {
    auto message = post_json(context, "/start/slam", nullptr, kServiceTimeout, "SLAM", "start");
    LOG_INFO("[Hooks] SLAM started successfully: " << message);
    return std::nullopt;
}

std::optional<bool> stop_slam_hook(const nlohmann::json &context, const SpeechProvider &speech) {
    auto saved = post_json(context, "/maps/save", {{"map_name", map_name_from(context)}}, kMapSaveTimeout,
                           "SLAM map", "save");
    LOG_INFO("[Hooks] SLAM map saved successfully: " << saved);
    announce(speech, "Map has been saved successfully.");

    auto message = post_json(context, "/stop/slam", nullptr, kMapSaveTimeout, "SLAM", "stop");
    LOG_INFO("[Hooks] SLAM stopped successfully: " << message);
    return std::nullopt;
}

void register_navigation_hooks(HookFunctionRegistry &registry, SpeechProvider speech) {
    registry.register_function("nav2_hook", "start_nav2_hook",
                               [speech](const nlohmann::json &context, const runtime::StopToken &) {
                                   return start_nav2_hook(context, speech);
                               });
    registry.register_function("nav2_hook", "stop_nav2_hook",
                               [](const nlohmann::json &context, const runtime::StopToken &) {
                                   return stop_nav2_hook(context);
                               });
    registry.register_function("slam_hook", "start_slam_hook",
                               [](const nlohmann::json &context, const runtime::StopToken &) {
                                   return start_slam_hook(context);
                               });
    registry.register_function("slam_hook", "stop_slam_hook",
                               [speech](const nlohmann::json &context, const runtime::StopToken &) {
                                   return stop_slam_hook(context, speech);
                               });
}

}  // namespace functions
}  // namespace hooks
}  // namespace helm
