#include <future>
#include <memory>
#include <stdexcept>

#include "../../control/mode_status.hpp"
#include "../../control/mode_status_service.hpp"
#include "../../control/response_mailbox.hpp"
#include "../../logging/logger.hpp"
#include "../../runtime/cortex_runtime.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace helm {
namespace http {

//=============================================================================
// POST /v0/mode/request - Submit a mode-status request
//=============================================================================
void HttpServer::handle_post_mode_request(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const std::exception &e) {
        send_error(res, StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what());
        return;
    }

    control::ModeStatusRequest request;
    std::string error;
    if (!control::request_from_json(body, request, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (request.request_id.empty()) {
        request.request_id = generate_request_id();
    }

    mode_status_.submit(request);

    nlohmann::json response = {{"status", make_status(StatusCode::ACCEPTED)}, {"request_id", request.request_id}};
    send_json(res, StatusCode::ACCEPTED, response);
}

//=============================================================================
// GET /v0/mode/responses/:request_id - Collect a response
//=============================================================================
void HttpServer::handle_get_mode_response(const httplib::Request &req, httplib::Response &res) {
    std::string request_id;
    if (!parse_path_param(req, request_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Missing request_id");
        return;
    }

    auto response = mailbox_.take(request_id);
    if (!response) {
        send_error(res, StatusCode::NOT_FOUND, "No response for request '" + request_id + "' (yet)");
        return;
    }

    nlohmann::json body = {{"status", make_status(StatusCode::OK)}, {"response", control::response_to_json(*response)}};
    send_json(res, StatusCode::OK, body);
}

//=============================================================================
// GET /v0/modes - List configured modes
//=============================================================================
void HttpServer::handle_get_modes(const httplib::Request &, httplib::Response &res) {
    auto reply = std::make_shared<std::promise<nlohmann::json>>();
    auto future = reply->get_future();

    bool posted = cortex_.event_loop().post(
        [this, reply]() {
            reply->set_value({{"current_mode", cortex_.mode_manager().current_mode_name()},
                              {"modes", cortex_.get_available_modes()}});
        },
        [reply]() { reply->set_exception(std::make_exception_ptr(std::runtime_error("Runtime is shutting down"))); });

    if (!posted) {
        send_error(res, StatusCode::UNAVAILABLE, "Runtime is shutting down");
        return;
    }

    if (future.wait_for(kLoopReplyTimeout) != std::future_status::ready) {
        LOG_WARN("[HTTP] Event loop did not answer GET /v0/modes in time");
        send_error(res, StatusCode::UNAVAILABLE, "Runtime busy, try again");
        return;
    }

    nlohmann::json modes;
    try {
        modes = future.get();
    } catch (const std::exception &e) {
        send_error(res, StatusCode::UNAVAILABLE, e.what());
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"current_mode", modes["current_mode"]},
                               {"modes", modes["modes"]}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace helm
