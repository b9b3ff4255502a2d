#include "control/mode_status_service.hpp"

#include "logging/logger.hpp"

namespace helm {
namespace control {

ModeStatusService::ModeStatusService(runtime::EventLoop &loop, modes::ModeManager &mode_manager, Publisher publisher)
    : loop_(loop), mode_manager_(mode_manager), publisher_(std::move(publisher)) {}

bool ModeStatusService::handle_request(const std::string &payload) {
    ModeStatusRequest request;
    std::string error;
    if (!decode_request(payload, request, error)) {
        LOG_ERROR("[ModeStatus] Malformed request: " << error);
        return false;
    }

    submit(request);
    return true;
}

void ModeStatusService::submit(const ModeStatusRequest &request) {
    LOG_INFO("[ModeStatus] Received request " << request.request_id << " (code " << request.code
                                              << (request.mode.empty() ? "" : ", mode " + request.mode) << ")");

    if (request.code == ModeStatusRequest::SWITCH_MODE && !request.mode.empty()) {
        handle_switch(request);
        return;
    }

    if (request.code == ModeStatusRequest::GET_MODE_INFO) {
        handle_info(request);
        return;
    }

    const std::string message = request.code == ModeStatusRequest::SWITCH_MODE
                                    ? "Mode switch request without a target mode"
                                    : "Unknown request code " + std::to_string(request.code);
    LOG_WARN("[ModeStatus] " << message);
    publish(make_response(request, ModeStatusResponse::FAILURE, mode_manager_.current_mode_name(), message));
}

void ModeStatusService::handle_switch(const ModeStatusRequest &request) {
    auto work = [this, request]() {
        bool success = mode_manager_.request_transition(request.mode, "manual");
        const std::string message = success ? "Successfully switched to mode " + request.mode
                                            : "Failed to switch to mode " + request.mode;
        publish(make_response(request, success ? ModeStatusResponse::SUCCESS : ModeStatusResponse::FAILURE,
                              mode_manager_.current_mode_name(), message));
    };
    auto on_drop = [this, request]() {
        publish(make_response(request, ModeStatusResponse::FAILURE, mode_manager_.current_mode_name(),
                              "Runtime is shutting down"));
    };

    if (!loop_.post(work, on_drop)) {
        on_drop();
    }
}

void ModeStatusService::handle_info(const ModeStatusRequest &request) {
    auto work = [this, request]() {
        publish(make_response(request, ModeStatusResponse::SUCCESS, mode_manager_.current_mode_name(),
                              mode_manager_.get_mode_info().dump()));
    };
    auto on_drop = [this, request]() {
        publish(make_response(request, ModeStatusResponse::FAILURE, mode_manager_.current_mode_name(),
                              "Runtime is shutting down"));
    };

    if (!loop_.post(work, on_drop)) {
        on_drop();
    }
}

ModeStatusResponse ModeStatusService::make_response(const ModeStatusRequest &request, int code,
                                                    const std::string &current_mode,
                                                    const std::string &message) const {
    ModeStatusResponse response;
    response.header = prepare_header(request.header.frame_id);
    response.request_id = request.request_id;
    response.code = code;
    response.current_mode = current_mode;
    response.message = message;
    return response;
}

void ModeStatusService::publish(const ModeStatusResponse &response) {
    if (!publisher_) {
        return;
    }
    try {
        publisher_(response);
    } catch (const std::exception &e) {
        LOG_ERROR("[ModeStatus] Failed to publish response " << response.request_id << ": " << e.what());
    }
}

}  // namespace control
}  // namespace helm
