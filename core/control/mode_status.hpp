#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace helm {
namespace control {

struct MessageHeader {
    std::string frame_id;
    int64_t stamp_sec = 0;
    uint32_t stamp_nanosec = 0;
};

/**
 * Mode-status request as carried on the wire.
 *
 * JSON shape:
 * {"header": {"frame_id", "stamp": {"sec", "nanosec"}},
 *  "request_id": "...", "code": 0|1, "mode": "..."}
 */
struct ModeStatusRequest {
    enum Code : int {
        SWITCH_MODE = 0,    // Switch to `mode`
        GET_MODE_INFO = 1,  // Report current mode details
    };

    MessageHeader header;
    std::string request_id;
    int code = SWITCH_MODE;
    std::string mode;  // Empty if absent
};

struct ModeStatusResponse {
    enum Code : int {
        SUCCESS = 0,
        FAILURE = 1,
    };

    MessageHeader header;
    std::string request_id;
    int code = SUCCESS;
    std::string current_mode;
    std::string message;  // Human readable text, or JSON for GET_MODE_INFO
};

// Header stamped with the current wall-clock time
MessageHeader prepare_header(const std::string &frame_id);

/**
 * Parse a request payload.
 *
 * "code" is required and must be a defined Code; header, request_id and mode
 * are optional.
 */
bool decode_request(const std::string &payload, ModeStatusRequest &request, std::string &error);
bool request_from_json(const nlohmann::json &body, ModeStatusRequest &request, std::string &error);

nlohmann::json request_to_json(const ModeStatusRequest &request);
nlohmann::json response_to_json(const ModeStatusResponse &response);
std::string encode_response(const ModeStatusResponse &response);

}  // namespace control
}  // namespace helm
