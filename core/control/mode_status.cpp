#include "control/mode_status.hpp"

#include <chrono>

namespace helm {
namespace control {

namespace {

constexpr int64_t kMaxRequestCode = ModeStatusRequest::GET_MODE_INFO;

nlohmann::json header_to_json(const MessageHeader &header) {
    return {{"frame_id", header.frame_id},
            {"stamp", {{"sec", header.stamp_sec}, {"nanosec", header.stamp_nanosec}}}};
}

bool header_from_json(const nlohmann::json &node, MessageHeader &header, std::string &error) {
    if (!node.is_object()) {
        error = "'header' must be an object";
        return false;
    }
    if (node.contains("frame_id")) {
        if (!node["frame_id"].is_string()) {
            error = "'header.frame_id' must be a string";
            return false;
        }
        header.frame_id = node["frame_id"].get<std::string>();
    }
    if (node.contains("stamp")) {
        const auto &stamp = node["stamp"];
        if (!stamp.is_object()) {
            error = "'header.stamp' must be an object";
            return false;
        }
        if (stamp.contains("sec") && stamp["sec"].is_number_integer()) {
            header.stamp_sec = stamp["sec"].get<int64_t>();
        }
        if (stamp.contains("nanosec") && stamp["nanosec"].is_number_unsigned()) {
            header.stamp_nanosec = stamp["nanosec"].get<uint32_t>();
        }
    }
    return true;
}

}  // namespace

MessageHeader prepare_header(const std::string &frame_id) {
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto sec = duration_cast<seconds>(since_epoch);

    MessageHeader header;
    header.frame_id = frame_id;
    header.stamp_sec = sec.count();
    header.stamp_nanosec = static_cast<uint32_t>(duration_cast<nanoseconds>(since_epoch - sec).count());
    return header;
}

bool request_from_json(const nlohmann::json &body, ModeStatusRequest &request, std::string &error) {
    if (!body.is_object()) {
        error = "Request must be a JSON object";
        return false;
    }

    if (!body.contains("code") || !body["code"].is_number_integer()) {
        error = "Missing or invalid 'code' field";
        return false;
    }
    // Only the defined codes; wider integers must not wrap onto one of them
    const auto &code = body["code"];
    const bool known = code.is_number_unsigned()
                           ? code.get<uint64_t>() <= static_cast<uint64_t>(kMaxRequestCode)
                           : code.get<int64_t>() >= ModeStatusRequest::SWITCH_MODE &&
                                 code.get<int64_t>() <= kMaxRequestCode;
    if (!known) {
        error = "Unknown 'code' " + code.dump();
        return false;
    }
    request.code = static_cast<int>(code.get<int64_t>());

    if (body.contains("header") && !header_from_json(body["header"], request.header, error)) {
        return false;
    }

    if (body.contains("request_id") && !body["request_id"].is_null()) {
        if (!body["request_id"].is_string()) {
            error = "'request_id' must be a string";
            return false;
        }
        request.request_id = body["request_id"].get<std::string>();
    }

    if (body.contains("mode") && !body["mode"].is_null()) {
        if (!body["mode"].is_string()) {
            error = "'mode' must be a string";
            return false;
        }
        request.mode = body["mode"].get<std::string>();
    }

    return true;
}

bool decode_request(const std::string &payload, ModeStatusRequest &request, std::string &error) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    return request_from_json(body, request, error);
}

nlohmann::json request_to_json(const ModeStatusRequest &request) {
    nlohmann::json body = {
        {"header", header_to_json(request.header)}, {"request_id", request.request_id}, {"code", request.code}};
    if (!request.mode.empty()) {
        body["mode"] = request.mode;
    }
    return body;
}

nlohmann::json response_to_json(const ModeStatusResponse &response) {
    return {{"header", header_to_json(response.header)},
            {"request_id", response.request_id},
            {"code", response.code},
            {"current_mode", response.current_mode},
            {"message", response.message}};
}

std::string encode_response(const ModeStatusResponse &response) { return response_to_json(response).dump(); }

}  // namespace control
}  // namespace helm
