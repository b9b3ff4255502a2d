#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace helm
{
    namespace http
    {

        // Helper: First regex capture of the matched route
        inline bool parse_path_param(const httplib::Request &req, std::string &value)
        {
            if (req.matches.size() >= 2)
            {
                value = req.matches[1].str();
                return !value.empty();
            }
            return false;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

    } // namespace http
} // namespace helm
