#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace helm
{
    namespace http
    {

        /**
         * @brief Status codes of the HTTP envelope
         *
         * - OK -> HTTP 200
         * - ACCEPTED -> HTTP 202 (queued onto the event loop)
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - UNAVAILABLE -> HTTP 503
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            ACCEPTED,
            INVALID_ARGUMENT,
            NOT_FOUND,
            UNAVAILABLE,
            INTERNAL
        };

        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::ACCEPTED:
                return 202;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::INTERNAL:
            default:
                return 500;
            }
        }

        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::ACCEPTED:
                return "ACCEPTED";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::INTERNAL:
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Build the "status" object carried by every response body
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message;
            if (msg.empty())
            {
                msg = (code == StatusCode::OK || code == StatusCode::ACCEPTED) ? "ok" : status_code_to_string(code);
            }
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"status", make_status(code, message)}};
        }

    } // namespace http
} // namespace helm
