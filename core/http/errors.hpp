#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "bridge/bridge_types.hpp"

namespace ccproxy
{
    namespace http
    {

        /**
         * @brief Response status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - UNAVAILABLE -> HTTP 503
         * - DEADLINE_EXCEEDED -> HTTP 504
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            UNAVAILABLE,
            DEADLINE_EXCEEDED,
            INTERNAL
        };

        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            case StatusCode::INTERNAL:
                return 500;
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
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Map a failed bridge reply to its response status
         *
         * NOT_READY and SHUTTING_DOWN are both "try again later" (503);
         * TIMEOUT is a gateway timeout (504).
         */
        inline StatusCode bridge_status_to_code(bridge::BridgeStatus status)
        {
            switch (status)
            {
            case bridge::BridgeStatus::OK:
                return StatusCode::OK;
            case bridge::BridgeStatus::NOT_READY:
            case bridge::BridgeStatus::SHUTTING_DOWN:
                return StatusCode::UNAVAILABLE;
            case bridge::BridgeStatus::TIMEOUT:
                return StatusCode::DEADLINE_EXCEEDED;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a JSON status object
         *
         * All HTTP responses include a top-level "status" object with code and message.
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * Carries both the Messages-API style "error" object that chat clients
         * read and the "status" object shared by every response.
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            nlohmann::json status = make_status(code, message);
            return {
                {"error", {{"message", status["message"]}}},
                {"status", status}};
        }

    } // namespace http
} // namespace ccproxy
