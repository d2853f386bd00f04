#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace ccproxy
{
    namespace http
    {

        // Helper: Send JSON response
        // Invalid UTF-8 (e.g. echoed from a request body) is replaced, not thrown
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
        }

        // Helper: Send error response with matching HTTP status
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

    } // namespace http
} // namespace ccproxy
