#include <chrono>

#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace ccproxy {
namespace http {

//=============================================================================
// GET /health
//=============================================================================
// Always 200 so liveness probes pass while the worker restarts;
// "degraded" tells readiness checks there is no worker to serve requests.
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    const bridge::HealthStatus health = bridge_.health_status();

    nlohmann::json response = {{"status", health.attached ? "healthy" : "degraded"}, {"attached", health.attached}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v1/bridge/status
//=============================================================================
void HttpServer::handle_get_bridge_status(const httplib::Request &, httplib::Response &res) {
    auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time_).count();

    nlohmann::json response = encode_health_status(bridge_.health_status());
    response["status"] = make_status(StatusCode::OK);
    response["uptime_seconds"] = uptime;

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace ccproxy
