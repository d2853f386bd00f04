#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bridge/i_request_bridge.hpp"
#include "runtime/config.hpp"

namespace ccproxy {
namespace http {

// Access-Control-Allow-Origin value for a request Origin, or nullopt when the
// origin is not allowed. Entries may hold one '*' (e.g. "https://*.example.com");
// a bare "*" allows every origin and answers "*".
std::optional<std::string> cors_response_origin(const std::vector<std::string> &allowed_origins,
                                                const std::string &origin);

/**
 * @brief HTTP front door for the request bridge
 *
 * Exposes the bridge's send() as a Messages-API style endpoint plus
 * health reporting. Every request handler delegates to the bridge; the
 * server holds no request state of its own.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool and may block on
 *   send() for up to the bridge's request timeout
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, bridge::IRequestBridge &bridge);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server. Safe to call multiple times.
     */
    void stop();

private:
    runtime::HttpConfig config_;

    bridge::IRequestBridge &bridge_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point start_time_;

    void setup_routes();
    void install_cors();
    void install_error_handlers();

    // message_handlers.cpp
    void handle_post_messages(const httplib::Request &req, httplib::Response &res);

    // system_handlers.cpp
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_bridge_status(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace ccproxy
