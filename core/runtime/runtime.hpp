#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "bridge/request_bridge.hpp"
#include "config.hpp"
#include "http/server.hpp"

namespace ccproxy {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Start the bridge (and with it the first worker), then the HTTP server
    bool initialize(std::string &error);

    // Main runtime loop (blocking) until a signal or stop()
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the bridge (outstanding requests fail with SHUTTING_DOWN), then HTTP
    void shutdown();

private:
    bool init_bridge(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<bridge::RequestBridge> bridge_;
    std::unique_ptr<http::HttpServer> http_server_;  // Holds a reference to *bridge_

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace ccproxy
