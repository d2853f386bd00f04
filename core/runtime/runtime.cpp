#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace ccproxy {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing ccproxy");

    if (!init_bridge(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_bridge(std::string &error) {
    bridge_ = std::make_unique<bridge::RequestBridge>(config_.worker, config_.bridge);

    std::string bridge_error;
    if (!bridge_->start(bridge_error)) {
        error = "Failed to start request bridge: " + bridge_error;
        return false;
    }

    LOG_INFO("[Runtime] Request bridge started (worker: " << config_.worker.id << ")");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *bridge_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        http_server_.reset();
        return false;
    }

    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    return true;
}

void Runtime::run() {
    running_ = true;
    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    bool was_attached = bridge_ && bridge_->health_status().attached;

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        // Report attach/detach transitions; recovery itself is the bridge's job
        const bool attached = bridge_ && bridge_->health_status().attached;
        if (attached != was_attached) {
            if (attached) {
                LOG_INFO("[Runtime] Worker attached");
            } else {
                LOG_WARN("[Runtime] Worker detached; requests answer NOT_READY until it restarts");
            }
            was_attached = attached;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    // Bridge first: HTTP pool threads blocked in send() resolve with
    // SHUTTING_DOWN, so stopping the server does not wait on their deadlines
    if (bridge_) {
        LOG_INFO("[Runtime] Stopping request bridge");
        bridge_->stop();
    }

    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

}  // namespace runtime
}  // namespace ccproxy
