#pragma once

#include <string>
#include <vector>

#include "../bridge/bridge_config.hpp"
#include "../worker/worker_config.hpp"

namespace ccproxy {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 3001;                                     // HTTP port (PORT env overrides)
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    // Each /v1/messages call holds a pool thread until the bridge answers
    // (up to bridge.request_timeout_ms), so size it above the expected number
    // of concurrent prompts plus headroom for /health and status probes
    int thread_pool_size = 16;
    std::string model_label = "claude-sonnet-4-20250514";  // "model" field of message replies
};

struct RuntimeConfig {
    worker::WorkerConfig worker;
    bridge::BridgeConfig bridge;
    HttpConfig http;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace ccproxy
