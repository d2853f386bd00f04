#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace ccproxy {
namespace runtime {

namespace {

// Strict: anything outside 1..65535 is rejected rather than wrapped
bool parse_port(const std::string &text, int &port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    port = std::stoi(text);
    return port >= 1 && port <= 65535;
}

bool load_worker(const YAML::Node &node, worker::WorkerConfig &worker, std::string &error) {
    if (node["id"]) {
        worker.id = node["id"].as<std::string>();
    }
    if (node["command"]) {
        worker.command = node["command"].as<std::string>();
    }

    // Replaces the default argument set entirely
    if (node["args"]) {
        if (!node["args"].IsSequence()) {
            error = "worker.args must be a sequence";
            return false;
        }
        worker.args.clear();
        for (const auto &arg : node["args"]) {
            worker.args.push_back(arg.as<std::string>());
        }
    }

    if (node["env"]) {
        if (!node["env"].IsMap()) {
            error = "worker.env must be a mapping of NAME: value";
            return false;
        }
        worker.env.clear();
        for (const auto &entry : node["env"]) {
            worker.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }

    if (node["required_env"]) {
        worker.required_env.clear();
        const auto &required = node["required_env"];
        if (required.IsSequence()) {
            for (const auto &name : required) {
                worker.required_env.push_back(name.as<std::string>());
            }
        } else if (required.IsScalar()) {
            worker.required_env.push_back(required.as<std::string>());
        }
    }

    if (node["shutdown_timeout_ms"]) {
        worker.shutdown_timeout_ms = node["shutdown_timeout_ms"].as<int>();
    }

    if (node["restart_policy"]) {
        const auto &rp = node["restart_policy"];
        if (rp["base_delay_ms"]) {
            worker.restart_policy.base_delay_ms = rp["base_delay_ms"].as<int>();
        }
        if (rp["max_delay_ms"]) {
            worker.restart_policy.max_delay_ms = rp["max_delay_ms"].as<int>();
        }
    }

    return true;
}

void load_http(const YAML::Node &node, HttpConfig &http) {
    if (node["enabled"]) {
        http.enabled = node["enabled"].as<bool>();
    }
    if (node["bind"]) {
        http.bind = node["bind"].as<std::string>();
    }
    if (node["port"]) {
        http.port = node["port"].as<int>();
    }

    // CORS allowlist (supports scalar or sequence)
    if (node["cors_allowed_origins"]) {
        const auto &origins_node = node["cors_allowed_origins"];
        http.cors_allowed_origins.clear();
        if (origins_node.IsSequence()) {
            for (const auto &origin : origins_node) {
                http.cors_allowed_origins.push_back(origin.as<std::string>());
            }
        } else if (origins_node.IsScalar()) {
            http.cors_allowed_origins.push_back(origins_node.as<std::string>());
        }

        if (http.cors_allowed_origins.empty()) {
            http.cors_allowed_origins.push_back("*");
        }
    }
    if (node["cors_allow_credentials"]) {
        http.cors_allow_credentials = node["cors_allow_credentials"].as<bool>();
    }
    if (node["thread_pool_size"]) {
        http.thread_pool_size = node["thread_pool_size"].as<int>();
    }
    if (node["model_label"]) {
        http.model_label = node["model_label"].as<std::string>();
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    const auto &worker = config.worker;
    if (worker.id.empty()) {
        error = "worker.id must not be empty";
        return false;
    }
    if (worker.command.empty()) {
        error = "Worker '" + worker.id + "' missing 'command' field";
        return false;
    }
    if (worker.shutdown_timeout_ms < 100 || worker.shutdown_timeout_ms > 30000) {
        error = "worker.shutdown_timeout_ms must be between 100 and 30000";
        return false;
    }
    if (worker.restart_policy.base_delay_ms < 1) {
        error = "worker.restart_policy.base_delay_ms must be >= 1";
        return false;
    }
    if (worker.restart_policy.max_delay_ms < worker.restart_policy.base_delay_ms) {
        error = "worker.restart_policy.max_delay_ms (" + std::to_string(worker.restart_policy.max_delay_ms) +
                ") must be >= base_delay_ms (" + std::to_string(worker.restart_policy.base_delay_ms) + ")";
        return false;
    }

    if (config.bridge.request_timeout_ms < 100) {
        error = "bridge.request_timeout_ms must be >= 100ms";
        return false;
    }

    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"worker", "bridge", "http", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["worker"]) {
            if (!load_worker(yaml["worker"], config.worker, error)) {
                return false;
            }
        }

        if (yaml["bridge"]) {
            if (yaml["bridge"]["request_timeout_ms"]) {
                config.bridge.request_timeout_ms = yaml["bridge"]["request_timeout_ms"].as<int>();
            }
        }

        if (yaml["http"]) {
            load_http(yaml["http"], config.http);
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        // Deployment environments set PORT rather than editing the file
        const char *port_env = std::getenv("PORT");
        if (port_env != nullptr && *port_env != '\0') {
            int port = 0;
            if (!parse_port(port_env, port)) {
                error = "Invalid PORT environment variable: '" + std::string(port_env) + "'";
                return false;
            }
            config.http.port = port;
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Worker: " << config.worker.id << " (" << config.worker.command << ", "
                                     << config.worker.args.size() << " args)");
        LOG_INFO("[Config] Restart backoff: " << config.worker.restart_policy.base_delay_ms << "ms .. "
                                              << config.worker.restart_policy.max_delay_ms << "ms");
        LOG_INFO("[Config] Request timeout: " << config.bridge.request_timeout_ms << "ms");

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace ccproxy
