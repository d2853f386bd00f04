#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "bridge/bridge_types.hpp"
#include "worker/worker_supervisor.hpp"

namespace ccproxy {
namespace http {

/**
 * @brief JSON encoding utilities for the HTTP front door
 *
 * Request decoding follows the Messages API subset the proxy accepts:
 * a "messages" array of {role, content} plus an optional "system" string.
 * Content may be a string or an array of {type:"text", text} blocks.
 */

// Build the worker prompt from a /v1/messages body.
// On failure, error holds the client-facing message.
bool decode_messages_request(const nlohmann::json &body, std::string &prompt, std::string &error);

nlohmann::json encode_message_reply(const bridge::BridgeReply &reply, const std::string &model_label);
nlohmann::json encode_worker_snapshot(const worker::WorkerSupervisor::WorkerSnapshot &snapshot);
nlohmann::json encode_health_status(const bridge::HealthStatus &health);

}  // namespace http
}  // namespace ccproxy
