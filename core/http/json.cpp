#include "json.hpp"

namespace ccproxy {
namespace http {

namespace {

// Text of a message's content: a plain string, or the concatenated
// text blocks of a content array. Anything else yields "".
std::string content_text(const nlohmann::json &content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }

    std::string text;
    if (content.is_array()) {
        for (const auto &block : content) {
            if (!block.is_object()) {
                continue;
            }
            auto type = block.find("type");
            auto value = block.find("text");
            if (type != block.end() && *type == "text" && value != block.end() && value->is_string()) {
                if (!text.empty()) {
                    text += "\n";
                }
                text += value->get<std::string>();
            }
        }
    }
    return text;
}

}  // namespace

bool decode_messages_request(const nlohmann::json &body, std::string &prompt, std::string &error) {
    if (!body.is_object() || !body.contains("messages") || !body["messages"].is_array()) {
        error = "messages array required";
        return false;
    }

    // First user message wins; later turns are not forwarded
    std::string user_message;
    for (const auto &message : body["messages"]) {
        if (!message.is_object()) {
            continue;
        }
        auto role = message.find("role");
        if (role != message.end() && role->is_string() && role->get<std::string>() == "user") {
            if (message.contains("content")) {
                user_message = content_text(message["content"]);
            }
            break;
        }
    }

    if (user_message.empty()) {
        error = "user message required";
        return false;
    }

    std::string system;
    if (body.contains("system")) {
        system = content_text(body["system"]);
    }

    prompt = system.empty() ? user_message : system + "\n\nUser: " + user_message;
    return true;
}

nlohmann::json encode_message_reply(const bridge::BridgeReply &reply, const std::string &model_label) {
    nlohmann::json response = {{"content", nlohmann::json::array({{{"type", "text"}, {"text", reply.text}}})},
                               {"model", model_label},
                               {"role", "assistant"}};
    if (reply.worker_error) {
        response["is_error"] = true;
    }
    return response;
}

nlohmann::json encode_worker_snapshot(const worker::WorkerSupervisor::WorkerSnapshot &snapshot) {
    nlohmann::json json = {{"state", worker::worker_state_to_string(snapshot.state)},
                           {"attached", snapshot.attached},
                           {"generation", snapshot.generation},
                           {"failure_count", snapshot.failure_count},
                           {"last_backoff_ms", snapshot.last_backoff_ms},
                           {"restart_count", snapshot.restart_count},
                           {"exit_count", snapshot.exit_count},
                           {"spawn_failure_count", snapshot.spawn_failure_count}};

    json["pid"] = snapshot.pid ? nlohmann::json(*snapshot.pid) : nlohmann::json(nullptr);
    json["last_exit_code"] =
        snapshot.last_exit_code ? nlohmann::json(*snapshot.last_exit_code) : nlohmann::json(nullptr);
    json["next_restart_in_ms"] =
        snapshot.next_restart_in_ms ? nlohmann::json(*snapshot.next_restart_in_ms) : nlohmann::json(nullptr);

    if (!snapshot.last_error.empty()) {
        json["last_error"] = snapshot.last_error;
    }
    return json;
}

nlohmann::json encode_health_status(const bridge::HealthStatus &health) {
    return {{"attached", health.attached},
            {"worker", encode_worker_snapshot(health.worker)},
            {"requests",
             {{"queued", health.queued_requests},
              {"in_flight", health.request_in_flight},
              {"orphaned", health.orphaned_requests},
              {"completed", health.completed_requests},
              {"timed_out", health.timed_out_requests}}}};
}

}  // namespace http
}  // namespace ccproxy
