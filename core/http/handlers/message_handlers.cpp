#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace ccproxy {
namespace http {

//=============================================================================
// POST /v1/messages
//=============================================================================
void HttpServer::handle_post_messages(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const std::exception &e) {
        send_error(res, StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what());
        return;
    }

    std::string prompt;
    std::string error;
    if (!decode_messages_request(body, prompt, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    LOG_DEBUG("[HTTP] /v1/messages prompt (" << prompt.size() << " bytes)");

    // Blocks this pool thread until the worker replies or the request times out
    bridge::BridgeReply reply = bridge_.send(prompt);

    if (!reply.ok()) {
        LOG_WARN("[HTTP] /v1/messages failed: " << bridge::bridge_status_to_string(reply.status) << " ("
                                                << reply.error << ")");
        send_error(res, bridge_status_to_code(reply.status), reply.error);
        return;
    }

    send_json(res, StatusCode::OK, encode_message_reply(reply, config_.model_label));
}

}  // namespace http
}  // namespace ccproxy
