#include "stream_protocol.hpp"

#include <nlohmann/json.hpp>

namespace ccproxy {
namespace bridge {

std::string encode_user_message(const std::string &prompt) {
    nlohmann::json message = {{"type", "user"}, {"message", {{"role", "user"}, {"content", prompt}}}};
    // Replace invalid UTF-8 instead of throwing from dump()
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

namespace {

AssistantEvent decode_assistant(const nlohmann::json &json) {
    AssistantEvent event;

    auto message_it = json.find("message");
    if (message_it == json.end() || !message_it->is_object()) {
        return event;
    }

    auto content_it = message_it->find("content");
    if (content_it == message_it->end() || !content_it->is_array()) {
        return event;
    }

    for (const auto &block : *content_it) {
        if (!block.is_object()) {
            continue;
        }
        auto type_it = block.find("type");
        if (type_it == block.end() || !type_it->is_string() || type_it->get<std::string>() != "text") {
            continue;
        }
        auto text_it = block.find("text");
        if (text_it != block.end() && text_it->is_string()) {
            event.text_blocks.push_back(text_it->get<std::string>());
        }
    }
    return event;
}

ResultEvent decode_result(const nlohmann::json &json) {
    ResultEvent event;

    auto result_it = json.find("result");
    if (result_it != json.end() && result_it->is_string()) {
        event.result = result_it->get<std::string>();
    }

    auto subtype_it = json.find("subtype");
    if (subtype_it != json.end() && subtype_it->is_string()) {
        event.subtype = subtype_it->get<std::string>();
    }

    auto is_error_it = json.find("is_error");
    if (is_error_it != json.end() && is_error_it->is_boolean()) {
        event.is_error = is_error_it->get<bool>();
    }
    if (event.subtype.rfind("error", 0) == 0) {
        event.is_error = true;
    }
    return event;
}

}  // namespace

std::optional<StreamEvent> parse_stream_line(const std::string &line) {
    nlohmann::json json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    auto type_it = json.find("type");
    if (type_it == json.end() || !type_it->is_string()) {
        return std::nullopt;
    }

    const std::string type = type_it->get<std::string>();
    if (type == "assistant") {
        return StreamEvent{decode_assistant(json)};
    }
    if (type == "result") {
        return StreamEvent{decode_result(json)};
    }
    return StreamEvent{OtherEvent{type}};
}

}  // namespace bridge
}  // namespace ccproxy
