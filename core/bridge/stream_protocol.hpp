#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ccproxy {
namespace bridge {

/**
 * @brief Wire codec for the worker's streaming-JSON protocol
 *
 * stdin:  one object per line
 *         {"type":"user","message":{"role":"user","content":"<prompt>"}}
 * stdout: one object per line, discriminated by "type":
 *         - "assistant": message.content[] blocks; "text" blocks carry output
 *         - "result":    terminal event with an optional "result" string
 *         - anything else is ignored
 */

// Text blocks of one assistant event, in array order
struct AssistantEvent {
    std::vector<std::string> text_blocks;
};

// Terminal event of one exchange
struct ResultEvent {
    std::optional<std::string> result;
    bool is_error = false;  // Best effort: "is_error": true or an "error*" subtype
    std::string subtype;
};

// Well-formed event of a type the bridge does not act on
struct OtherEvent {
    std::string type;
};

using StreamEvent = std::variant<AssistantEvent, ResultEvent, OtherEvent>;

// Frame a prompt as a user message, newline included
std::string encode_user_message(const std::string &prompt);

// Decode one stdout line. Returns std::nullopt for anything that is not a
// JSON object with a string "type" (malformed lines are not errors).
std::optional<StreamEvent> parse_stream_line(const std::string &line);

}  // namespace bridge
}  // namespace ccproxy
