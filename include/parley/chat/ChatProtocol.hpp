/**
 * ChatProtocol.hpp - Request/response shapes shared by the HTTP chat clients
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace parley::chat {

/// "http://host:8000/api/" -> {"http://host:8000", "/api"}
struct EndpointBase {
    std::string origin;
    std::string path_prefix;
};

EndpointBase splitBaseUrl(const std::string& url);

/**
 * Assistant text from a /chat reply. Accepted shapes, first match wins:
 *   {"data": {"response": "..."}}
 *   {"reply": "..."}
 *   {"message": {"content": "..."}}
 *   {"choices": [{"message": {"content": "..."}}]}
 */
std::optional<std::string> extractAssistantText(const nlohmann::json& payload);

/// data.conversation_id, then message.conversation_id
std::optional<std::string> extractConversationId(const nlohmann::json& payload);

struct SseEvent {
    enum class Kind {
        Skip,       // blank, comment, non-data or malformed line
        Content,
        Done
    };

    Kind kind = Kind::Skip;
    std::string content;
};

/// Classify one server-sent-events line of an OpenAI-style completion stream.
SseEvent parseSseLine(const std::string& line);

/**
 * Reassembles newline-terminated lines from arbitrarily split network reads.
 * Trailing '\r' is stripped.
 */
class LineBuffer {
public:
    std::vector<std::string> feed(const char* data, size_t length);

    /// Unterminated tail, consumed.
    std::string takeRemainder();

private:
    std::string buffer_;
};

} // namespace parley::chat
