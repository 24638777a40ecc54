/**
 * HttpChatClient.hpp - Whole-reply client for a JSON /chat endpoint
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <memory>
#include <string>

namespace parley::chat {

struct HttpChatOptions {
    std::string base_url = "http://localhost:8000";
    std::string api_key;          // sent as a bearer token when set
    int timeout_seconds = 10;
};

/**
 * POST <base>/chat with {"message", "conversation_id", "debug"}.
 * Every transport, status, content-type or shape failure throws ChatError.
 */
class HttpChatClient : public ChatClient {
public:
    explicit HttpChatClient(HttpChatOptions options);
    ~HttpChatClient() override;

    ChatReply chat(const std::string& message,
                   const std::string& session_id,
                   bool debug) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::chat
