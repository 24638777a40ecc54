/**
 * GatewayChatClient.hpp - Streaming client for an OpenAI-compatible agent gateway
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <memory>
#include <string>

namespace parley::chat {

struct GatewayOptions {
    std::string gateway_url;
    std::string token;
    std::string agent_id = "main";
    std::string system_prompt;    // prepended as a system message when set
    int timeout_seconds = 30;
    bool verbose = false;         // echo chunks as they arrive
};

/**
 * POST <gateway>/v1/chat/completions with stream=true and the session id as
 * the "user" field, so the gateway keeps history per session.
 *
 * Reply chunks are the choices[0].delta.content of each "data:" line;
 * "data: [DONE]" ends the stream and malformed lines are skipped.
 */
class GatewayChatClient : public StreamingChatClient {
public:
    explicit GatewayChatClient(GatewayOptions options);
    ~GatewayChatClient() override;

    /// Accumulates the stream. An empty reply throws ChatError.
    ChatReply chat(const std::string& message,
                   const std::string& session_id,
                   bool debug) override;

    void chatStream(const std::string& message,
                    const std::string& session_id,
                    bool debug,
                    const ChunkCallback& on_chunk) override;

    /// Request body for one turn.
    std::string buildRequestBody(const std::string& message, const std::string& session_id) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::chat
