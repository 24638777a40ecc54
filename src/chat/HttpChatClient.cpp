/**
 * HttpChatClient.cpp - JSON chat endpoint over cpp-httplib
 */

#include "parley/chat/HttpChatClient.hpp"
#include "parley/Errors.hpp"
#include "parley/chat/ChatProtocol.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley::chat {

struct HttpChatClient::Impl {
    HttpChatOptions options;
    std::string endpoint_path;
    std::string endpoint_url;
    std::unique_ptr<httplib::Client> client;

    explicit Impl(HttpChatOptions opts) : options(std::move(opts)) {
        EndpointBase base = splitBaseUrl(options.base_url);
        endpoint_path = base.path_prefix + "/chat";
        endpoint_url = base.origin + endpoint_path;

        client = std::make_unique<httplib::Client>(base.origin);
        client->set_connection_timeout(options.timeout_seconds, 0);
        client->set_read_timeout(options.timeout_seconds, 0);
        client->set_write_timeout(options.timeout_seconds, 0);

        if (!options.api_key.empty()) {
            client->set_bearer_token_auth(options.api_key);
        }
    }
};

HttpChatClient::HttpChatClient(HttpChatOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
}

HttpChatClient::~HttpChatClient() = default;

ChatReply HttpChatClient::chat(const std::string& message,
                               const std::string& session_id,
                               bool debug) {
    json req_json = {
        {"message", message},
        {"conversation_id", session_id},
        {"debug", debug}
    };

    httplib::Headers headers = {
        {"Accept", "application/json"}
    };

    std::cout << "[ChatClient] Sending to " << impl_->endpoint_url << "..." << std::endl;

    auto res = impl_->client->Post(impl_->endpoint_path, headers, req_json.dump(), "application/json");

    if (!res) {
        throw ChatError("Chat request could not reach the server: " + httplib::to_string(res.error()));
    }

    if (res->status != 200) {
        throw ChatError("Chat request failed (" + std::to_string(res->status) + "): " + res->body);
    }

    std::cout << "[ChatClient] Received response (" << res->body.size() << " bytes)" << std::endl;

    const std::string content_type = res->get_header_value("Content-Type");
    if (content_type.find("application/json") == std::string::npos) {
        throw ChatError("Unexpected content type: " + content_type);
    }

    json payload = json::parse(res->body, nullptr, false);
    if (payload.is_discarded()) {
        throw ChatError("Chat response was not valid JSON");
    }

    auto text = extractAssistantText(payload);
    if (!text) {
        throw ChatError("Chat response did not contain assistant content");
    }

    ChatReply reply;
    reply.text = std::move(*text);
    reply.session_id = extractConversationId(payload);
    return reply;
}

} // namespace parley::chat
