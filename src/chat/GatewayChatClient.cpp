/**
 * GatewayChatClient.cpp - SSE chat completions over cpp-httplib
 *
 * Uses Request.content_receiver so chunks reach the caller while the
 * gateway is still generating.
 */

#include "parley/chat/GatewayChatClient.hpp"
#include "parley/Errors.hpp"
#include "parley/chat/ChatProtocol.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley::chat {

namespace {

constexpr size_t kMaxErrorBody = 512;

} // anonymous namespace

struct GatewayChatClient::Impl {
    GatewayOptions options;
    std::string endpoint_path;
    std::string model;
    std::unique_ptr<httplib::Client> client;

    explicit Impl(GatewayOptions opts) : options(std::move(opts)) {
        EndpointBase base = splitBaseUrl(options.gateway_url);
        endpoint_path = base.path_prefix + "/v1/chat/completions";
        model = "openclaw:" + options.agent_id;

        client = std::make_unique<httplib::Client>(base.origin);
        client->set_connection_timeout(options.timeout_seconds, 0);
        client->set_read_timeout(options.timeout_seconds, 0);
        client->set_write_timeout(options.timeout_seconds, 0);
    }
};

GatewayChatClient::GatewayChatClient(GatewayOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
    std::cout << "[GatewayClient] " << impl_->options.gateway_url << impl_->endpoint_path
              << " (model " << impl_->model << ")" << std::endl;
}

GatewayChatClient::~GatewayChatClient() = default;

std::string GatewayChatClient::buildRequestBody(const std::string& message,
                                                const std::string& session_id) const {
    json messages = json::array();
    if (!impl_->options.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", impl_->options.system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", message}});

    json req_json = {
        {"model", impl_->model},
        {"messages", messages},
        {"user", session_id},
        {"stream", true}
    };
    return req_json.dump();
}

ChatReply GatewayChatClient::chat(const std::string& message,
                                  const std::string& session_id,
                                  bool debug) {
    std::stringstream full_content;
    size_t chunks = 0;

    chatStream(message, session_id, debug, [&](const std::string& chunk) {
        full_content << chunk;
        chunks++;
        return true;
    });

    ChatReply reply;
    reply.text = full_content.str();
    if (reply.text.empty()) {
        throw ChatError("Empty response from gateway");
    }

    if (impl_->options.verbose) {
        std::cout << "[GatewayClient] Accumulated " << chunks << " chunks" << std::endl;
    }
    return reply;
}

void GatewayChatClient::chatStream(const std::string& message,
                                   const std::string& session_id,
                                   bool /*debug*/,
                                   const ChunkCallback& on_chunk) {
    const bool verbose = impl_->options.verbose;

    httplib::Request req;
    req.method = "POST";
    req.path = impl_->endpoint_path;
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "text/event-stream");
    if (!impl_->options.token.empty()) {
        req.set_header("Authorization", "Bearer " + impl_->options.token);
    }
    req.body = buildRequestBody(message, session_id);

    int status = 0;
    std::string error_body;
    LineBuffer lines;
    bool done = false;
    bool stopped = false;
    std::exception_ptr callback_error;

    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        return true;
    };

    // Returning false here ends the transfer; the reason is tracked in done/stopped
    req.content_receiver = [&](const char* data, size_t data_length,
                               uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
        if (status != 200) {
            if (error_body.size() < kMaxErrorBody) {
                error_body.append(data, std::min(data_length, kMaxErrorBody - error_body.size()));
            }
            return true;
        }

        for (const auto& line : lines.feed(data, data_length)) {
            SseEvent event = parseSseLine(line);

            if (event.kind == SseEvent::Kind::Done) {
                done = true;
                return false;
            }
            if (event.kind != SseEvent::Kind::Content) {
                continue;
            }

            if (verbose) {
                std::cout << event.content << std::flush;
            }

            try {
                if (!on_chunk(event.content)) {
                    stopped = true;
                    return false;
                }
            } catch (...) {
                callback_error = std::current_exception();
                return false;
            }
        }
        return true;
    };

    auto result = impl_->client->send(req);

    if (verbose) {
        std::cout << std::endl;
    }

    if (callback_error) {
        std::rethrow_exception(callback_error);
    }

    if (status != 0 && status != 200) {
        throw ChatError("Gateway HTTP " + std::to_string(status) + ": " + error_body);
    }

    if (!result && !done && !stopped) {
        throw ChatError("Gateway stream failed: " + httplib::to_string(result.error()));
    }

    // A final event without a trailing newline
    if (!done && !stopped) {
        SseEvent tail = parseSseLine(lines.takeRemainder());
        if (tail.kind == SseEvent::Kind::Content) {
            on_chunk(tail.content);
        }
    }

    if (stopped) {
        std::cout << "[GatewayClient] Stream stopped by consumer" << std::endl;
    }
}

} // namespace parley::chat
