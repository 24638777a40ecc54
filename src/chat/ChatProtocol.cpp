/**
 * ChatProtocol.cpp - JSON reply normalization and SSE line parsing
 */

#include "parley/chat/ChatProtocol.hpp"

using json = nlohmann::json;

namespace parley::chat {

namespace {

std::optional<std::string> stringAt(const json& object, const char* key) {
    if (!object.is_object()) return std::nullopt;
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

EndpointBase splitBaseUrl(const std::string& url) {
    EndpointBase base;

    size_t scheme_end = url.find("://");
    size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    size_t path_start = url.find('/', host_start);

    if (path_start == std::string::npos) {
        base.origin = url;
        return base;
    }

    base.origin = url.substr(0, path_start);
    base.path_prefix = url.substr(path_start);
    while (!base.path_prefix.empty() && base.path_prefix.back() == '/') {
        base.path_prefix.pop_back();
    }
    return base;
}

std::optional<std::string> extractAssistantText(const json& payload) {
    if (!payload.is_object()) return std::nullopt;

    if (auto data = payload.find("data"); data != payload.end()) {
        if (auto text = stringAt(*data, "response")) return text;
    }

    if (auto text = stringAt(payload, "reply")) return text;

    if (auto message = payload.find("message"); message != payload.end()) {
        if (auto text = stringAt(*message, "content")) return text;
    }

    if (auto choices = payload.find("choices"); choices != payload.end() && choices->is_array()) {
        for (const auto& choice : *choices) {
            if (!choice.is_object()) continue;
            auto message = choice.find("message");
            if (message == choice.end()) continue;
            if (auto text = stringAt(*message, "content")) return text;
        }
    }

    return std::nullopt;
}

std::optional<std::string> extractConversationId(const json& payload) {
    if (!payload.is_object()) return std::nullopt;

    if (auto data = payload.find("data"); data != payload.end()) {
        if (auto id = stringAt(*data, "conversation_id")) return id;
    }
    if (auto message = payload.find("message"); message != payload.end()) {
        if (auto id = stringAt(*message, "conversation_id")) return id;
    }
    return std::nullopt;
}

SseEvent parseSseLine(const std::string& raw) {
    SseEvent event;

    size_t begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return event;
    size_t end = raw.find_last_not_of(" \t\r\n");
    const std::string line = raw.substr(begin, end - begin + 1);

    if (line.rfind("data:", 0) != 0) return event;

    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
        payload.erase(0, 1);
    }

    if (payload == "[DONE]") {
        event.kind = SseEvent::Kind::Done;
        return event;
    }

    json data = json::parse(payload, nullptr, false);
    if (data.is_discarded() || !data.is_object()) return event;

    auto choices = data.find("choices");
    if (choices == data.end() || !choices->is_array() || choices->empty()) return event;

    const json& choice = choices->front();
    if (!choice.is_object()) return event;
    auto delta = choice.find("delta");
    if (delta == choice.end()) return event;

    auto content = stringAt(*delta, "content");
    if (!content || content->empty()) return event;

    event.kind = SseEvent::Kind::Content;
    event.content = std::move(*content);
    return event;
}

std::vector<std::string> LineBuffer::feed(const char* data, size_t length) {
    std::vector<std::string> lines;
    buffer_.append(data, length);

    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }

    return lines;
}

std::string LineBuffer::takeRemainder() {
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

} // namespace parley::chat
