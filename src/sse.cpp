/**
 * @file sse.cpp
 * @brief Upstream event-stream decoding implementation for chatrelay
 */

#include "chatrelay/sse.hpp"
#include <sstream>

namespace chatrelay {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static bool is_truthy(const json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>() != 0;
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string() || value.is_array() || value.is_object()) return !value.empty();
    return true;
}

static std::string string_field(const json& object, const char* key) {
    if (!object.contains(key) || !object[key].is_string()) return "";
    return object[key].get<std::string>();
}

static std::string delta_text(const json& payload) {
    if (!payload.contains("data") || !payload["data"].is_object()) return "";
    const json& data = payload["data"];
    if (!data.contains("delta") || !data["delta"].is_object()) return "";
    const json& delta = data["delta"];
    if (!delta.contains("content") || !delta["content"].is_array()) return "";

    for (const auto& part : delta["content"]) {
        if (part.is_object() && string_field(part, "type") == "text") {
            return string_field(part, "text");
        }
    }
    return "";
}

UpstreamEvent classify_payload(const json& payload) {
    UpstreamEvent event;
    if (!payload.is_object()) {
        return event;
    }

    if (string_field(payload, "event") == "on_message_delta") {
        event.kind = UpstreamEvent::Kind::Delta;
        event.text = delta_text(payload);
        return event;
    }

    bool has_text = payload.contains("text") && payload["text"].is_string();
    if (has_text && payload["text"].get<std::string>() == INVALID_MODEL_MARKER) {
        event.kind = UpstreamEvent::Kind::InvalidModel;
        event.text = INVALID_MODEL_MARKER;
        return event;
    }

    if (payload.contains("error") && is_truthy(payload["error"])) {
        event.kind = UpstreamEvent::Kind::Error;
        event.text = has_text ? payload["text"].get<std::string>() : truncate(payload.dump());
        return event;
    }

    return event;
}

std::vector<UpstreamEvent> SseDecoder::feed(const std::string& bytes) {
    for (char c : bytes) {
        if (c != '\r') buffer_ += c;
    }

    std::vector<UpstreamEvent> events;
    size_t pos;
    while ((pos = buffer_.find("\n\n")) != std::string::npos) {
        std::string block = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 2);
        decode_block(block, events);
    }
    return events;
}

std::vector<UpstreamEvent> SseDecoder::finish() {
    std::vector<UpstreamEvent> events;
    if (!buffer_.empty()) {
        decode_block(buffer_, events);
        buffer_.clear();
    }
    return events;
}

void SseDecoder::decode_block(const std::string& block, std::vector<UpstreamEvent>& events) {
    std::istringstream stream(block);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.compare(0, 5, "data:") != 0) {
            continue;
        }

        std::string data = trim(line.substr(5));
        if (data == "[DONE]") {
            UpstreamEvent done;
            done.kind = UpstreamEvent::Kind::Done;
            events.push_back(done);
            continue;
        }

        json payload = json::parse(data, nullptr, false);
        if (payload.is_discarded()) {
            continue;
        }
        events.push_back(classify_payload(payload));
    }
}

} // namespace chatrelay
