/**
 * @file types.cpp
 * @brief Type implementations for chatrelay
 */

#include "chatrelay/types.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace chatrelay {

Role string_to_role(const std::string& str) {
    if (str == "assistant") return Role::Assistant;
    if (str == "system") return Role::System;
    return Role::User;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "none";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::All: return "all";
        default: return "info";
    }
}

LogLevel string_to_log_level(const std::string& str) {
    if (str == "none" || str == "off") return LogLevel::None;
    if (str == "error") return LogLevel::Error;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "debug") return LogLevel::Debug;
    if (str == "all" || str == "trace") return LogLevel::All;
    return LogLevel::Info;
}

static std::string extract_content(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (!content.is_array()) {
        return "";
    }

    std::string result;
    bool first = true;
    for (const auto& part : content) {
        if (!part.is_object() || !part.contains("type") || part["type"] != "text") {
            continue;
        }
        if (!first) result += " ";
        if (part.contains("text") && part["text"].is_string()) {
            result += part["text"].get<std::string>();
        }
        first = false;
    }
    return result;
}

CompletionRequest CompletionRequest::from_json(const json& j) {
    CompletionRequest request;

    if (j.contains("messages") && j["messages"].is_array()) {
        for (const auto& m : j["messages"]) {
            if (!m.is_object()) continue;
            ChatMessage msg;
            if (m.contains("role") && m["role"].is_string()) {
                msg.role = string_to_role(m["role"].get<std::string>());
            }
            if (m.contains("content")) {
                msg.content = extract_content(m["content"]);
            }
            request.messages.push_back(msg);
        }
    }

    if (j.contains("model") && j["model"].is_string()) {
        request.model = j["model"].get<std::string>();
    }
    if (j.contains("stream") && j["stream"].is_boolean()) {
        request.stream = j["stream"].get<bool>();
    }

    return request;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string normalize_model(const std::string& model) {
    if (model.find('/') != std::string::npos) {
        return model;
    }
    if (starts_with(model, "claude-")) {
        return "anthropic/" + model;
    }
    if (starts_with(model, "gemini-")) {
        return "google/" + model;
    }
    return model;
}

std::string messages_to_text(const std::vector<ChatMessage>& messages) {
    std::string text;
    for (size_t i = 0; i < messages.size(); i++) {
        if (i > 0) text += "\n\n";
        const auto& msg = messages[i];
        switch (msg.role) {
            case Role::System:
                text += "[System] " + msg.content;
                break;
            case Role::Assistant:
                text += "[Assistant] " + msg.content;
                break;
            default:
                text += msg.content;
                break;
        }
    }
    return text;
}

std::string truncate(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit);
}

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

std::string generate_response_id() {
    std::string hex;
    for (char c : generate_uuid()) {
        if (c != '-') hex += c;
        if (hex.size() == 12) break;
    }
    return "chatcmpl-" + hex;
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

int64_t current_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count();
}

int64_t current_time_seconds() {
    return current_time_ms() / 1000;
}

} // namespace chatrelay
