/**
 * @file types.hpp
 * @brief Type definitions for chatrelay
 */

#ifndef CHATRELAY_TYPES_HPP
#define CHATRELAY_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace chatrelay {

using json = nlohmann::json;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* UPSTREAM_BASE_URL = "https://chat.atxp.ai";
constexpr const char* UPSTREAM_REFRESH_PATH = "/api/auth/refresh";
constexpr const char* UPSTREAM_CHAT_PATH = "/api/agents/chat/ATXP";
constexpr const char* UPSTREAM_STREAM_PATH = "/api/agents/chat/stream/";
constexpr const char* UPSTREAM_MODELS_PATH = "/api/models";
constexpr const char* UPSTREAM_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36";
constexpr const char* REFRESH_COOKIE_NAME = "refreshToken";
constexpr const char* INVALID_MODEL_MARKER = "Invalid model spec";
constexpr const char* DEFAULT_MODEL = "anthropic/claude-opus-4-6";
constexpr const char* SERVED_NAMESPACE = "anthropic";

constexpr int64_t TOKEN_LIFETIME_MS = 900 * 1000;
constexpr int64_t TOKEN_REFRESH_BUFFER_MS = 60 * 1000;
constexpr int UNHEALTHY_ERROR_THRESHOLD = 5;
constexpr std::size_t ERROR_BODY_LIMIT = 200;

// =============================================================================
// Enums
// =============================================================================

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

enum class Role {
    User,
    Assistant,
    System
};

// =============================================================================
// Utility Functions
// =============================================================================

Role string_to_role(const std::string& str);
std::string log_level_to_string(LogLevel level);
LogLevel string_to_log_level(const std::string& str);

// =============================================================================
// Account
// =============================================================================

/**
 * One upstream account in the pool.
 *
 * Token fields are guarded by the pool's refresh lock for `slot` and are
 * only written by the TokenManager. Lease fields are guarded by the pool
 * mutex and are only written by the AccountPool.
 */
struct Account {
    std::string identity;
    std::size_t slot = 0;
    std::size_t record_position = 0;

    std::string refresh_token;
    std::string access_token;
    int64_t token_expiry_ms = 0;
    std::atomic<bool> has_token{false};

    bool leased = false;
    int error_count = 0;
    std::string last_error;
};

// =============================================================================
// Request Types
// =============================================================================

struct ChatMessage {
    Role role = Role::User;
    std::string content;
};

struct CompletionRequest {
    std::vector<ChatMessage> messages;
    std::string model = DEFAULT_MODEL;
    bool stream = false;

    static CompletionRequest from_json(const json& j);
};

// =============================================================================
// Callback Types
// =============================================================================

/// Writes one framed chunk downstream; returns false once the client is gone.
using ChunkWriter = std::function<bool(const std::string&)>;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * Map a client model identifier onto an upstream namespaced identifier.
 * @param model Identifier sent by the client
 * @return `anthropic/`- or `google/`-prefixed id for bare `claude-` and
 *         `gemini-` ids, otherwise the input unchanged
 */
std::string normalize_model(const std::string& model);

/**
 * Flatten a chat transcript into the single prompt text sent upstream.
 */
std::string messages_to_text(const std::vector<ChatMessage>& messages);

std::string truncate(const std::string& text, std::size_t limit = ERROR_BODY_LIMIT);
std::string generate_uuid();
std::string generate_response_id();
std::string get_current_timestamp();
int64_t current_time_ms();
int64_t current_time_seconds();

} // namespace chatrelay

#endif // CHATRELAY_TYPES_HPP
