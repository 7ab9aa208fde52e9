/**
 * @file orchestrator.cpp
 * @brief Two-phase upstream conversation driver implementation for chatrelay
 */

#include "chatrelay/orchestrator.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"
#include "chatrelay/sse.hpp"
#include <thread>

namespace chatrelay {

static constexpr const char* ZERO_MESSAGE_ID = "00000000-0000-0000-0000-000000000000";

// Pool diagnostic recorded for a failed request.
static std::string diagnostic(const ChatRelayError& e) {
    if (dynamic_cast<const RateLimitError*>(&e)) {
        return "concurrent_limit";
    }
    return e.what();
}

Orchestrator::Orchestrator(
    AccountPool& pool,
    TokenManager& tokens,
    HttpClient& http,
    const UpstreamOptions& options
) : pool_(pool),
    tokens_(tokens),
    http_(http),
    options_(options) {
    if (!options_.sleep) {
        options_.sleep = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

std::map<std::string, std::string> Orchestrator::build_headers(
    const std::string& access_token,
    bool with_body
) const {
    std::map<std::string, std::string> headers = {
        {"Authorization", "Bearer " + access_token},
        {"Accept", "application/json, text/plain, */*"},
        {"Origin", options_.base_url},
        {"Referer", options_.base_url + "/c/new"},
        {"User-Agent", UPSTREAM_USER_AGENT}
    };
    if (with_body) {
        headers["Content-Type"] = "application/json";
    }
    return headers;
}

json Orchestrator::build_payload(const std::string& text, const std::string& upstream_model) const {
    return {
        {"text", text},
        {"sender", "User"},
        {"clientTimestamp", get_current_timestamp()},
        {"isCreatedByUser", true},
        {"parentMessageId", ZERO_MESSAGE_ID},
        {"messageId", generate_uuid()},
        {"error", false},
        {"endpoint", "ATXP"},
        {"endpointType", "custom"},
        {"model", upstream_model},
        {"modelLabel", nullptr},
        {"spec", upstream_model},
        {"key", "never"},
        {"isTemporary", true},
        {"isRegenerate", false},
        {"isContinued", false},
        {"conversationId", nullptr},
        {"ephemeralAgent", {
            {"mcp", json::array({"sys__clear__sys"})},
            {"web_search", false},
            {"file_search", false},
            {"execute_code", false},
            {"artifacts", false}
        }}
    };
}

void Orchestrator::backoff(int attempt) {
    options_.sleep(options_.backoff_base * (1 << attempt));
}

std::shared_ptr<ConversationSession> Orchestrator::open(const CompletionRequest& request) {
    const std::string text = messages_to_text(request.messages);
    if (text.empty()) {
        throw ValidationError("No messages", "messages");
    }

    Account* account = pool_.acquire();
    if (!account) {
        throw PoolExhaustedError();
    }

    auto lease = std::make_unique<Lease>(pool_, *account);
    const std::string upstream_model = normalize_model(request.model);

    try {
        std::string access_token = tokens_.ensure_token(*account);
        json payload = build_payload(text, upstream_model);

        std::string conversation_id = initiate(*account, access_token, payload, request.model);
        CHATRELAY_LOG_INFO("[{}] Chat started: conv={} model={}",
                           account->identity, conversation_id.substr(0, 12), upstream_model);

        auto upstream = open_stream(access_token, conversation_id);
        return std::make_shared<ConversationSession>(
            std::move(lease), request.model, upstream_model, conversation_id, std::move(upstream));
    } catch (const InvalidModelError&) {
        // Not the account's fault
        lease->release();
        throw;
    } catch (const ChatRelayError& e) {
        lease->release(diagnostic(e));
        throw;
    } catch (const std::exception& e) {
        lease->release(std::string(e.what()));
        throw;
    }
}

json Orchestrator::complete(const CompletionRequest& request) {
    auto session = open(request);
    return session->collect();
}

std::string Orchestrator::initiate(
    const Account& account,
    const std::string& access_token,
    const json& payload,
    const std::string& model
) {
    HttpRequest request;
    request.url = options_.base_url + UPSTREAM_CHAT_PATH;
    request.headers = build_headers(access_token, true);
    request.body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    request.timeout = options_.init_timeout;

    for (int attempt = 0; attempt < options_.max_attempts; attempt++) {
        HttpResponse response = http_.post(request);

        if (response.status_code == 429) {
            CHATRELAY_LOG_WARN("[{}] Upstream concurrency limit (attempt {}/{}): {}",
                               account.identity, attempt + 1, options_.max_attempts,
                               truncate(response.body, 100));
            if (attempt + 1 < options_.max_attempts) {
                backoff(attempt);
                continue;
            }
            throw RateLimitError("Server busy, please retry later", attempt + 1);
        }

        if (response.status_code != 200) {
            std::string body = truncate(response.body);
            throw UpstreamError(
                "Chat init failed [" + std::to_string(response.status_code) + "]: " + body,
                response.status_code, body, request.url);
        }

        if (response.header("content-type").find("application/json") == std::string::npos) {
            classify_event_body(response.body, model);
        }

        json data = json::parse(response.body, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            throw UpstreamError("Chat init returned invalid JSON", 200, truncate(response.body), request.url);
        }

        std::string conversation_id;
        if (data.contains("conversationId") && data["conversationId"].is_string()) {
            conversation_id = data["conversationId"].get<std::string>();
        }
        if (conversation_id.empty()) {
            throw UpstreamError("No conversationId in response", 200, truncate(response.body), request.url);
        }
        return conversation_id;
    }

    throw UpstreamError("Max retries exceeded", 0, "", request.url);
}

void Orchestrator::classify_event_body(const std::string& body, const std::string& model) {
    SseDecoder decoder;
    std::vector<UpstreamEvent> events = decoder.feed(body);
    for (auto& event : decoder.finish()) {
        events.push_back(std::move(event));
    }

    for (const auto& event : events) {
        if (event.kind == UpstreamEvent::Kind::InvalidModel) {
            throw InvalidModelError(model);
        }
        if (event.kind == UpstreamEvent::Kind::Error) {
            throw UpstreamError("Upstream error: " + event.text, 200, truncate(body));
        }
    }

    throw UnexpectedResponseError("Unexpected response format", truncate(body));
}

std::unique_ptr<ByteStream> Orchestrator::open_stream(
    const std::string& access_token,
    const std::string& conversation_id
) {
    HttpRequest request;
    request.url = options_.base_url + UPSTREAM_STREAM_PATH + conversation_id;
    request.headers = build_headers(access_token, false);
    request.timeout = options_.stream_timeout;

    std::unique_ptr<ByteStream> upstream = http_.open_stream(request);
    if (upstream->status_code() != 200) {
        int status = upstream->status_code();
        std::string body;
        try {
            body = truncate(upstream->read_all());
        } catch (const ConnectionError& e) {
            CHATRELAY_LOG_DEBUG("Failed to read stream error body: {}", e.what());
        }
        throw UpstreamError("Stream [" + std::to_string(status) + "]", status, body, request.url);
    }
    return upstream;
}

std::vector<std::string> Orchestrator::list_models() {
    Account* account = pool_.acquire();
    if (!account) {
        throw PoolExhaustedError();
    }

    Lease lease(pool_, *account);
    std::vector<std::string> models;

    try {
        HttpRequest request;
        request.url = options_.base_url + UPSTREAM_MODELS_PATH;
        request.headers = {
            {"Authorization", "Bearer " + tokens_.ensure_token(*account)},
            {"Accept", "application/json"},
            {"User-Agent", UPSTREAM_USER_AGENT}
        };
        request.timeout = options_.models_timeout;

        HttpResponse response = http_.get(request);
        if (response.status_code != 200) {
            throw UpstreamError(
                "Model listing failed [" + std::to_string(response.status_code) + "]",
                response.status_code, truncate(response.body), request.url);
        }

        json data = json::parse(response.body, nullptr, false);
        if (data.is_discarded()) {
            throw UpstreamError("Model listing returned invalid JSON", 200, truncate(response.body), request.url);
        }

        if (data.is_object() && data.contains(SERVED_NAMESPACE) && data[SERVED_NAMESPACE].is_array()) {
            for (const auto& name : data[SERVED_NAMESPACE]) {
                if (name.is_string()) {
                    models.push_back(std::string(SERVED_NAMESPACE) + "/" + name.get<std::string>());
                }
            }
        }
    } catch (const std::exception& e) {
        lease.release(std::string(e.what()));
        throw;
    }

    lease.release();
    return models;
}

} // namespace chatrelay
