/**
 * @file orchestrator.hpp
 * @brief Two-phase upstream conversation driver for chatrelay
 */

#ifndef CHATRELAY_ORCHESTRATOR_HPP
#define CHATRELAY_ORCHESTRATOR_HPP

#include "types.hpp"
#include "account_pool.hpp"
#include "http_client.hpp"
#include "session.hpp"
#include "token_manager.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace chatrelay {

/**
 * Upstream call options
 */
struct UpstreamOptions {
    std::string base_url = UPSTREAM_BASE_URL;
    double init_timeout = 30.0;
    double stream_timeout = 300.0;
    double models_timeout = 30.0;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
    /// Backoff delay; std::this_thread::sleep_for when unset.
    std::function<void(std::chrono::milliseconds)> sleep;
};

/**
 * Drives one completion through conversation initiation (phase 1) and
 * stream retrieval (phase 2)
 *
 * Every failure before the session is handed out releases the lease,
 * with a diagnostic unless the account is not at fault.
 */
class Orchestrator {
public:
    /**
     * Create an orchestrator
     * @param pool Account pool
     * @param tokens Token manager
     * @param http Upstream transport
     * @param options Configuration options
     */
    Orchestrator(
        AccountPool& pool,
        TokenManager& tokens,
        HttpClient& http,
        const UpstreamOptions& options = {}
    );

    /**
     * Lease an account and run both phases
     * @param request Completion request
     * @return Session with the phase-2 stream open
     * @throws ValidationError if the request carries no messages
     * @throws PoolExhaustedError if the pool is empty
     * @throws InvalidModelError if upstream rejects the model
     * @throws RateLimitError if every attempt hit the concurrency limit
     * @throws ChatRelayError for any other upstream failure
     */
    std::shared_ptr<ConversationSession> open(const CompletionRequest& request);

    /**
     * Run a completion and wait for the whole response
     * @param request Completion request
     * @return Completion object
     */
    json complete(const CompletionRequest& request);

    /**
     * List models served in the supported namespace
     * @return Namespaced model ids
     */
    std::vector<std::string> list_models();

private:
    std::map<std::string, std::string> build_headers(const std::string& access_token, bool with_body) const;
    json build_payload(const std::string& text, const std::string& upstream_model) const;
    std::string initiate(const Account& account, const std::string& access_token,
                         const json& payload, const std::string& model);
    std::unique_ptr<ByteStream> open_stream(const std::string& access_token,
                                            const std::string& conversation_id);
    [[noreturn]] void classify_event_body(const std::string& body, const std::string& model);
    void backoff(int attempt);

    AccountPool& pool_;
    TokenManager& tokens_;
    HttpClient& http_;
    UpstreamOptions options_;
};

} // namespace chatrelay

#endif // CHATRELAY_ORCHESTRATOR_HPP
