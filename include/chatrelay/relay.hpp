/**
 * @file relay.hpp
 * @brief Process-wide relay state for chatrelay
 */

#ifndef CHATRELAY_RELAY_HPP
#define CHATRELAY_RELAY_HPP

#include "types.hpp"
#include "account_pool.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "http_client.hpp"
#include "orchestrator.hpp"
#include "token_manager.hpp"
#include <memory>
#include <mutex>

namespace chatrelay {

/**
 * Relay options
 */
struct RelayOptions {
    std::string accounts_path = "results/accounts.json";
    TokenOptions tokens;
    UpstreamOptions upstream;

    /**
     * Derive relay options from server options
     */
    static RelayOptions from_server_options(const ServerOptions& server);
};

/**
 * Owns the credential store, account pool, transport, token manager and
 * orchestrator shared by every request
 */
class Relay {
public:
    /**
     * Create a relay
     * @param options Configuration options
     * @param http Upstream transport; a CurlHttpClient when null
     */
    explicit Relay(const RelayOptions& options = {}, std::shared_ptr<HttpClient> http = nullptr);

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    /**
     * Load the account pool
     * @throws ConfigurationError if no usable account was loaded
     */
    void start();

    bool started() const;

    /**
     * Start a completion whose response is streamed
     * @param request Completion request
     * @return Session with the upstream stream open
     */
    std::shared_ptr<ConversationSession> open(const CompletionRequest& request);

    /**
     * Run a completion and wait for the whole response
     * @param request Completion request
     * @return Completion object
     */
    json complete(const CompletionRequest& request);

    std::vector<std::string> list_models();

    PoolStatus status() const;

    AccountPool& pool() { return pool_; }
    CredentialStore& store() { return store_; }

private:
    RelayOptions options_;
    std::shared_ptr<HttpClient> http_;
    CredentialStore store_;
    AccountPool pool_;
    TokenManager tokens_;
    Orchestrator orchestrator_;
    bool started_;
    mutable std::mutex mutex_;
};

} // namespace chatrelay

#endif // CHATRELAY_RELAY_HPP
