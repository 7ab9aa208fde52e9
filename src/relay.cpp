/**
 * @file relay.cpp
 * @brief Process-wide relay state implementation for chatrelay
 */

#include "chatrelay/relay.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"

namespace chatrelay {

RelayOptions RelayOptions::from_server_options(const ServerOptions& server) {
    RelayOptions options;
    options.accounts_path = server.accounts_path;
    options.tokens.base_url = server.upstream_base_url;
    options.upstream.base_url = server.upstream_base_url;
    return options;
}

Relay::Relay(const RelayOptions& options, std::shared_ptr<HttpClient> http)
    : options_(options),
      http_(http ? std::move(http) : std::make_shared<CurlHttpClient>()),
      store_(options_.accounts_path),
      pool_(store_),
      tokens_(pool_, store_, *http_, options_.tokens),
      orchestrator_(pool_, tokens_, *http_, options_.upstream),
      started_(false) {
}

void Relay::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (started_) {
        return;
    }

    std::size_t count = pool_.load();
    if (count == 0) {
        throw ConfigurationError("No usable accounts in " + store_.path(), "accounts");
    }

    started_ = true;
    CHATRELAY_LOG_INFO("Relay ready with {} accounts, upstream {}", count, options_.upstream.base_url);
}

bool Relay::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

std::shared_ptr<ConversationSession> Relay::open(const CompletionRequest& request) {
    return orchestrator_.open(request);
}

json Relay::complete(const CompletionRequest& request) {
    return orchestrator_.complete(request);
}

std::vector<std::string> Relay::list_models() {
    return orchestrator_.list_models();
}

PoolStatus Relay::status() const {
    return pool_.status();
}

} // namespace chatrelay
