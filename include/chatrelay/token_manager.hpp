/**
 * @file token_manager.hpp
 * @brief Access token lifecycle for chatrelay
 */

#ifndef CHATRELAY_TOKEN_MANAGER_HPP
#define CHATRELAY_TOKEN_MANAGER_HPP

#include "types.hpp"
#include "account_pool.hpp"
#include "credential_store.hpp"
#include "http_client.hpp"

namespace chatrelay {

/**
 * Token manager options
 */
struct TokenOptions {
    std::string base_url = UPSTREAM_BASE_URL;
    double timeout = 15.0;
};

/**
 * Exchanges each account's rotating credential for short-lived access
 * tokens and persists credential rotation.
 */
class TokenManager {
public:
    /**
     * Create a token manager
     * @param pool Pool owning the per-account refresh locks
     * @param store Store that rotated credentials are written to
     * @param http Upstream transport
     * @param options Configuration options
     */
    TokenManager(
        AccountPool& pool,
        CredentialStore& store,
        HttpClient& http,
        const TokenOptions& options = {}
    );

    /**
     * Ensure the account holds a valid access token
     *
     * Holds the account's refresh lock for the whole check, so concurrent
     * callers on one account cause a single refresh while other accounts
     * refresh independently.
     *
     * @param account Leased account
     * @return Access token
     * @throws TokenRefreshError if the upstream refresh fails
     * @throws StorageError if a rotated credential cannot be persisted
     */
    std::string ensure_token(Account& account);

    /**
     * Check whether the cached token is outside the refresh margin
     */
    static bool is_token_valid(const Account& account, int64_t now_ms);

private:
    void refresh(Account& account);

    AccountPool& pool_;
    CredentialStore& store_;
    HttpClient& http_;
    TokenOptions options_;
};

} // namespace chatrelay

#endif // CHATRELAY_TOKEN_MANAGER_HPP
