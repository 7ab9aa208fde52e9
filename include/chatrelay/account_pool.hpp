/**
 * @file account_pool.hpp
 * @brief Round-robin account pool for chatrelay
 */

#ifndef CHATRELAY_ACCOUNT_POOL_HPP
#define CHATRELAY_ACCOUNT_POOL_HPP

#include "types.hpp"
#include "credential_store.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace chatrelay {

/**
 * Point-in-time view of one account
 */
struct AccountStatus {
    std::string identity;
    int errors = 0;
    bool leased = false;
    bool has_token = false;
    std::string last_error;
};

/**
 * Point-in-time view of the pool
 */
struct PoolStatus {
    std::size_t total = 0;
    std::size_t available = 0;
    std::vector<AccountStatus> accounts;

    json to_json() const;
};

/**
 * Registry of upstream accounts with lease bookkeeping
 *
 * Selection and release run under one pool-wide mutex that never covers
 * I/O. Each account also owns a refresh mutex, allocated when the pool is
 * loaded, that serializes token refreshes for that account only.
 */
class AccountPool {
public:
    /**
     * Create a pool over a credential store
     * @param store Store the accounts are loaded from
     */
    explicit AccountPool(CredentialStore& store);

    AccountPool(const AccountPool&) = delete;
    AccountPool& operator=(const AccountPool&) = delete;

    /**
     * Load accounts from the store, replacing any previous registry
     * @return Number of accounts loaded
     */
    std::size_t load();

    /**
     * Lease the next account
     *
     * Scans one full cycle from the cursor for an account that is neither
     * leased nor unhealthy. When none qualifies, the account at the
     * starting position is leased anyway.
     *
     * @return Leased account, or nullptr if the pool is empty
     */
    Account* acquire();

    /**
     * Return a leased account
     * @param account Account from acquire()
     * @param error Diagnostic for a failed use; std::nullopt for a clean use
     */
    void release(Account& account, const std::optional<std::string>& error = std::nullopt);

    /**
     * Mutex serializing token refreshes of one account
     */
    std::mutex& refresh_lock(const Account& account);

    PoolStatus status() const;

    std::size_t size() const;

private:
    CredentialStore& store_;
    std::vector<std::unique_ptr<Account>> accounts_;
    std::unique_ptr<std::mutex[]> refresh_locks_;
    std::size_t cursor_ = 0;
    mutable std::mutex mutex_;
};

} // namespace chatrelay

#endif // CHATRELAY_ACCOUNT_POOL_HPP
