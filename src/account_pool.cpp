/**
 * @file account_pool.cpp
 * @brief Round-robin account pool implementation for chatrelay
 */

#include "chatrelay/account_pool.hpp"
#include "chatrelay/logger.hpp"

namespace chatrelay {

static bool is_eligible(const Account& account) {
    return !account.leased && account.error_count < UNHEALTHY_ERROR_THRESHOLD;
}

json PoolStatus::to_json() const {
    json entries = json::array();
    for (const auto& account : accounts) {
        entries.push_back({
            {"identity", account.identity},
            {"errors", account.errors},
            {"leased", account.leased},
            {"has_token", account.has_token},
            {"last_error", account.last_error}
        });
    }

    return {
        {"total", total},
        {"available", available},
        {"accounts", entries}
    };
}

AccountPool::AccountPool(CredentialStore& store) : store_(store) {}

std::size_t AccountPool::load() {
    std::vector<CredentialRecord> records = store_.load();

    std::vector<std::unique_ptr<Account>> accounts;
    accounts.reserve(records.size());
    for (const auto& record : records) {
        auto account = std::make_unique<Account>();
        account->identity = record.identity;
        account->slot = accounts.size();
        account->record_position = record.position;
        account->refresh_token = record.refresh_token;
        accounts.push_back(std::move(account));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    accounts_ = std::move(accounts);
    refresh_locks_ = std::make_unique<std::mutex[]>(accounts_.size());
    cursor_ = 0;

    CHATRELAY_LOG_INFO("Loaded {} accounts from {}", accounts_.size(), store_.path());
    return accounts_.size();
}

Account* AccountPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::size_t count = accounts_.size();
    if (count == 0) {
        return nullptr;
    }

    const std::size_t start = cursor_ % count;
    for (std::size_t i = 0; i < count; i++) {
        std::size_t index = (start + i) % count;
        Account& account = *accounts_[index];
        if (is_eligible(account)) {
            account.leased = true;
            cursor_ = (index + 1) % count;
            return &account;
        }
    }

    // Nothing eligible: availability wins over health
    Account& fallback = *accounts_[start];
    fallback.leased = true;
    cursor_ = (start + 1) % count;
    return &fallback;
}

void AccountPool::release(Account& account, const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    account.leased = false;
    if (error.has_value()) {
        if (account.error_count < UNHEALTHY_ERROR_THRESHOLD) {
            account.error_count++;
        }
        account.last_error = truncate(*error);
    } else {
        account.error_count = 0;
    }
}

std::mutex& AccountPool::refresh_lock(const Account& account) {
    return refresh_locks_[account.slot];
}

PoolStatus AccountPool::status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStatus status;
    status.total = accounts_.size();
    for (const auto& account : accounts_) {
        if (account->error_count < UNHEALTHY_ERROR_THRESHOLD) {
            status.available++;
        }
        status.accounts.push_back({
            account->identity,
            account->error_count,
            account->leased,
            account->has_token.load(),
            account->last_error
        });
    }
    return status;
}

std::size_t AccountPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

} // namespace chatrelay
