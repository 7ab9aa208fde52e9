/**
 * @file token_manager.cpp
 * @brief Access token lifecycle implementation for chatrelay
 */

#include "chatrelay/token_manager.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"

namespace chatrelay {

// Extracts the value of `refreshToken=<value>;` from a Set-Cookie header.
static std::optional<std::string> rotated_credential(const std::string& set_cookie) {
    const std::string prefix = std::string(REFRESH_COOKIE_NAME) + "=";

    size_t pos = set_cookie.find(prefix);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    size_t start = pos + prefix.size();
    size_t end = set_cookie.find(';', start);
    std::string value = set_cookie.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

TokenManager::TokenManager(
    AccountPool& pool,
    CredentialStore& store,
    HttpClient& http,
    const TokenOptions& options
) : pool_(pool),
    store_(store),
    http_(http),
    options_(options) {}

bool TokenManager::is_token_valid(const Account& account, int64_t now_ms) {
    if (!account.has_token.load() || account.access_token.empty()) {
        return false;
    }
    return now_ms < account.token_expiry_ms - TOKEN_REFRESH_BUFFER_MS;
}

std::string TokenManager::ensure_token(Account& account) {
    std::lock_guard<std::mutex> lock(pool_.refresh_lock(account));

    // Re-checked under the lock: a concurrent caller may have refreshed
    if (!is_token_valid(account, current_time_ms())) {
        refresh(account);
    }

    return account.access_token;
}

void TokenManager::refresh(Account& account) {
    CHATRELAY_LOG_DEBUG("Refreshing access token for {}", account.identity);

    HttpRequest request;
    request.url = options_.base_url + UPSTREAM_REFRESH_PATH;
    request.headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
        {"Cookie", std::string(REFRESH_COOKIE_NAME) + "=" + account.refresh_token},
        {"Origin", options_.base_url},
        {"User-Agent", UPSTREAM_USER_AGENT}
    };
    request.body = "{}";
    request.timeout = options_.timeout;

    HttpResponse response;
    try {
        response = http_.post(request);
    } catch (const ConnectionError& e) {
        throw TokenRefreshError(std::string("Token refresh failed: ") + e.what());
    }

    if (response.status_code != 200) {
        throw TokenRefreshError(
            "Token refresh failed: " + std::to_string(response.status_code),
            response.status_code,
            truncate(response.body)
        );
    }

    json data = json::parse(response.body, nullptr, false);
    if (data.is_discarded() || !data.is_object() || !data.contains("token") ||
        !data["token"].is_string() || data["token"].get<std::string>().empty()) {
        throw TokenRefreshError(
            "Token refresh response missing token",
            response.status_code,
            truncate(response.body)
        );
    }

    account.access_token = data["token"].get<std::string>();
    account.token_expiry_ms = current_time_ms() + TOKEN_LIFETIME_MS;
    account.has_token.store(true);

    for (const auto& set_cookie : response.header_values("set-cookie")) {
        std::optional<std::string> credential = rotated_credential(set_cookie);
        if (!credential.has_value() || *credential == account.refresh_token) {
            continue;
        }

        account.refresh_token = *credential;
        store_.rotate(account.record_position, *credential);
        CHATRELAY_LOG_INFO("Rotated refresh credential for {}", account.identity);
        break;
    }

    CHATRELAY_LOG_INFO("Refreshed access token for {}", account.identity);
}

} // namespace chatrelay
