/**
 * @file errors.hpp
 * @brief Exception types for chatrelay
 */

#ifndef CHATRELAY_ERRORS_HPP
#define CHATRELAY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace chatrelay {

/**
 * Base exception class for chatrelay errors
 *
 * Carries the status and error type used when the error is served to a
 * client as a structured JSON body.
 */
class ChatRelayError : public std::runtime_error {
public:
    explicit ChatRelayError(
        const std::string& message,
        const std::string& code = "",
        int http_status = 500,
        const std::string& type = "api_error"
    ) : std::runtime_error(message),
        code_(code),
        http_status_(http_status),
        type_(type) {}

    const std::string& code() const { return code_; }
    int http_status() const { return http_status_; }
    const std::string& type() const { return type_; }

    /**
     * Render the served error body
     * @return {"error": {"message", "type", "code"}}
     */
    nlohmann::json to_json() const;

protected:
    std::string code_;
    int http_status_;
    std::string type_;
};

/**
 * Configuration errors
 */
class ConfigurationError : public ChatRelayError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : ChatRelayError(message, "CONFIGURATION_ERROR"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Credentials file not found
 */
class CredentialsNotFoundError : public ConfigurationError {
public:
    explicit CredentialsNotFoundError(const std::string& credential_path)
        : ConfigurationError("Credentials not found at " + credential_path),
          credential_path_(credential_path) {}

    const std::string& credential_path() const { return credential_path_; }

private:
    std::string credential_path_;
};

/**
 * Credentials file could not be rewritten
 */
class StorageError : public ChatRelayError {
public:
    StorageError(const std::string& message, const std::string& path = "")
        : ChatRelayError(message, "STORAGE_ERROR"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Validation errors
 */
class ValidationError : public ChatRelayError {
public:
    ValidationError(const std::string& message, const std::string& field = "")
        : ChatRelayError(message, "VALIDATION_ERROR", 400, "invalid_request_error"),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * Authentication-related errors
 */
class AuthenticationError : public ChatRelayError {
public:
    explicit AuthenticationError(
        const std::string& message,
        int http_status = 401,
        const std::string& code = "AUTHENTICATION_ERROR"
    ) : ChatRelayError(message, code, http_status, "invalid_request_error") {}
};

/**
 * Token refresh failure
 */
class TokenRefreshError : public AuthenticationError {
public:
    TokenRefreshError(
        const std::string& message,
        std::optional<int> status_code = std::nullopt,
        const std::string& response_body = ""
    ) : AuthenticationError(message, 502, "TOKEN_REFRESH_ERROR"),
        status_code_(status_code),
        response_body_(response_body) {
        type_ = "api_error";
    }

    std::optional<int> status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }

private:
    std::optional<int> status_code_;
    std::string response_body_;
};

/**
 * No account can be leased
 */
class PoolExhaustedError : public ChatRelayError {
public:
    PoolExhaustedError()
        : ChatRelayError("No available accounts", "POOL_EXHAUSTED", 503, "service_unavailable") {}
};

/**
 * Connection errors
 */
class ConnectionError : public ChatRelayError {
public:
    explicit ConnectionError(const std::string& message, const std::string& endpoint = "")
        : ChatRelayError(message, "CONNECTION_ERROR", 502), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * Upstream answered with a failure
 */
class UpstreamError : public ChatRelayError {
public:
    UpstreamError(
        const std::string& message,
        int status_code = 0,
        const std::string& response_body = "",
        const std::string& endpoint = ""
    ) : ChatRelayError(message, "UPSTREAM_ERROR", 502),
        status_code_(status_code),
        response_body_(response_body),
        endpoint_(endpoint) {}

    int status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }
    const std::string& endpoint() const { return endpoint_; }

protected:
    int status_code_;
    std::string response_body_;
    std::string endpoint_;
};

/**
 * Upstream concurrency limit still hit after all retries
 */
class RateLimitError : public UpstreamError {
public:
    RateLimitError(const std::string& message, int attempts)
        : UpstreamError(message, 429), attempts_(attempts) {
        code_ = "RATE_LIMITED";
        http_status_ = 429;
        type_ = "rate_limit";
    }

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

/**
 * Upstream answered in a shape that could not be classified
 */
class UnexpectedResponseError : public UpstreamError {
public:
    UnexpectedResponseError(const std::string& message, const std::string& response_body = "")
        : UpstreamError(message, 200, response_body) {
        code_ = "UNEXPECTED_RESPONSE";
    }
};

/**
 * Model not served in the requested namespace
 */
class InvalidModelError : public ChatRelayError {
public:
    explicit InvalidModelError(const std::string& model)
        : ChatRelayError("Model '" + model + "' is not available on this endpoint",
                         "INVALID_MODEL", 400, "invalid_request_error"),
          model_(model) {}

    const std::string& model() const { return model_; }

private:
    std::string model_;
};

} // namespace chatrelay

#endif // CHATRELAY_ERRORS_HPP
