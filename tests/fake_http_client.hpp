/**
 * @file fake_http_client.hpp
 * @brief Scripted upstream transport for chatrelay tests
 */

#ifndef CHATRELAY_TESTS_FAKE_HTTP_CLIENT_HPP
#define CHATRELAY_TESTS_FAKE_HTTP_CLIENT_HPP

#include "chatrelay/errors.hpp"
#include "chatrelay/http_client.hpp"
#include "chatrelay/types.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace chatrelay {
namespace test {

/**
 * Byte stream replaying fixed chunks, optionally failing after the last one
 */
class FakeByteStream : public ByteStream {
public:
    FakeByteStream(int status, std::vector<std::string> chunks, bool fail_at_end = false)
        : status_(status), chunks_(std::move(chunks)), fail_at_end_(fail_at_end) {}

    int status_code() const override { return status_; }

    bool next(std::string& chunk) override {
        if (index_ < chunks_.size()) {
            chunk = chunks_[index_++];
            return true;
        }
        if (fail_at_end_) {
            throw ConnectionError("Connection reset by peer");
        }
        return false;
    }

private:
    int status_;
    std::vector<std::string> chunks_;
    bool fail_at_end_;
    std::size_t index_ = 0;
};

/**
 * Transport whose responses are produced by per-test handlers
 */
class FakeHttpClient : public HttpClient {
public:
    using ResponseHandler = std::function<HttpResponse(const HttpRequest&)>;
    using StreamHandler = std::function<std::unique_ptr<ByteStream>(const HttpRequest&)>;

    ResponseHandler on_post;
    ResponseHandler on_get;
    StreamHandler on_stream;

    HttpResponse post(const HttpRequest& request) override {
        record(request);
        post_calls++;
        if (!on_post) throw ConnectionError("No POST handler", request.url);
        return on_post(request);
    }

    HttpResponse get(const HttpRequest& request) override {
        record(request);
        get_calls++;
        if (!on_get) throw ConnectionError("No GET handler", request.url);
        return on_get(request);
    }

    std::unique_ptr<ByteStream> open_stream(const HttpRequest& request) override {
        record(request);
        stream_calls++;
        if (!on_stream) throw ConnectionError("No stream handler", request.url);
        return on_stream(request);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    /// Requests whose URL ends with @p path.
    std::vector<HttpRequest> requests_to(const std::string& path) const {
        std::vector<HttpRequest> matched;
        for (const auto& request : requests()) {
            if (request.url.size() >= path.size() &&
                request.url.compare(request.url.size() - path.size(), path.size(), path) == 0) {
                matched.push_back(request);
            }
        }
        return matched;
    }

    std::atomic<int> post_calls{0};
    std::atomic<int> get_calls{0};
    std::atomic<int> stream_calls{0};

private:
    void record(const HttpRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    mutable std::mutex mutex_;
    std::vector<HttpRequest> requests_;
};

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline HttpResponse make_response(int status, const std::string& body,
                                  const std::string& content_type = "application/json; charset=utf-8") {
    HttpResponse response;
    response.status_code = status;
    response.body = body;
    response.headers.emplace("content-type", content_type);
    return response;
}

inline HttpResponse refresh_response(const std::string& token, const std::string& rotated = "") {
    HttpResponse response = make_response(200, json({{"token", token}}).dump());
    if (!rotated.empty()) {
        response.headers.emplace("set-cookie", "refreshToken=" + rotated + "; Path=/api/auth/refresh; HttpOnly; Secure");
    }
    return response;
}

inline std::string delta_event(const std::string& text) {
    json event = {
        {"event", "on_message_delta"},
        {"data", {{"delta", {{"content", json::array({{{"type", "text"}, {"text", text}}})}}}}}
    };
    return "data: " + event.dump() + "\n\n";
}

/**
 * Credentials file in the system temp directory, removed on destruction
 */
class TempAccountsFile {
public:
    explicit TempAccountsFile(const json& document) {
        std::random_device rd;
        std::stringstream name;
        name << "chatrelay-accounts-" << std::hex << rd() << rd() << ".json";
        path_ = (std::filesystem::temp_directory_path() / name.str()).string();
        write(document.dump(2));
    }

    ~TempAccountsFile() {
        std::error_code ignored;
        std::filesystem::remove(path_, ignored);
        std::filesystem::remove(path_ + ".tmp", ignored);
    }

    TempAccountsFile(const TempAccountsFile&) = delete;
    TempAccountsFile& operator=(const TempAccountsFile&) = delete;

    void write(const std::string& content) const {
        std::ofstream file(path_, std::ios::trunc);
        file << content;
    }

    json read() const {
        std::ifstream file(path_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return json::parse(buffer.str());
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Accounts document with @p count records `user<i>@example.com` / `rt-<i>`.
inline json accounts_document(int count) {
    json accounts = json::array();
    for (int i = 0; i < count; i++) {
        accounts.push_back({
            {"email", "user" + std::to_string(i) + "@example.com"},
            {"refresh_token", "rt-" + std::to_string(i)}
        });
    }
    return accounts;
}

} // namespace test
} // namespace chatrelay

#endif // CHATRELAY_TESTS_FAKE_HTTP_CLIENT_HPP
