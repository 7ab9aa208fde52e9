/**
 * @file http_client.cpp
 * @brief libcurl transport implementation for chatrelay
 */

#include "chatrelay/http_client.hpp"
#include "chatrelay/errors.hpp"
#include <algorithm>
#include <cctype>
#include <curl/curl.h>

namespace chatrelay {

static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Returns true when the line is the blank line ending a header block.
static bool parse_header_line(const std::string& raw, HeaderMap& headers) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        return true;
    }

    // A new status line starts a new response (1xx, redirects)
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers.clear();
        return false;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }

    std::string value = line.substr(colon + 1);
    size_t start = value.find_first_not_of(" \t");
    value = start == std::string::npos ? "" : value.substr(start);
    headers.emplace(to_lower(line.substr(0, colon)), value);
    return false;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, HeaderMap* headers) {
    parse_header_line(std::string(buffer, size * nitems), *headers);
    return size * nitems;
}

static curl_slist* build_header_list(const std::map<std::string, std::string>& headers) {
    curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
    }
    // Never wait for 100-continue on small JSON bodies
    header_list = curl_slist_append(header_list, "Expect:");
    return header_list;
}

static void apply_common_options(CURL* curl, const HttpRequest& request, curl_slist* header_list) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout * 1000));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

// =============================================================================
// HttpResponse
// =============================================================================

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? "" : it->second;
}

std::vector<std::string> HttpResponse::header_values(const std::string& name) const {
    std::vector<std::string> values;
    auto range = headers.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(it->second);
    }
    return values;
}

// =============================================================================
// ByteStream
// =============================================================================

std::string ByteStream::read_all() {
    std::string body;
    std::string chunk;
    while (next(chunk)) {
        body += chunk;
    }
    return body;
}

// =============================================================================
// CurlByteStream
// =============================================================================

namespace {

struct TransferHandles {
    CURL* easy = nullptr;
    CURLM* multi = nullptr;
    curl_slist* headers = nullptr;
    bool attached = false;

    ~TransferHandles() {
        if (attached) curl_multi_remove_handle(multi, easy);
        if (easy) curl_easy_cleanup(easy);
        if (multi) curl_multi_cleanup(multi);
        if (headers) curl_slist_free_all(headers);
    }
};

/**
 * Pull-driven transfer on a private multi handle
 *
 * Each call to next() runs the transfer until more body bytes arrive or the
 * transfer finishes, so the caller decides when to read.
 */
class CurlByteStream : public ByteStream {
public:
    explicit CurlByteStream(const HttpRequest& request) : url_(request.url) {
        handles_.easy = curl_easy_init();
        handles_.multi = curl_multi_init();
        if (!handles_.easy || !handles_.multi) {
            throw ConnectionError("Failed to initialize CURL", url_);
        }

        handles_.headers = build_header_list(request.headers);
        apply_common_options(handles_.easy, request, handles_.headers);
        curl_easy_setopt(handles_.easy, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(handles_.easy, CURLOPT_WRITEFUNCTION, &CurlByteStream::on_body);
        curl_easy_setopt(handles_.easy, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(handles_.easy, CURLOPT_HEADERFUNCTION, &CurlByteStream::on_header);
        curl_easy_setopt(handles_.easy, CURLOPT_HEADERDATA, this);

        curl_multi_add_handle(handles_.multi, handles_.easy);
        handles_.attached = true;

        while (!headers_done_ && !finished_) {
            pump();
        }

        if (!headers_done_ && result_ != CURLE_OK) {
            throw ConnectionError("CURL error: " + std::string(curl_easy_strerror(result_)), url_);
        }

        long http_code = 0;
        curl_easy_getinfo(handles_.easy, CURLINFO_RESPONSE_CODE, &http_code);
        status_code_ = static_cast<int>(http_code);
    }

    int status_code() const override {
        return status_code_;
    }

    bool next(std::string& chunk) override {
        while (pending_.empty() && !finished_) {
            pump();
        }

        if (!pending_.empty()) {
            chunk = std::move(pending_);
            pending_.clear();
            return true;
        }

        if (result_ != CURLE_OK) {
            throw ConnectionError("Stream interrupted: " + std::string(curl_easy_strerror(result_)), url_);
        }
        return false;
    }

private:
    void pump() {
        progressed_ = false;

        int still_running = 0;
        CURLMcode mc = curl_multi_perform(handles_.multi, &still_running);
        if (mc != CURLM_OK) {
            throw ConnectionError("curl_multi_perform failed: " + std::string(curl_multi_strerror(mc)), url_);
        }

        int msgs_left = 0;
        CURLMsg* msg = nullptr;
        while ((msg = curl_multi_info_read(handles_.multi, &msgs_left))) {
            if (msg->msg == CURLMSG_DONE) {
                result_ = msg->data.result;
                finished_ = true;
            }
        }

        if (!finished_ && !progressed_ && still_running > 0) {
            curl_multi_wait(handles_.multi, nullptr, 0, 100, nullptr);
        }
    }

    static size_t on_body(char* contents, size_t size, size_t nmemb, void* userp) {
        auto* self = static_cast<CurlByteStream*>(userp);
        self->pending_.append(contents, size * nmemb);
        self->progressed_ = true;
        return size * nmemb;
    }

    static size_t on_header(char* buffer, size_t size, size_t nitems, void* userp) {
        auto* self = static_cast<CurlByteStream*>(userp);
        if (parse_header_line(std::string(buffer, size * nitems), self->headers_)) {
            long http_code = 0;
            curl_easy_getinfo(self->handles_.easy, CURLINFO_RESPONSE_CODE, &http_code);
            if (http_code >= 200) {
                self->headers_done_ = true;
                self->progressed_ = true;
            }
        }
        return size * nitems;
    }

    TransferHandles handles_;
    std::string url_;
    HeaderMap headers_;
    std::string pending_;
    int status_code_ = 0;
    bool headers_done_ = false;
    bool finished_ = false;
    bool progressed_ = false;
    CURLcode result_ = CURLE_OK;
};

} // namespace

// =============================================================================
// CurlHttpClient
// =============================================================================

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::post(const HttpRequest& request) {
    return perform(request, true);
}

HttpResponse CurlHttpClient::get(const HttpRequest& request) {
    return perform(request, false);
}

std::unique_ptr<ByteStream> CurlHttpClient::open_stream(const HttpRequest& request) {
    return std::make_unique<CurlByteStream>(request);
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request, bool is_post) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ConnectionError("Failed to initialize CURL", request.url);
    }

    HttpResponse response;
    curl_slist* header_list = build_header_list(request.headers);
    apply_common_options(curl, request, header_list);

    if (is_post) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw ConnectionError("CURL error: " + std::string(curl_easy_strerror(res)), request.url);
    }

    response.status_code = static_cast<int>(http_code);
    return response;
}

} // namespace chatrelay
