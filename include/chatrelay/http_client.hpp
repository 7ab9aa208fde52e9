/**
 * @file http_client.hpp
 * @brief Upstream HTTP transport for chatrelay
 */

#ifndef CHATRELAY_HTTP_CLIENT_HPP
#define CHATRELAY_HTTP_CLIENT_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chatrelay {

/// Response headers keyed by lower-cased name.
using HeaderMap = std::multimap<std::string, std::string>;

/**
 * Outgoing request
 */
struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    double timeout = 30.0;
};

/**
 * Buffered response
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    HeaderMap headers;

    /**
     * First value of a header
     * @param name Lower-cased header name
     * @return Header value or empty string
     */
    std::string header(const std::string& name) const;

    /**
     * All values of a header
     * @param name Lower-cased header name
     */
    std::vector<std::string> header_values(const std::string& name) const;
};

/**
 * Response body delivered incrementally
 *
 * The status line and headers are available as soon as the stream is
 * returned by HttpClient::open_stream().
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual int status_code() const = 0;

    /**
     * Wait for the next piece of the body
     * @param chunk Receives the bytes
     * @return false once the body is complete
     * @throws ConnectionError if the transfer fails
     */
    virtual bool next(std::string& chunk) = 0;

    /**
     * Drain the remaining body
     */
    std::string read_all();
};

/**
 * HTTP transport used for every upstream call
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * Perform a POST and buffer the response
     * @throws ConnectionError on transport failure
     */
    virtual HttpResponse post(const HttpRequest& request) = 0;

    /**
     * Perform a GET and buffer the response
     * @throws ConnectionError on transport failure
     */
    virtual HttpResponse get(const HttpRequest& request) = 0;

    /**
     * Start a GET and return once the response headers have arrived
     * @throws ConnectionError on transport failure
     */
    virtual std::unique_ptr<ByteStream> open_stream(const HttpRequest& request) = 0;
};

/**
 * libcurl implementation
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post(const HttpRequest& request) override;
    HttpResponse get(const HttpRequest& request) override;
    std::unique_ptr<ByteStream> open_stream(const HttpRequest& request) override;

private:
    HttpResponse perform(const HttpRequest& request, bool is_post);
};

} // namespace chatrelay

#endif // CHATRELAY_HTTP_CLIENT_HPP
