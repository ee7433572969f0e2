// BulkFetch - HTTP Client
// Blocking HTTP client using cpr / libcurl

#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>
#include <cstdint>

namespace bulkfetch::utils {

/**
 * @brief HTTP response structure
 *
 * Header names are stored lowercase.
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;
    double downloadTime{0.0};
    int64_t contentLength{-1}; // -1 when the server sent no Content-Length
    uint64_t bytesReceived{0};

    bool isSuccess() const {
        return error.empty() && statusCode >= 200 && statusCode < 300;
    }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{0};        // 0 = client default
    int connectTimeoutSeconds{0}; // 0 = client default
    bool verifySSL{true};
    std::string userAgent;        // empty = client default

    // Progress callback
    std::function<void(int64_t downloaded, int64_t total)> progressCallback;
};

/**
 * @brief Receives a response body piece by piece.
 * Returning false aborts the transfer.
 */
using BodySink = std::function<bool(const char* data, size_t size)>;

/**
 * @brief Blocking HTTP operations needed by the download engine.
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Headers only; contentLength is filled from Content-Length
    virtual HttpResponse head(const std::string& url, const HttpOptions& options = {}) = 0;

    // Whole body buffered in HttpResponse::body
    virtual HttpResponse get(const std::string& url, const HttpOptions& options = {}) = 0;

    // Body handed to sink as it arrives; HttpResponse::body stays empty
    virtual HttpResponse stream(const std::string& url, const BodySink& sink,
                                const HttpOptions& options = {}) = 0;
};

/**
 * @brief HttpTransport backed by cpr
 */
class HttpClient : public HttpTransport {
public:
    HttpClient();
    explicit HttpClient(const HttpOptions& defaults);
    ~HttpClient() override;

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Move
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // Set default options
    void setDefaultOptions(const HttpOptions& options);

    HttpResponse head(const std::string& url, const HttpOptions& options = {}) override;
    HttpResponse get(const std::string& url, const HttpOptions& options = {}) override;
    HttpResponse stream(const std::string& url, const BodySink& sink,
                        const HttpOptions& options = {}) override;

    // Build "bytes=start-end" for a Range header
    static std::string rangeHeader(uint64_t start, uint64_t end);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    HttpResponse performRequest(const std::string& method, const std::string& url,
                                const BodySink* sink, const HttpOptions& options);
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();

private:
    static bool s_initialized;
};

} // namespace bulkfetch::utils
