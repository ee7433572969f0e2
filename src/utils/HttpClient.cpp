/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <string_view>

namespace bulkfetch::utils {

namespace {

std::mutex g_curlInitMutex;

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int64_t parseContentLength(const std::map<std::string, std::string>& headers) {
    auto it = headers.find("content-length");
    if (it == headers.end()) return -1;
    try {
        long long value = std::stoll(it->second);
        return value < 0 ? -1 : static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return -1;
    }
}

} // namespace

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

void CurlGlobalInit::init() {
    std::lock_guard<std::mutex> lock(g_curlInitMutex);
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    HttpOptions defaultOptions;
};

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    CurlGlobalInit::init();
    m_impl->defaultOptions.timeoutSeconds = 300;
    m_impl->defaultOptions.connectTimeoutSeconds = 10;
    m_impl->defaultOptions.userAgent = "BulkFetch/1.0";
}

HttpClient::HttpClient(const HttpOptions& defaults) : HttpClient() {
    setDefaultOptions(defaults);
}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    m_impl->defaultOptions = options;
}

HttpResponse HttpClient::head(const std::string& url, const HttpOptions& options) {
    return performRequest("HEAD", url, nullptr, options);
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    return performRequest("GET", url, nullptr, options);
}

HttpResponse HttpClient::stream(const std::string& url, const BodySink& sink, const HttpOptions& options) {
    return performRequest("GET", url, &sink, options);
}

std::string HttpClient::rangeHeader(uint64_t start, uint64_t end) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

HttpResponse HttpClient::performRequest(const std::string& method, const std::string& url,
                                        const BodySink* sink, const HttpOptions& options) {
    HttpResponse result;
    const HttpOptions& defaults = m_impl->defaultOptions;

    try {
        cpr::Header headers;
        for (const auto& [key, value] : defaults.headers) headers[key] = value;
        for (const auto& [key, value] : options.headers) headers[key] = value;

        std::string ua = options.userAgent.empty() ? defaults.userAgent : options.userAgent;
        if (ua.empty()) ua = "BulkFetch/1.0";

        int timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : defaults.timeoutSeconds;
        if (timeout <= 0) timeout = 300;

        int connectTimeout = options.connectTimeoutSeconds > 0
            ? options.connectTimeoutSeconds : defaults.connectTimeoutSeconds;
        if (connectTimeout <= 0) connectTimeout = 10;

        cpr::Session session;
        session.SetUrl(cpr::Url{url});
        session.SetHeader(headers);
        session.SetTimeout(cpr::Timeout{timeout * 1000});
        session.SetConnectTimeout(cpr::ConnectTimeout{connectTimeout * 1000});
        session.SetUserAgent(cpr::UserAgent{ua});
        session.SetVerifySsl(cpr::VerifySsl{options.verifySSL && defaults.verifySSL});

        uint64_t received = 0;
        if (sink) {
            session.SetWriteCallback(cpr::WriteCallback{
                [&received, sink](std::string_view data, intptr_t /*userdata*/) -> bool {
                    received += data.size();
                    return (*sink)(data.data(), data.size());
                }});
        }

        const auto& progress = options.progressCallback ? options.progressCallback
                                                        : defaults.progressCallback;
        if (progress) {
            session.SetProgressCallback(cpr::ProgressCallback{
                [&progress](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                            cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                            intptr_t /*userdata*/) -> bool {
                    progress(static_cast<int64_t>(downloadNow), static_cast<int64_t>(downloadTotal));
                    return true;
                }});
        }

        cpr::Response response = method == "HEAD" ? session.Head() : session.Get();

        result.statusCode = static_cast<int>(response.status_code);
        if (!sink) {
            result.body = std::move(response.text);
            received = result.body.size();
        }
        for (const auto& [key, value] : response.header) {
            result.headers[toLowerAscii(key)] = value;
        }
        result.contentLength = parseContentLength(result.headers);
        result.bytesReceived = received;
        if (response.error.code != cpr::ErrorCode::OK) {
            result.error = response.error.message.empty() ? "transport error" : response.error.message;
        }
        result.downloadTime = response.elapsed;

    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }

    return result;
}

} // namespace bulkfetch::utils
