// docfetch - HTTP Client
// Blocking HTTP client: cpr for small requests, libcurl for streamed bodies

#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>
#include <optional>
#include <ctime>
#include <cstdint>
#include <curl/curl.h>

namespace docfetch::utils {

/**
 * @brief Case-insensitive ordering for header names
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

/**
 * @brief Response of a non-streamed request
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    HttpHeaders headers;
    std::string error;          // Transport error, empty when a response arrived
    double downloadTime{0.0};

    bool transportFailed() const { return !error.empty(); }
    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    double timeoutSeconds{30.0};
    double connectTimeoutSeconds{10.0};
    bool followRedirects{true};
    int maxRedirects{5};
    bool verifySSL{true};
    std::string userAgent{"docfetch/1.0"};
};

/**
 * @brief Receivers for a streamed response
 *
 * onResponse runs once, with the final status and headers, before the first
 * body byte (or after the transfer for an empty body). Returning false from
 * onResponse or onData aborts the transfer. shouldAbort is polled while the
 * transfer is in progress.
 */
struct StreamCallbacks {
    std::function<bool(int statusCode, const HttpHeaders& headers)> onResponse;
    std::function<bool(const char* data, size_t size)> onData;
    std::function<bool()> shouldAbort;
};

/**
 * @brief Result of a streamed transfer
 */
struct StreamResult {
    int statusCode{0};
    HttpHeaders headers;
    CURLcode curlCode{CURLE_OK};
    std::string error;
    int64_t bytesReceived{0};
    double elapsedSeconds{0.0};
    bool rejectedResponse{false};   // onResponse returned false
    bool dataRejected{false};       // onData returned false
};

/**
 * @brief Components of an absolute URL
 */
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string path;
};

/**
 * @brief Value of a Content-Range header ("bytes 100-199/1000")
 */
struct ContentRange {
    int64_t start{-1};
    int64_t end{-1};
    std::optional<int64_t> total;
};

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    void setDefaultOptions(const HttpOptions& options);

    /**
     * HEAD request; the body of the response is always empty
     */
    HttpResponse head(const std::string& url, const HttpOptions& options = {});

    /**
     * Perform a GET and hand the body to callbacks as it arrives.
     * Never throws; failures are reported in the result.
     */
    StreamResult stream(const std::string& url, const HttpOptions& options,
                        const StreamCallbacks& callbacks);

    // URL and header utilities
    static std::string urlDecode(const std::string& str);
    static std::optional<ParsedUrl> parseUrl(const std::string& url);
    static std::optional<int64_t> parseContentLength(const HttpHeaders& headers);
    static std::optional<ContentRange> parseContentRange(const std::string& value);

    /**
     * Parse a Retry-After value: delta-seconds or an HTTP-date.
     * @param now Reference time for HTTP-dates
     * @return Delay in seconds (never negative)
     */
    static std::optional<double> parseRetryAfter(const std::string& value,
                                                 std::time_t now = std::time(nullptr));

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    HttpOptions mergeOptions(const HttpOptions& options) const;
    void setupCurl(CURL* curl, const std::string& url, const HttpOptions& options);

    static size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);
};

/**
 * @brief RAII wrapper for CURL handle
 */
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle();

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CurlHandle(CurlHandle&& other) noexcept;
    CurlHandle& operator=(CurlHandle&& other) noexcept;

    CURL* get() const { return m_curl; }
    operator CURL*() const { return m_curl; }

private:
    CURL* m_curl{nullptr};
};

/**
 * @brief Global CURL initialization (once per process)
 */
class CurlGlobalInit {
public:
    static void init();
};

} // namespace docfetch::utils
