/**
 * HttpClient.cpp
 *
 * HTTP client implementation. Small requests (HEAD, probes) go through cpr;
 * streamed downloads drive a libcurl easy handle directly so the caller sees
 * the status line before any body byte and can abort mid-transfer.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>

namespace docfetch::utils {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};
using CurlSlist = std::unique_ptr<curl_slist, SlistDeleter>;

struct UrlDeleter {
    void operator()(CURLU* url) const {
        if (url) {
            curl_url_cleanup(url);
        }
    }
};
using CurlUrl = std::unique_ptr<CURLU, UrlDeleter>;

// State shared with the curl callbacks of one streamed transfer
struct StreamState {
    CURL* curl{nullptr};
    const StreamCallbacks* callbacks{nullptr};
    StreamResult* result{nullptr};
    HttpHeaders pendingHeaders;
    bool responseDelivered{false};
};

long toMillis(double seconds) {
    return static_cast<long>(seconds * 1000.0);
}

std::optional<std::string> urlPart(CURLU* url, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, 0) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

bool deliverResponse(StreamState& state) {
    state.responseDelivered = true;

    long code = 0;
    curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &code);
    state.result->statusCode = static_cast<int>(code);
    state.result->headers = state.pendingHeaders;

    if (state.callbacks->onResponse &&
        !state.callbacks->onResponse(state.result->statusCode, state.result->headers)) {
        state.result->rejectedResponse = true;
        return false;
    }
    return true;
}

} // namespace

// -- CaseInsensitiveLess --

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

// -- CurlGlobalInit --

void CurlGlobalInit::init() {
    static std::once_flag once;
    std::call_once(once, [] {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

// -- CurlHandle --

CurlHandle::CurlHandle() : m_curl(curl_easy_init()) {}
CurlHandle::~CurlHandle() { if (m_curl) curl_easy_cleanup(m_curl); }
CurlHandle::CurlHandle(CurlHandle&& other) noexcept : m_curl(other.m_curl) { other.m_curl = nullptr; }
CurlHandle& CurlHandle::operator=(CurlHandle&& other) noexcept {
    if (this != &other) { if (m_curl) curl_easy_cleanup(m_curl); m_curl = other.m_curl; other.m_curl = nullptr; }
    return *this;
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    HttpOptions defaultOptions;
};

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    m_impl->defaultOptions = options;
}


HttpOptions HttpClient::mergeOptions(const HttpOptions& options) const {
    HttpOptions merged = options;
    for (const auto& [key, value] : m_impl->defaultOptions.headers) {
        merged.headers.emplace(key, value);
    }
    if (merged.userAgent.empty()) merged.userAgent = m_impl->defaultOptions.userAgent;
    if (merged.timeoutSeconds <= 0) merged.timeoutSeconds = m_impl->defaultOptions.timeoutSeconds;
    if (merged.connectTimeoutSeconds <= 0) merged.connectTimeoutSeconds = m_impl->defaultOptions.connectTimeoutSeconds;
    merged.connectTimeoutSeconds = std::min(merged.connectTimeoutSeconds, merged.timeoutSeconds);
    return merged;
}

HttpResponse HttpClient::head(const std::string& url, const HttpOptions& options) {
    HttpResponse result;
    HttpOptions opts = mergeOptions(options);

    cpr::Header headers;
    for (const auto& [key, value] : opts.headers) headers[key] = value;

    cpr::Timeout timeout{std::chrono::milliseconds(toMillis(opts.timeoutSeconds))};
    cpr::ConnectTimeout connectTimeout{std::chrono::milliseconds(toMillis(opts.connectTimeoutSeconds))};
    cpr::Redirect redirect{static_cast<long>(opts.maxRedirects), opts.followRedirects, false};

    cpr::Response response = cpr::Head(cpr::Url{url}, headers, timeout, connectTimeout, redirect,
                                       cpr::UserAgent{opts.userAgent}, cpr::VerifySsl{opts.verifySSL});

    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "request failed" : response.error.message;
        return result;
    }

    result.statusCode = static_cast<int>(response.status_code);
    result.body = response.text;
    for (const auto& [key, value] : response.header) result.headers[key] = value;
    result.downloadTime = response.elapsed;
    return result;
}

void HttpClient::setupCurl(CURL* curl, const std::string& url, const HttpOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.maxRedirects));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, toMillis(options.timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, toMillis(options.connectTimeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verifySSL ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verifySSL ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

StreamResult HttpClient::stream(const std::string& url, const HttpOptions& options,
                                const StreamCallbacks& callbacks) {
    StreamResult result;
    HttpOptions opts = mergeOptions(options);

    CurlHandle curl;
    if (!curl) {
        result.curlCode = CURLE_FAILED_INIT;
        result.error = curl_easy_strerror(CURLE_FAILED_INIT);
        return result;
    }

    setupCurl(curl, url, opts);

    CurlSlist headerList;
    for (const auto& [key, value] : opts.headers) {
        std::string line = key + ": " + value;
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended) {
            result.curlCode = CURLE_OUT_OF_MEMORY;
            result.error = curl_easy_strerror(CURLE_OUT_OF_MEMORY);
            return result;
        }
        headerList.release();
        headerList.reset(appended);
    }
    if (headerList) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }

    StreamState state;
    state.curl = curl.get();
    state.callbacks = &callbacks;
    state.result = &result;

    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);

    auto started = std::chrono::steady_clock::now();
    result.curlCode = curl_easy_perform(curl.get());
    result.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    if (result.curlCode == CURLE_OK && !state.responseDelivered) {
        // Empty body: the write callback never ran
        deliverResponse(state);
    } else if (!state.responseDelivered) {
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        result.statusCode = static_cast<int>(code);
        result.headers = state.pendingHeaders;
    }

    if (result.curlCode != CURLE_OK) {
        result.error = curl_easy_strerror(result.curlCode);
    }
    return result;
}

size_t HttpClient::writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<StreamState*>(userp);
    size_t bytes = size * nmemb;

    if (!state->responseDelivered && !deliverResponse(*state)) {
        return 0;
    }

    if (state->callbacks->onData && !state->callbacks->onData(data, bytes)) {
        state->result->dataRejected = true;
        return 0;
    }

    state->result->bytesReceived += static_cast<int64_t>(bytes);
    return bytes;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<StreamState*>(userdata);
    size_t bytes = size * nitems;

    std::string line = StringUtils::trim(std::string(buffer, bytes));
    if (StringUtils::startsWith(line, "HTTP/")) {
        // New response (redirect hop or 100-continue): forget earlier headers
        state->pendingHeaders.clear();
    } else if (auto colon = line.find(':'); colon != std::string::npos) {
        state->pendingHeaders[StringUtils::trim(line.substr(0, colon))] =
            StringUtils::trim(line.substr(colon + 1));
    }
    return bytes;
}

int HttpClient::progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                 curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* state = static_cast<StreamState*>(clientp);
    if (state->callbacks->shouldAbort && state->callbacks->shouldAbort()) {
        return 1;
    }
    return 0;
}

// -- URL and header utilities --

std::string HttpClient::urlDecode(const std::string& str) {
    CurlHandle curl;
    if (!curl) return str;
    int outLen = 0;
    char* output = curl_easy_unescape(curl, str.c_str(), static_cast<int>(str.size()), &outLen);
    if (!output) return str;
    std::string result(output, outLen);
    curl_free(output);
    return result;
}

std::optional<ParsedUrl> HttpClient::parseUrl(const std::string& url) {
    CurlUrl handle(curl_url());
    if (!handle) return std::nullopt;

    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    auto scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    auto host = urlPart(handle.get(), CURLUPART_HOST);
    if (!scheme || !host || host->empty()) return std::nullopt;

    ParsedUrl parsed;
    parsed.scheme = StringUtils::toLower(*scheme);
    parsed.host = *host;
    parsed.path = urlPart(handle.get(), CURLUPART_PATH).value_or("/");
    return parsed;
}

std::optional<int64_t> HttpClient::parseContentLength(const HttpHeaders& headers) {
    auto it = headers.find("Content-Length");
    if (it == headers.end()) return std::nullopt;
    auto value = StringUtils::parseLong(it->second);
    if (!value || *value < 0) return std::nullopt;
    return value;
}

std::optional<ContentRange> HttpClient::parseContentRange(const std::string& value) {
    std::string v = StringUtils::trim(value);
    if (!StringUtils::startsWith(StringUtils::toLower(v), "bytes ")) return std::nullopt;
    v = StringUtils::trim(v.substr(6));

    auto slash = v.find('/');
    if (slash == std::string::npos) return std::nullopt;

    ContentRange range;
    std::string totalPart = v.substr(slash + 1);
    if (totalPart != "*") {
        range.total = StringUtils::parseLong(totalPart);
        if (!range.total) return std::nullopt;
    }

    std::string span = v.substr(0, slash);
    if (span == "*") return range;

    auto dash = span.find('-');
    if (dash == std::string::npos) return std::nullopt;
    auto start = StringUtils::parseLong(span.substr(0, dash));
    auto end = StringUtils::parseLong(span.substr(dash + 1));
    if (!start || !end || *start < 0 || *end < *start) return std::nullopt;

    range.start = *start;
    range.end = *end;
    return range;
}

std::optional<double> HttpClient::parseRetryAfter(const std::string& value, std::time_t now) {
    std::string v = StringUtils::trim(value);
    if (v.empty()) return std::nullopt;

    if (auto seconds = StringUtils::parseDouble(v)) {
        if (*seconds < 0) return std::nullopt;
        return *seconds;
    }

    std::time_t when = curl_getdate(v.c_str(), nullptr);
    if (when == -1) return std::nullopt;
    return std::max(0.0, std::difftime(when, now));
}

} // namespace docfetch::utils
