#pragma once

/**
 * Transport.hpp
 *
 * Network boundary of the download engine. HttpTransport is the real
 * implementation; tests drive the engine through scripted transports.
 */

#include "TransferFailure.hpp"
#include "../../utils/HttpClient.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace docfetch::core::downloader {

/**
 * Parameters of one network request
 */
struct FetchRequest {
    std::string url;
    int64_t offset{0};              // > 0 sends "Range: bytes=<offset>-"
    std::string userAgent;
    double timeoutSeconds{30.0};
    double connectTimeoutSeconds{30.0};
    int maxRedirects{5};
    bool verifySSL{true};
};

/**
 * Receiver of a streamed response body
 */
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    /**
     * Final status line and headers, before any body byte
     * @return false to abort the transfer
     */
    virtual bool begin(int statusCode, const utils::HttpHeaders& headers) = 0;

    /**
     * @return false to abort the transfer
     */
    virtual bool write(const char* data, size_t size) = 0;

    /**
     * Polled during the transfer; true aborts it
     */
    virtual bool cancelled() const = 0;
};

/**
 * Result of Transport::fetch
 */
struct FetchResult {
    int statusCode{0};
    utils::HttpHeaders headers;

    // Set when the transfer failed below HTTP (connect, timeout, TLS, ...)
    std::optional<TransferFailure> networkFailure;

    // The sink refused the response or the data, or asked to cancel
    bool aborted{false};

    int64_t bytesReceived{0};
    double elapsedSeconds{0.0};
};

/**
 * Result of Transport::probe
 */
struct ProbeResult {
    bool reachable{false};
    int statusCode{0};
    bool acceptsRanges{false};
    std::optional<int64_t> contentLength;
    std::string error;
};

/**
 * Transport - abstract network boundary
 *
 * Implementations must be usable from several runs at once.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * GET the resource, streaming the body into the sink
     */
    virtual FetchResult fetch(const FetchRequest& request, ResponseSink& sink) = 0;

    /**
     * Ask the server whether it serves byte ranges for the resource
     */
    virtual ProbeResult probe(const FetchRequest& request) = 0;
};

} // namespace docfetch::core::downloader
