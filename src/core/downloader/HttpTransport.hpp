#pragma once

/**
 * HttpTransport.hpp
 *
 * Transport over HTTP(S) using utils::HttpClient.
 */

#include "Transport.hpp"
#include "../../utils/HttpClient.hpp"

#include <curl/curl.h>

namespace docfetch::core::downloader {

class HttpTransport : public Transport {
public:
    HttpTransport();

    FetchResult fetch(const FetchRequest& request, ResponseSink& sink) override;
    ProbeResult probe(const FetchRequest& request) override;

    /**
     * Network condition for a libcurl error code
     */
    static NetworkCondition conditionFor(CURLcode code);

private:
    static utils::HttpOptions toOptions(const FetchRequest& request);

    // Stateless apart from defaults; each call uses its own easy handle
    utils::HttpClient m_client;
};

} // namespace docfetch::core::downloader
