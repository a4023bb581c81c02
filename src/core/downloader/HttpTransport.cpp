/**
 * HttpTransport.cpp
 */

#include "HttpTransport.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace docfetch::core::downloader {

namespace {

constexpr const char* kAcceptHeader = "application/pdf,application/octet-stream,*/*";

bool advertisesByteRanges(const utils::HttpHeaders& headers) {
    auto it = headers.find("Accept-Ranges");
    return it != headers.end() &&
           utils::StringUtils::contains(utils::StringUtils::toLower(it->second), "bytes");
}

} // namespace

HttpTransport::HttpTransport() {
    utils::HttpOptions defaults;
    defaults.headers["Accept"] = kAcceptHeader;
    m_client.setDefaultOptions(defaults);
}

utils::HttpOptions HttpTransport::toOptions(const FetchRequest& request) {
    utils::HttpOptions options;
    options.timeoutSeconds = request.timeoutSeconds;
    options.connectTimeoutSeconds = request.connectTimeoutSeconds;
    options.maxRedirects = request.maxRedirects;
    options.verifySSL = request.verifySSL;
    if (!request.userAgent.empty()) {
        options.userAgent = request.userAgent;
    }
    return options;
}

NetworkCondition HttpTransport::conditionFor(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
            return NetworkCondition::ConnectFailure;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkCondition::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return NetworkCondition::TlsFailure;
        case CURLE_PARTIAL_FILE:
            return NetworkCondition::ShortBody;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return NetworkCondition::ReceiveError;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return NetworkCondition::MalformedUrl;
        default:
            return NetworkCondition::Other;
    }
}

FetchResult HttpTransport::fetch(const FetchRequest& request, ResponseSink& sink) {
    utils::HttpOptions options = toOptions(request);
    if (request.offset > 0) {
        options.headers["Range"] = "bytes=" + std::to_string(request.offset) + "-";
    }

    utils::StreamCallbacks callbacks;
    callbacks.onResponse = [&sink](int status, const utils::HttpHeaders& headers) {
        return sink.begin(status, headers);
    };
    callbacks.onData = [&sink](const char* data, size_t size) {
        return sink.write(data, size);
    };
    callbacks.shouldAbort = [&sink]() {
        return sink.cancelled();
    };

    utils::StreamResult streamed = m_client.stream(request.url, options, callbacks);

    FetchResult result;
    result.statusCode = streamed.statusCode;
    result.headers = std::move(streamed.headers);
    result.bytesReceived = streamed.bytesReceived;
    result.elapsedSeconds = streamed.elapsedSeconds;

    if (streamed.curlCode == CURLE_OK) {
        return result;
    }

    if (streamed.rejectedResponse || streamed.dataRejected ||
        streamed.curlCode == CURLE_ABORTED_BY_CALLBACK) {
        result.aborted = true;
        return result;
    }

    result.networkFailure = TransferFailure::networkError(conditionFor(streamed.curlCode), streamed.error);
    return result;
}

ProbeResult HttpTransport::probe(const FetchRequest& request) {
    utils::HttpOptions options = toOptions(request);
    ProbeResult result;

    utils::HttpResponse head = m_client.head(request.url, options);
    if (head.transportFailed()) {
        result.error = head.error;
        return result;
    }

    result.reachable = true;
    result.statusCode = head.statusCode;

    if (head.isSuccess()) {
        result.acceptsRanges = advertisesByteRanges(head.headers);
        result.contentLength = utils::HttpClient::parseContentLength(head.headers);
        return result;
    }

    if (head.statusCode != 405 && head.statusCode != 501) {
        result.error = "HEAD returned HTTP " + std::to_string(head.statusCode);
        return result;
    }

    // HEAD refused: ask for the first byte and stop once the headers arrive
    Logger::instance().debug("HEAD not allowed for {}, probing with a ranged GET", request.url);
    options.headers["Range"] = "bytes=0-0";

    utils::StreamCallbacks callbacks;
    callbacks.onResponse = [](int, const utils::HttpHeaders&) { return false; };

    utils::StreamResult ranged = m_client.stream(request.url, options, callbacks);
    if (!ranged.rejectedResponse && ranged.curlCode != CURLE_OK) {
        result.reachable = false;
        result.error = ranged.error;
        return result;
    }

    result.statusCode = ranged.statusCode;
    if (ranged.statusCode == 206) {
        result.acceptsRanges = true;
        auto range = ranged.headers.find("Content-Range");
        if (range != ranged.headers.end()) {
            if (auto parsed = utils::HttpClient::parseContentRange(range->second)) {
                result.contentLength = parsed->total;
            }
        }
    } else if (ranged.statusCode >= 200 && ranged.statusCode < 300) {
        result.acceptsRanges = advertisesByteRanges(ranged.headers);
        result.contentLength = utils::HttpClient::parseContentLength(ranged.headers);
    } else {
        result.error = "Range probe returned HTTP " + std::to_string(ranged.statusCode);
    }
    return result;
}

} // namespace docfetch::core::downloader
