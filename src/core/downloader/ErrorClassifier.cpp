/**
 * ErrorClassifier.cpp
 */

#include "ErrorClassifier.hpp"

#include <stdexcept>

namespace docfetch::core::downloader {

namespace {

std::string describeNetwork(const TransferFailure& failure) {
    std::string prefix;
    switch (failure.network) {
        case NetworkCondition::ConnectFailure: prefix = "Connection error"; break;
        case NetworkCondition::Timeout:        prefix = "Request timeout"; break;
        case NetworkCondition::TlsFailure:     prefix = "SSL error"; break;
        case NetworkCondition::ShortBody:      prefix = "Incomplete response body"; break;
        case NetworkCondition::ReceiveError:   prefix = "Receive error"; break;
        case NetworkCondition::MalformedUrl:   prefix = "Malformed URL"; break;
        case NetworkCondition::Other:          prefix = "Network error"; break;
    }
    return failure.message.empty() ? prefix : prefix + ": " + failure.message;
}

std::string describeStatus(int status) {
    if (status == 429) return "Rate limited (HTTP 429)";
    if (status >= 500) return "Server error (HTTP " + std::to_string(status) + ")";
    if (status >= 400) return "Client error (HTTP " + std::to_string(status) + ")";
    return "Unexpected response (HTTP " + std::to_string(status) + ")";
}

} // namespace

const char* toString(RetryDisposition disposition) {
    switch (disposition) {
        case RetryDisposition::Retry:        return "RETRY";
        case RetryDisposition::NoRetry:      return "NO_RETRY";
        case RetryDisposition::PartialRetry: return "PARTIAL_RETRY";
    }
    return "RETRY";
}

bool ErrorClassifier::isRetryableStatus(int status) noexcept {
    return status == 408 || status == 429 || (status >= 500 && status <= 599);
}

bool ErrorClassifier::isTerminalStatus(int status) noexcept {
    return status >= 400 && status <= 499 && !isRetryableStatus(status);
}

Classification ErrorClassifier::classify(const TransferFailure& failure) noexcept {
    Classification result;

    try {
        switch (failure.kind) {
            case FailureKind::Network:
                if (failure.network == NetworkCondition::MalformedUrl) {
                    result.disposition = RetryDisposition::NoRetry;
                } else {
                    result.disposition = RetryDisposition::Retry;
                    result.rotateIdentity = failure.network == NetworkCondition::ConnectFailure ||
                                            failure.network == NetworkCondition::TlsFailure;
                }
                result.description = describeNetwork(failure);
                break;

            case FailureKind::HttpStatus:
                if (isTerminalStatus(failure.httpStatus)) {
                    result.disposition = RetryDisposition::NoRetry;
                } else {
                    // 408, 429, 5xx and anything unexpected
                    result.disposition = RetryDisposition::Retry;
                }
                if (failure.httpStatus == 429) {
                    result.serverDelaySeconds = failure.retryAfterSeconds;
                    result.rotateIdentity = true;
                }
                result.description = describeStatus(failure.httpStatus);
                break;

            case FailureKind::Validation:
                result.disposition = RetryDisposition::PartialRetry;
                result.description = "Validation failed: " + failure.message;
                break;

            case FailureKind::Filesystem:
                result.disposition = RetryDisposition::NoRetry;
                result.description = "Filesystem error: " + failure.message;
                break;

            case FailureKind::Configuration:
                result.disposition = RetryDisposition::NoRetry;
                result.description = "Invalid request: " + failure.message;
                break;

            case FailureKind::Cancelled:
                result.disposition = RetryDisposition::NoRetry;
                result.description = failure.message.empty() ? "Download cancelled" : failure.message;
                break;
        }
    } catch (const std::exception&) {
        // Allocation failed while describing; the disposition stands
        result.description.clear();
    }

    if (result.description.empty()) {
        result.description = toString(result.disposition);
    }

    return result;
}

} // namespace docfetch::core::downloader
