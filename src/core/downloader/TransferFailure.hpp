#pragma once

/**
 * TransferFailure.hpp
 *
 * Everything that can end an attempt without a validated file.
 */

#include <optional>
#include <string>

namespace docfetch::core::downloader {

/**
 * Failure family
 */
enum class FailureKind {
    Network,        // connect / timeout / TLS / truncated body
    HttpStatus,     // server answered with a non-success status
    Validation,     // completed transfer failed integrity checks
    Filesystem,     // destination unwritable, disk full
    Configuration,  // invalid request, rejected before any attempt
    Cancelled       // caller asked the run to stop
};

/**
 * Transport-level condition for FailureKind::Network
 */
enum class NetworkCondition {
    ConnectFailure,
    Timeout,
    TlsFailure,
    ShortBody,
    ReceiveError,
    MalformedUrl,
    Other
};

/**
 * TransferFailure - one classified-able failure
 */
struct TransferFailure {
    FailureKind kind{FailureKind::Network};
    NetworkCondition network{NetworkCondition::Other};
    int httpStatus{0};
    std::optional<double> retryAfterSeconds;
    std::string message;

    static TransferFailure networkError(NetworkCondition condition, std::string message) {
        TransferFailure failure;
        failure.kind = FailureKind::Network;
        failure.network = condition;
        failure.message = std::move(message);
        return failure;
    }

    static TransferFailure httpError(int status, std::optional<double> retryAfter = std::nullopt) {
        TransferFailure failure;
        failure.kind = FailureKind::HttpStatus;
        failure.httpStatus = status;
        failure.retryAfterSeconds = retryAfter;
        failure.message = "HTTP " + std::to_string(status);
        return failure;
    }

    static TransferFailure validationError(std::string message) {
        TransferFailure failure;
        failure.kind = FailureKind::Validation;
        failure.message = std::move(message);
        return failure;
    }

    static TransferFailure filesystemError(std::string message) {
        TransferFailure failure;
        failure.kind = FailureKind::Filesystem;
        failure.message = std::move(message);
        return failure;
    }

    static TransferFailure configurationError(std::string message) {
        TransferFailure failure;
        failure.kind = FailureKind::Configuration;
        failure.message = std::move(message);
        return failure;
    }

    static TransferFailure cancelled() {
        TransferFailure failure;
        failure.kind = FailureKind::Cancelled;
        failure.message = "Download cancelled";
        return failure;
    }
};

} // namespace docfetch::core::downloader
