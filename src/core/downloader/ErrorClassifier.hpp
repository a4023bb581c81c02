#pragma once

/**
 * ErrorClassifier.hpp
 *
 * Maps a failed attempt to a retry disposition.
 */

#include "TransferFailure.hpp"

#include <optional>
#include <string>

namespace docfetch::core::downloader {

/**
 * What the engine should do after a failure
 */
enum class RetryDisposition {
    Retry,          // transient; previous bytes may be resumed
    NoRetry,        // terminal; stop now
    PartialRetry    // retry, but previous bytes must be discarded
};

const char* toString(RetryDisposition disposition);

/**
 * Classification result
 */
struct Classification {
    RetryDisposition disposition{RetryDisposition::Retry};

    // Server-requested delay (HTTP 429 Retry-After)
    std::optional<double> serverDelaySeconds;

    // Blocking-type failure: next attempt should present another identity
    bool rotateIdentity{false};

    std::string description;
};

/**
 * ErrorClassifier - total, side-effect free
 */
class ErrorClassifier {
public:
    static Classification classify(const TransferFailure& failure) noexcept;

    static bool isRetryableStatus(int status) noexcept;
    static bool isTerminalStatus(int status) noexcept;
};

} // namespace docfetch::core::downloader
