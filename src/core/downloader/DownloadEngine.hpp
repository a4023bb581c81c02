#pragma once

/**
 * DownloadEngine.hpp
 *
 * Single-file download with classified retries, exponential backoff,
 * byte-range resume and integrity validation before the file is kept.
 */

#include "BackoffPolicy.hpp"
#include "DownloadOutcome.hpp"
#include "DownloadRequest.hpp"
#include "ErrorClassifier.hpp"
#include "TransferValidator.hpp"
#include "Transport.hpp"
#include "../CancellationToken.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docfetch::core {
class Config;
}

namespace docfetch::core::downloader {

/**
 * Engine-wide settings; per-download values live in DownloadRequest
 */
struct EngineSettings {
    // Rotated on blocking-type failures; empty uses the transport default
    std::vector<std::string> userAgents;

    double maxBackoffSeconds{BackoffPolicy::kDefaultCeilingSeconds};
    double jitterRatio{BackoffPolicy::kDefaultJitterRatio};
    double connectTimeoutSeconds{30.0};
    int maxRedirects{5};
    bool verifySSL{true};
    std::string partSuffix{".part"};
    ValidationOptions validation;

    // Fixed jitter seed for reproducible runs
    std::optional<uint32_t> randomSeed;

    static EngineSettings fromConfig(const Config& config);
};

/**
 * Lifecycle of one run
 */
enum class EngineState {
    Idle,
    Attempting,
    Classifying,
    Backoff,
    Succeeded,
    Stopped,
    ExhaustedRetries
};

const char* toString(EngineState state);

/**
 * Waits between attempts
 * @return false if the wait was interrupted by cancellation
 */
using Sleeper = std::function<bool(double seconds, const CancellationToken& token)>;

/**
 * DownloadEngine - runs downloads to completion
 *
 * run() may be called concurrently for different requests; all per-run
 * state is local to the call. run() never throws, every failure ends up
 * in the returned DownloadOutcome.
 */
class DownloadEngine {
public:
    explicit DownloadEngine(std::shared_ptr<Transport> transport, EngineSettings settings = {});

    DownloadOutcome run(const DownloadRequest& request) const;
    DownloadOutcome run(const DownloadRequest& request, const CancellationToken& token) const;

    /**
     * Replace the wait between attempts (default: interruptible sleep)
     */
    void setSleeper(Sleeper sleeper);

    const EngineSettings& settings() const { return m_settings; }

private:
    struct RunContext;

    DownloadOutcome execute(RunContext& ctx) const;
    std::optional<TransferFailure> performAttempt(RunContext& ctx) const;
    std::optional<TransferFailure> promote(RunContext& ctx) const;

    FetchRequest makeFetchRequest(const RunContext& ctx, int64_t offset) const;
    DownloadOutcome succeeded(const RunContext& ctx) const;
    DownloadOutcome failed(const RunContext& ctx, const std::string& error) const;

    std::shared_ptr<Transport> m_transport;
    EngineSettings m_settings;
    Sleeper m_sleeper;
};

} // namespace docfetch::core::downloader
