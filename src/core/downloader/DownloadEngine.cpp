/**
 * DownloadEngine.cpp
 */

#include "DownloadEngine.hpp"
#include "RangeResumeNegotiator.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>

namespace docfetch::core::downloader {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

std::string attemptsPhrase(int attempts) {
    return std::to_string(attempts) + (attempts == 1 ? " attempt" : " attempts");
}

std::string failedAfter(int attempts, const std::string& cause) {
    return "Failed after " + attemptsPhrase(attempts) + ". Last error: " + cause;
}

// 255 is the common NAME_MAX; the partial file carries the suffix on top
size_t maxFileNameLength(const std::string& partSuffix) {
    constexpr size_t kNameMax = 255;
    return partSuffix.size() < kNameMax ? kNameMax - partSuffix.size() : 1;
}

/**
 * Streams a response body into the partial file.
 * Non-2xx bodies are never written.
 */
class PartFileSink : public ResponseSink {
public:
    PartFileSink(std::filesystem::path path, int64_t offset, const CancellationToken& token)
        : m_path(std::move(path)), m_offset(offset), m_token(token) {}

    bool begin(int statusCode, const utils::HttpHeaders& headers) override {
        m_statusCode = statusCode;
        if (statusCode < 200 || statusCode >= 300) {
            return false;
        }

        m_verdict = RangeResumeNegotiator::judgeResponse(m_offset, statusCode, headers);
        if (m_verdict == RangeVerdict::Reject) {
            return false;
        }

        bool append = m_verdict == RangeVerdict::Continue;
        auto mode = std::ios::binary | std::ios::out | (append ? std::ios::app : std::ios::trunc);
        m_file.open(m_path, mode);
        if (!m_file.is_open()) {
            m_ioError = "Cannot open " + m_path.string() + ": " + std::strerror(errno);
            return false;
        }
        m_opened = true;

        auto contentLength = utils::HttpClient::parseContentLength(headers);
        if (append) {
            auto range = headers.find("Content-Range");
            std::optional<utils::ContentRange> parsed;
            if (range != headers.end()) {
                parsed = utils::HttpClient::parseContentRange(range->second);
            }
            if (parsed && parsed->total) {
                m_declaredLength = parsed->total;
            } else if (contentLength) {
                m_declaredLength = m_offset + *contentLength;
            }
        } else {
            m_declaredLength = contentLength;
        }
        return true;
    }

    bool write(const char* data, size_t size) override {
        if (!m_opened) {
            return false;
        }
        m_file.write(data, static_cast<std::streamsize>(size));
        if (!m_file) {
            m_ioError = "Write to " + m_path.string() + " failed: " + std::strerror(errno);
            return false;
        }
        m_bytesReceived += static_cast<int64_t>(size);
        return true;
    }

    bool cancelled() const override {
        return m_token.isCancelled();
    }

    void close() {
        if (!m_file.is_open()) {
            return;
        }
        m_file.flush();
        if (!m_file && m_ioError.empty()) {
            m_ioError = "Flush of " + m_path.string() + " failed: " + std::strerror(errno);
        }
        m_file.close();
    }

    int statusCode() const { return m_statusCode; }
    bool opened() const { return m_opened; }
    RangeVerdict verdict() const { return m_verdict; }
    const std::string& ioError() const { return m_ioError; }
    int64_t bytesReceived() const { return m_bytesReceived; }
    std::optional<int64_t> declaredLength() const { return m_declaredLength; }

private:
    std::filesystem::path m_path;
    int64_t m_offset;
    const CancellationToken& m_token;

    std::ofstream m_file;
    int m_statusCode{0};
    bool m_opened{false};
    RangeVerdict m_verdict{RangeVerdict::StartOver};
    std::string m_ioError;
    int64_t m_bytesReceived{0};
    std::optional<int64_t> m_declaredLength;
};

} // namespace

const char* toString(EngineState state) {
    switch (state) {
        case EngineState::Idle:             return "Idle";
        case EngineState::Attempting:       return "Attempting";
        case EngineState::Classifying:      return "Classifying";
        case EngineState::Backoff:          return "Backoff";
        case EngineState::Succeeded:        return "Succeeded";
        case EngineState::Stopped:          return "Stopped";
        case EngineState::ExhaustedRetries: return "ExhaustedRetries";
    }
    return "Idle";
}

EngineSettings EngineSettings::fromConfig(const Config& config) {
    EngineSettings settings;
    settings.userAgents = config.get<std::vector<std::string>>("downloads.userAgents", {});
    settings.maxBackoffSeconds = config.get<double>("downloads.maxBackoffSeconds", settings.maxBackoffSeconds);
    settings.jitterRatio = config.get<double>("downloads.jitterRatio", settings.jitterRatio);
    settings.connectTimeoutSeconds = config.get<double>("downloads.connectTimeoutSeconds", settings.connectTimeoutSeconds);
    settings.maxRedirects = config.get<int>("downloads.maxRedirects", settings.maxRedirects);
    settings.verifySSL = config.get<bool>("downloads.verifySSL", settings.verifySSL);
    settings.partSuffix = config.get<std::string>("downloads.partSuffix", settings.partSuffix);
    settings.validation.minimumSize = config.get<int64_t>("validation.minimumSize", settings.validation.minimumSize);
    settings.validation.strictTrailer = config.get<bool>("validation.strictTrailer", settings.validation.strictTrailer);

    if (settings.partSuffix.empty()) {
        settings.partSuffix = ".part";
    }
    return settings;
}

/**
 * Everything that belongs to one run
 */
struct DownloadEngine::RunContext {
    const DownloadRequest& request;
    const CancellationToken& token;

    std::filesystem::path finalPath;
    std::filesystem::path partPath;

    int attemptNumber{0};
    int maxAttempts{1};
    int64_t resumeOffset{0};
    bool resumed{false};
    size_t userAgentIndex{0};

    Clock::time_point startTime{Clock::now()};
    double networkSeconds{0.0};
    int64_t bytesReceived{0};

    // Size of the partial file; back to 0 whenever the run starts over
    int64_t bytesWritten{0};

    ValidationReport report;
};

DownloadEngine::DownloadEngine(std::shared_ptr<Transport> transport, EngineSettings settings)
    : m_transport(std::move(transport))
    , m_settings(std::move(settings))
    , m_sleeper([](double seconds, const CancellationToken& token) {
          return token.waitFor(std::chrono::duration<double>(seconds));
      }) {
}

void DownloadEngine::setSleeper(Sleeper sleeper) {
    if (sleeper) {
        m_sleeper = std::move(sleeper);
    }
}

DownloadOutcome DownloadEngine::run(const DownloadRequest& request) const {
    CancellationToken never;
    return run(request, never);
}

DownloadOutcome DownloadEngine::run(const DownloadRequest& request, const CancellationToken& token) const {
    RunContext ctx{request, token};
    try {
        return execute(ctx);
    } catch (const std::exception& e) {
        Logger::instance().error("Unexpected error downloading {}: {}", request.url, e.what());
        return failed(ctx, failedAfter(ctx.attemptNumber, std::string("Unexpected error: ") + e.what()));
    }
}

FetchRequest DownloadEngine::makeFetchRequest(const RunContext& ctx, int64_t offset) const {
    FetchRequest fetch;
    fetch.url = ctx.request.url;
    fetch.offset = offset;
    fetch.timeoutSeconds = ctx.request.timeoutSeconds;
    fetch.connectTimeoutSeconds = std::min(m_settings.connectTimeoutSeconds, ctx.request.timeoutSeconds);
    fetch.maxRedirects = m_settings.maxRedirects;
    fetch.verifySSL = m_settings.verifySSL;
    if (!m_settings.userAgents.empty()) {
        fetch.userAgent = m_settings.userAgents[ctx.userAgentIndex % m_settings.userAgents.size()];
    }
    return fetch;
}

DownloadOutcome DownloadEngine::execute(RunContext& ctx) const {
    auto& log = Logger::instance();
    const DownloadRequest& request = ctx.request;
    const CancellationToken& token = ctx.token;

    if (auto invalid = request.validate()) {
        Classification rejected = ErrorClassifier::classify(*invalid);
        log.error("Rejected download request: {}", rejected.description);
        return failed(ctx, rejected.description);
    }

    std::filesystem::path directory(request.destinationDirectory);
    if (!utils::FileUtils::isWritableDirectory(directory)) {
        Classification rejected = ErrorClassifier::classify(TransferFailure::filesystemError(
            "Destination directory is not writable: " + request.destinationDirectory));
        log.error("{}", rejected.description);
        return failed(ctx, rejected.description);
    }

    ctx.finalPath = directory / request.resolveFileName(maxFileNameLength(m_settings.partSuffix));
    ctx.partPath = ctx.finalPath;
    ctx.partPath += m_settings.partSuffix;
    ctx.maxAttempts = request.maxRetries + 1;

    // Leftover from an earlier process; never resumed across runs
    utils::FileUtils::deleteFile(ctx.partPath);
    utils::ScopedFileRemover partGuard(ctx.partPath);

    BackoffPolicy backoff = m_settings.randomSeed
        ? BackoffPolicy(m_settings.maxBackoffSeconds, m_settings.jitterRatio, *m_settings.randomSeed)
        : BackoffPolicy(m_settings.maxBackoffSeconds, m_settings.jitterRatio);
    RangeResumeNegotiator negotiator(*m_transport);

    std::optional<TransferFailure> failure;
    Classification classification;
    EngineState state = EngineState::Idle;

    log.info("Starting download: {} -> {}", request.url, ctx.finalPath.string());

    while (true) {
        log.trace("Engine state: {}", toString(state));

        switch (state) {
            case EngineState::Idle:
                state = EngineState::Attempting;
                break;

            case EngineState::Attempting: {
                if (token.isCancelled()) {
                    if (ctx.attemptNumber == 0) {
                        log.warn("Download of {} cancelled before the first attempt", request.url);
                        return failed(ctx, "Download cancelled before the first attempt");
                    }
                    failure = TransferFailure::cancelled();
                    classification = ErrorClassifier::classify(*failure);
                    state = EngineState::Stopped;
                    break;
                }

                ++ctx.attemptNumber;
                ctx.resumeOffset = 0;
                if (ctx.attemptNumber > 1) {
                    ResumeDecision decision = negotiator.negotiate(
                        ctx.partPath, makeFetchRequest(ctx, 0), classification.disposition);
                    ctx.resumeOffset = decision.offset;
                }
                ctx.bytesWritten = ctx.resumeOffset;

                log.info("Download attempt {}/{}", ctx.attemptNumber, ctx.maxAttempts);

                failure = performAttempt(ctx);
                if (!failure) {
                    failure = promote(ctx);
                }
                state = failure ? EngineState::Classifying : EngineState::Succeeded;
                break;
            }

            case EngineState::Classifying:
                classification = ErrorClassifier::classify(*failure);
                log.warn("Attempt {} failed: {} [{}]", ctx.attemptNumber, classification.description,
                         downloader::toString(classification.disposition));

                if (classification.disposition == RetryDisposition::NoRetry) {
                    state = EngineState::Stopped;
                } else if (ctx.attemptNumber >= ctx.maxAttempts) {
                    state = EngineState::ExhaustedRetries;
                } else {
                    state = EngineState::Backoff;
                }
                break;

            case EngineState::Backoff: {
                if (classification.disposition == RetryDisposition::PartialRetry) {
                    utils::FileUtils::deleteFile(ctx.partPath);
                }

                // Validation failures use the standard schedule
                std::optional<double> suggested;
                if (classification.disposition == RetryDisposition::Retry) {
                    suggested = classification.serverDelaySeconds;
                }
                double wait = backoff.delay(ctx.attemptNumber, request.baseRetryDelaySeconds, suggested);

                if (classification.rotateIdentity && m_settings.userAgents.size() > 1) {
                    ++ctx.userAgentIndex;
                    log.debug("Switching User-Agent for the next attempt");
                }

                log.info("Retrying in {:.1f} seconds...", wait);
                if (!m_sleeper(wait, token)) {
                    failure = TransferFailure::cancelled();
                    classification = ErrorClassifier::classify(*failure);
                    state = EngineState::Stopped;
                } else {
                    state = EngineState::Attempting;
                }
                break;
            }

            case EngineState::Succeeded:
                partGuard.release();
                return succeeded(ctx);

            case EngineState::Stopped:
            case EngineState::ExhaustedRetries: {
                utils::FileUtils::deleteFile(ctx.partPath);
                std::string message = failedAfter(ctx.attemptNumber, classification.description);
                log.error("Download failed: {}", message);
                return failed(ctx, message);
            }
        }
    }
}

std::optional<TransferFailure> DownloadEngine::performAttempt(RunContext& ctx) const {
    const int64_t offset = ctx.resumeOffset;
    if (offset > 0) {
        ctx.resumed = true;
    }

    FetchRequest fetch = makeFetchRequest(ctx, offset);
    PartFileSink sink(ctx.partPath, offset, ctx.token);

    auto started = Clock::now();
    FetchResult result = m_transport->fetch(fetch, sink);
    sink.close();
    ctx.networkSeconds += secondsSince(started);
    ctx.bytesReceived += sink.bytesReceived();
    if (sink.opened()) {
        // A full body truncated the partial file
        const int64_t base = sink.verdict() == RangeVerdict::Continue ? offset : 0;
        ctx.bytesWritten = base + sink.bytesReceived();
    }

    if (ctx.token.isCancelled()) {
        return TransferFailure::cancelled();
    }

    if (!sink.ioError().empty()) {
        return TransferFailure::filesystemError(sink.ioError());
    }

    if (sink.verdict() == RangeVerdict::Reject) {
        return TransferFailure::validationError("Server returned a range that does not match the partial file");
    }

    if (result.networkFailure) {
        return result.networkFailure;
    }

    const int status = sink.statusCode() != 0 ? sink.statusCode() : result.statusCode;
    if (status == 0) {
        return TransferFailure::networkError(NetworkCondition::Other,
                                             result.aborted ? "Transfer aborted" : "No response from server");
    }

    if (status < 200 || status >= 300) {
        if (status == 416 && offset > 0) {
            return TransferFailure::validationError("Requested range not satisfiable");
        }

        std::optional<double> retryAfter;
        auto header = result.headers.find("Retry-After");
        if (header != result.headers.end()) {
            retryAfter = utils::HttpClient::parseRetryAfter(header->second, std::time(nullptr));
        }
        return TransferFailure::httpError(status, retryAfter);
    }

    if (result.aborted) {
        return TransferFailure::networkError(NetworkCondition::Other, "Transfer aborted");
    }

    TransferValidator validator(m_settings.validation);
    ctx.report = validator.validate(ctx.partPath, sink.declaredLength(), ctx.request.expectedSha256);
    if (!ctx.report.valid) {
        return TransferFailure::validationError(ctx.report.error);
    }
    return std::nullopt;
}

std::optional<TransferFailure> DownloadEngine::promote(RunContext& ctx) const {
    std::string error;
    if (!utils::FileUtils::replaceFile(ctx.partPath, ctx.finalPath, error)) {
        return TransferFailure::filesystemError("Cannot move " + ctx.partPath.string() + " into place: " + error);
    }
    return std::nullopt;
}

DownloadOutcome DownloadEngine::succeeded(const RunContext& ctx) const {
    DownloadOutcome outcome;
    outcome.success = true;
    outcome.localPath = utils::FileUtils::absolutePath(ctx.finalPath);
    outcome.fileSizeBytes = utils::FileUtils::getFileSize(ctx.finalPath);
    outcome.bytesDownloaded = ctx.bytesWritten;
    outcome.attemptsUsed = ctx.attemptNumber;
    outcome.maxRetries = ctx.request.maxRetries;
    outcome.downloadTimeSeconds = ctx.networkSeconds;
    outcome.totalTimeSeconds = secondsSince(ctx.startTime);
    if (ctx.networkSeconds > 0.0) {
        outcome.averageSpeedBytesPerSecond = static_cast<double>(ctx.bytesReceived) / ctx.networkSeconds;
    }
    outcome.resumed = ctx.resumed;
    outcome.pdfVersion = ctx.report.pdfVersion;
    outcome.warnings = ctx.report.warnings;

    Logger::instance().info("Downloaded {} ({}) in {}s after {}",
                            *outcome.localPath,
                            utils::StringUtils::formatBytes(outcome.fileSizeBytes),
                            utils::StringUtils::formatSeconds(outcome.totalTimeSeconds),
                            attemptsPhrase(outcome.attemptsUsed));
    return outcome;
}

DownloadOutcome DownloadEngine::failed(const RunContext& ctx, const std::string& error) const {
    DownloadOutcome outcome;
    outcome.success = false;
    outcome.bytesDownloaded = ctx.bytesWritten;
    outcome.attemptsUsed = ctx.attemptNumber;
    outcome.maxRetries = ctx.request.maxRetries;
    outcome.downloadTimeSeconds = ctx.networkSeconds;
    outcome.totalTimeSeconds = secondsSince(ctx.startTime);
    if (ctx.networkSeconds > 0.0) {
        outcome.averageSpeedBytesPerSecond = static_cast<double>(ctx.bytesReceived) / ctx.networkSeconds;
    }
    outcome.resumed = ctx.resumed;
    outcome.errorMessage = error;
    return outcome;
}

} // namespace docfetch::core::downloader
