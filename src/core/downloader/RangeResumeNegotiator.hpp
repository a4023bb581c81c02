#pragma once

/**
 * RangeResumeNegotiator.hpp
 *
 * Decides whether a retry continues a partial file or starts over.
 */

#include "ErrorClassifier.hpp"
#include "Transport.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace docfetch::core::downloader {

/**
 * Outcome of negotiate(); offset 0 means a full restart
 */
struct ResumeDecision {
    int64_t offset{0};
    std::string reason;

    bool resumes() const { return offset > 0; }
};

/**
 * How to treat a successful response to a (possibly ranged) request
 */
enum class RangeVerdict {
    Continue,   // 206 starting at the requested offset: append
    StartOver,  // full body: truncate and write from byte 0
    Reject      // inconsistent partial content: abort the attempt
};

/**
 * RangeResumeNegotiator - per-run, keeps no state between calls
 */
class RangeResumeNegotiator {
public:
    explicit RangeResumeNegotiator(Transport& transport);

    /**
     * Called before every retry. Deletes the partial file whenever the
     * decision is a restart.
     * @param partPath Partial file of this run
     * @param probeRequest Request used for the capability probe
     * @param lastDisposition Classification of the failed attempt
     */
    ResumeDecision negotiate(const std::filesystem::path& partPath,
                             const FetchRequest& probeRequest,
                             RetryDisposition lastDisposition);

    /**
     * Judge a 2xx response against the offset that was requested
     */
    static RangeVerdict judgeResponse(int64_t requestedOffset, int statusCode,
                                      const utils::HttpHeaders& headers);

private:
    ResumeDecision restart(const std::filesystem::path& partPath, std::string reason);

    Transport& m_transport;
};

} // namespace docfetch::core::downloader
