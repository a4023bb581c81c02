/**
 * RangeResumeNegotiator.cpp
 */

#include "RangeResumeNegotiator.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

namespace docfetch::core::downloader {

RangeResumeNegotiator::RangeResumeNegotiator(Transport& transport)
    : m_transport(transport) {
}

ResumeDecision RangeResumeNegotiator::restart(const std::filesystem::path& partPath, std::string reason) {
    utils::FileUtils::deleteFile(partPath);
    Logger::instance().debug("Restarting download from byte 0: {}", reason);
    return ResumeDecision{0, std::move(reason)};
}

ResumeDecision RangeResumeNegotiator::negotiate(const std::filesystem::path& partPath,
                                                const FetchRequest& probeRequest,
                                                RetryDisposition lastDisposition) {
    if (lastDisposition == RetryDisposition::PartialRetry) {
        return restart(partPath, "previous bytes failed validation");
    }

    int64_t existing = utils::FileUtils::fileExists(partPath) ? utils::FileUtils::getFileSize(partPath) : 0;
    if (existing <= 0) {
        return restart(partPath, "no partial data");
    }

    Logger::instance().info("Found partial file: {} bytes", existing);

    ProbeResult probe = m_transport.probe(probeRequest);
    if (!probe.reachable) {
        return restart(partPath, "range probe failed: " + probe.error);
    }
    if (!probe.acceptsRanges) {
        return restart(partPath, "server does not advertise byte ranges");
    }
    if (probe.contentLength && existing >= *probe.contentLength) {
        return restart(partPath, "partial file is not shorter than the remote file");
    }

    Logger::instance().info("Resuming download from byte {}", existing);
    return ResumeDecision{existing, "server accepts byte ranges"};
}

RangeVerdict RangeResumeNegotiator::judgeResponse(int64_t requestedOffset, int statusCode,
                                                  const utils::HttpHeaders& headers) {
    if (statusCode != 206) {
        if (requestedOffset > 0) {
            Logger::instance().warn("Server ignored range request (HTTP {}), downloading from scratch", statusCode);
        }
        return RangeVerdict::StartOver;
    }

    if (requestedOffset <= 0) {
        // Partial content nobody asked for
        return RangeVerdict::Reject;
    }

    auto it = headers.find("Content-Range");
    if (it == headers.end()) {
        return RangeVerdict::Continue;
    }

    auto range = utils::HttpClient::parseContentRange(it->second);
    if (!range || range->start != requestedOffset) {
        Logger::instance().warn("Content-Range '{}' does not start at byte {}", it->second, requestedOffset);
        return RangeVerdict::Reject;
    }
    return RangeVerdict::Continue;
}

} // namespace docfetch::core::downloader
