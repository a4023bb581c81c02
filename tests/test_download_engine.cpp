#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "core/downloader/DownloadEngine.hpp"
#include "utils/HashUtils.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace docfetch::test;
using docfetch::core::CancellationToken;
using docfetch::core::downloader::DownloadEngine;
using docfetch::core::downloader::DownloadOutcome;
using docfetch::core::downloader::DownloadRequest;
using docfetch::core::downloader::EngineSettings;

class DownloadEngineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        transport = std::make_shared<FakeTransport>();
        sleeper = std::make_shared<RecordingSleeper>();
    }

    EngineSettings settings() const {
        EngineSettings s;
        s.userAgents = {"agent-a", "agent-b", "agent-c"};
        s.randomSeed = 42;
        return s;
    }

    DownloadEngine makeEngine(EngineSettings s) {
        DownloadEngine engine(transport, std::move(s));
        auto recorder = sleeper;
        engine.setSleeper([recorder](double seconds, const CancellationToken& token) {
            return (*recorder)(seconds, token);
        });
        return engine;
    }

    DownloadEngine makeEngine() { return makeEngine(settings()); }

    DownloadRequest request(int retries = 3, double delay = 1.0) const {
        DownloadRequest req("https://example.com/papers/report.pdf", dir().string());
        req.maxRetries = retries;
        req.baseRetryDelaySeconds = delay;
        return req;
    }

    fs::path finalPath() const { return dir() / "report.pdf"; }
    fs::path partPath() const { return dir() / "report.pdf.part"; }

    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<RecordingSleeper> sleeper;
};

TEST_F(DownloadEngineTest, SucceedsOnFirstAttempt) {
    std::string pdf = makePdf(2048);
    transport->push(ScriptedResponse::ok(pdf));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
    ASSERT_TRUE(outcome.localPath.has_value());
    EXPECT_TRUE(fs::equivalent(*outcome.localPath, finalPath()));
    EXPECT_FALSE(outcome.errorMessage.has_value());
    EXPECT_EQ(outcome.attemptsUsed, 1);
    EXPECT_EQ(outcome.maxRetries, 3);
    EXPECT_EQ(outcome.fileSizeBytes, static_cast<int64_t>(pdf.size()));
    EXPECT_EQ(outcome.bytesDownloaded, static_cast<int64_t>(pdf.size()));
    EXPECT_FALSE(outcome.resumed);
    EXPECT_EQ(outcome.pdfVersion.value_or(""), "1.4");
    EXPECT_EQ(readFile(finalPath()), pdf);
    EXPECT_FALSE(fs::exists(partPath()));
    EXPECT_TRUE(sleeper->delays().empty());
    EXPECT_GE(outcome.totalTimeSeconds, outcome.downloadTimeSeconds);
}

TEST_F(DownloadEngineTest, NotFoundStopsAfterOneAttempt) {
    transport->push(ScriptedResponse::httpError(404));

    DownloadOutcome outcome = makeEngine().run(request());

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.localPath.has_value());
    EXPECT_EQ(outcome.attemptsUsed, 1);
    EXPECT_EQ(transport->requests().size(), 1u);
    EXPECT_TRUE(sleeper->delays().empty());
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, ForbiddenReportsStatusAndAttempts) {
    transport->push(ScriptedResponse::httpError(403));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.errorMessage.has_value());
    EXPECT_NE(outcome.errorMessage->find("403"), std::string::npos);
    EXPECT_NE(outcome.errorMessage->find("1 attempt"), std::string::npos);
    EXPECT_EQ(outcome.attemptsUsed, 1);
}

TEST_F(DownloadEngineTest, PersistentServerErrorExhaustsRetries) {
    transport->push(ScriptedResponse::httpError(503));

    DownloadOutcome outcome = makeEngine().run(request(2, 1.0));

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 3);
    EXPECT_EQ(transport->requests().size(), 3u);

    auto delays = sleeper->delays();
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_GT(delays[1], delays[0]);

    ASSERT_TRUE(outcome.errorMessage.has_value());
    EXPECT_NE(outcome.errorMessage->find("Failed after 3 attempts"), std::string::npos);
    EXPECT_NE(outcome.errorMessage->find("503"), std::string::npos);
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, RecoversAfterTransientServerErrors) {
    std::string pdf = makePdf();
    transport->push(ScriptedResponse::httpError(503));
    transport->push(ScriptedResponse::httpError(503));
    transport->push(ScriptedResponse::ok(pdf));

    DownloadOutcome outcome = makeEngine().run(request(3, 1.0));

    ASSERT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
    EXPECT_EQ(outcome.attemptsUsed, 3);

    auto delays = sleeper->delays();
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_GE(delays[0], 1.0);
    EXPECT_LE(delays[0], 1.1);
    EXPECT_GE(delays[1], 2.0);
    EXPECT_LE(delays[1], 2.2);
}

TEST_F(DownloadEngineTest, ResumesFromPartialFile) {
    std::string pdf = makePdf(1000);
    transport->push(ScriptedResponse::truncated(pdf, 400));
    transport->push(ScriptedResponse::partial(pdf, 400));
    transport->setProbe(ProbeResult{true, 200, true, static_cast<int64_t>(pdf.size()), ""});

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
    EXPECT_TRUE(outcome.resumed);
    EXPECT_EQ(outcome.attemptsUsed, 2);
    EXPECT_EQ(outcome.bytesDownloaded, 1000);

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].offset, 0);
    EXPECT_EQ(requests[1].offset, 400);
    EXPECT_EQ(readFile(finalPath()), pdf);
}

TEST_F(DownloadEngineTest, RestartsWhenServerIgnoresRange) {
    std::string pdf = makePdf(1000);
    transport->push(ScriptedResponse::truncated(pdf, 300));
    transport->push(ScriptedResponse::ok(pdf));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
    EXPECT_EQ(transport->requests()[1].offset, 300);
    EXPECT_EQ(readFile(finalPath()), pdf);
    EXPECT_EQ(outcome.fileSizeBytes, 1000);
    EXPECT_EQ(outcome.bytesDownloaded, 1000);
}

TEST_F(DownloadEngineTest, RestartsWhenRangesAreNotAdvertised) {
    std::string pdf = makePdf(1000);
    transport->push(ScriptedResponse::truncated(pdf, 300));
    transport->push(ScriptedResponse::ok(pdf));
    transport->setProbe(ProbeResult{true, 200, false, static_cast<int64_t>(pdf.size()), ""});

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.resumed);
    EXPECT_EQ(transport->requests()[1].offset, 0);
    EXPECT_EQ(readFile(finalPath()), pdf);
}

TEST_F(DownloadEngineTest, MismatchedContentRangeDiscardsPartialData) {
    std::string pdf = makePdf(1000);
    transport->push(ScriptedResponse::truncated(pdf, 400));
    transport->push(ScriptedResponse::partial(pdf, 200));
    transport->push(ScriptedResponse::ok(pdf));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[1].offset, 400);
    EXPECT_EQ(requests[2].offset, 0);
    EXPECT_EQ(readFile(finalPath()), pdf);
}

TEST_F(DownloadEngineTest, RejectsSizeMismatch) {
    std::string pdf = makePdf(500);
    ScriptedResponse response = ScriptedResponse::ok(pdf);
    response.headers["Content-Length"] = "600";
    transport->push(response);

    DownloadOutcome outcome = makeEngine().run(request(0));

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.errorMessage.has_value());
    EXPECT_NE(outcome.errorMessage->find("Size mismatch"), std::string::npos);
    EXPECT_FALSE(fs::exists(finalPath()));
    EXPECT_FALSE(fs::exists(partPath()));
}

TEST_F(DownloadEngineTest, InvalidContentIsRetriedFromScratch) {
    std::string html(300, 'x');
    html.replace(0, 15, "<!DOCTYPE html>");
    transport->push(ScriptedResponse::ok(html));

    DownloadOutcome outcome = makeEngine().run(request(1));

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 2);
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].offset, 0);
    EXPECT_EQ(transport->probeCount(), 0u);
    EXPECT_NE(outcome.errorMessage->find("Invalid PDF header"), std::string::npos);
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, ChecksumMismatchExhaustsRetries) {
    transport->push(ScriptedResponse::ok(makePdf()));

    DownloadRequest req = request(2);
    req.expectedSha256 = std::string(64, '0');
    DownloadOutcome outcome = makeEngine().run(req);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 3);
    EXPECT_NE(outcome.errorMessage->find("Checksum mismatch"), std::string::npos);
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, ChecksumMatchIsAccepted) {
    std::string pdf = makePdf();
    transport->push(ScriptedResponse::ok(pdf));

    DownloadRequest req = request();
    req.expectedSha256 = docfetch::utils::HashUtils::sha256String(pdf);
    DownloadOutcome outcome = makeEngine().run(req);

    EXPECT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
}

TEST_F(DownloadEngineTest, RetryAfterOverridesComputedDelay) {
    transport->push(ScriptedResponse::httpError(429, {{"Retry-After", "30"}}));
    transport->push(ScriptedResponse::ok(makePdf()));

    DownloadOutcome outcome = makeEngine().run(request(3, 1.0));

    ASSERT_TRUE(outcome.success);
    auto delays = sleeper->delays();
    ASSERT_EQ(delays.size(), 1u);
    EXPECT_DOUBLE_EQ(delays[0], 30.0);

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0].userAgent, requests[1].userAgent);
}

TEST_F(DownloadEngineTest, RetryAfterIsCappedAtCeiling) {
    transport->push(ScriptedResponse::httpError(429, {{"Retry-After", "3600"}}));
    transport->push(ScriptedResponse::ok(makePdf()));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(sleeper->delays().size(), 1u);
    EXPECT_DOUBLE_EQ(sleeper->delays()[0], 120.0);
}

TEST_F(DownloadEngineTest, ServerErrorKeepsUserAgent) {
    transport->push(ScriptedResponse::httpError(500));
    transport->push(ScriptedResponse::ok(makePdf()));

    ASSERT_TRUE(makeEngine().run(request()).success);
    auto requests = transport->requests();
    EXPECT_EQ(requests[0].userAgent, requests[1].userAgent);
}

TEST_F(DownloadEngineTest, ConnectFailureIsRetried) {
    transport->push(ScriptedResponse::networkError(NetworkCondition::ConnectFailure));
    transport->push(ScriptedResponse::ok(makePdf()));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 2);
    auto requests = transport->requests();
    EXPECT_NE(requests[0].userAgent, requests[1].userAgent);
}

TEST_F(DownloadEngineTest, InvalidRequestUsesNoAttempts) {
    DownloadRequest req = request();
    req.url = "ftp://example.com/file.pdf";

    DownloadOutcome outcome = makeEngine().run(req);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 0);
    EXPECT_TRUE(transport->requests().empty());
    ASSERT_TRUE(outcome.errorMessage.has_value());
    EXPECT_NE(outcome.errorMessage->find("ftp"), std::string::npos);
}

TEST_F(DownloadEngineTest, MissingDestinationUsesNoAttempts) {
    DownloadRequest req = request();
    req.destinationDirectory = (dir() / "does" / "not" / "exist").string();

    DownloadOutcome outcome = makeEngine().run(req);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 0);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(DownloadEngineTest, StalePartialFileIsNotResumed) {
    writeFile(partPath(), "stale bytes from an earlier process");
    std::string pdf = makePdf();
    transport->push(ScriptedResponse::ok(pdf));

    DownloadOutcome outcome = makeEngine().run(request());

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(transport->requests()[0].offset, 0);
    EXPECT_EQ(readFile(finalPath()), pdf);
}

TEST_F(DownloadEngineTest, CancelledBeforeStart) {
    transport->push(ScriptedResponse::ok(makePdf()));
    CancellationToken token;
    token.cancel();

    DownloadOutcome outcome = makeEngine().run(request(), token);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 0);
    EXPECT_TRUE(transport->requests().empty());
    ASSERT_TRUE(outcome.errorMessage.has_value());
    EXPECT_EQ(*outcome.errorMessage, "Download cancelled before the first attempt");
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, CancelDuringTransferLeavesNoPartialFile) {
    CancellationToken token;
    transport->push(ScriptedResponse::ok(makePdf(4096)));
    transport->onFetch = [&token](const FetchRequest&) { token.cancel(); };

    DownloadOutcome outcome = makeEngine().run(request(), token);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 1);
    EXPECT_TRUE(sleeper->delays().empty());
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, CancelDuringBackoffStopsRetrying) {
    CancellationToken token;
    transport->push(ScriptedResponse::truncated(makePdf(1000), 500));

    DownloadEngine engine = makeEngine();
    engine.setSleeper([&token](double, const CancellationToken& t) {
        token.cancel();
        return !t.isCancelled();
    });

    DownloadOutcome outcome = engine.run(request(), token);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 1);
    EXPECT_EQ(transport->requests().size(), 1u);
    EXPECT_TRUE(listDir().empty());
}

TEST_F(DownloadEngineTest, DefaultSleeperWakesOnCancel) {
    CancellationToken token;
    transport->push(ScriptedResponse::httpError(503));

    DownloadEngine engine(transport, settings());
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    DownloadOutcome outcome = engine.run(request(3, 30.0), token);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(DownloadEngineTest, ConcurrentRunsDoNotInterfere) {
    std::string pdf = makePdf(3000);
    transport->push(ScriptedResponse::ok(pdf));
    DownloadEngine engine = makeEngine();

    constexpr int kRuns = 6;
    std::vector<DownloadOutcome> outcomes(kRuns);
    std::vector<std::thread> threads;
    for (int i = 0; i < kRuns; ++i) {
        fs::path target = dir() / ("run" + std::to_string(i));
        fs::create_directories(target);
        threads.emplace_back([&, i, target] {
            DownloadRequest req = request();
            req.destinationDirectory = target.string();
            outcomes[i] = engine.run(req);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kRuns; ++i) {
        ASSERT_TRUE(outcomes[i].success) << outcomes[i].errorMessage.value_or("");
        EXPECT_EQ(outcomes[i].attemptsUsed, 1);
        EXPECT_EQ(readFile(*outcomes[i].localPath), pdf);
    }
}

TEST_F(DownloadEngineTest, UsesExplicitFilename) {
    transport->push(ScriptedResponse::ok(makePdf()));
    DownloadRequest req = request();
    req.filename = "annual-report";

    DownloadOutcome outcome = makeEngine().run(req);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(fs::exists(dir() / "annual-report.pdf"));
}

TEST_F(DownloadEngineTest, LongUrlSegmentStillDownloads) {
    std::string pdf = makePdf();
    transport->push(ScriptedResponse::ok(pdf));
    DownloadRequest req = request();
    req.url = "https://example.com/" + std::string(300, 'a') + ".pdf";

    DownloadOutcome outcome = makeEngine().run(req);

    ASSERT_TRUE(outcome.success) << outcome.errorMessage.value_or("");
    fs::path saved(*outcome.localPath);
    EXPECT_EQ(saved.extension(), ".pdf");
    EXPECT_LE(saved.filename().string().size() + std::string(".part").size(), 255u);
    EXPECT_EQ(readFile(saved), pdf);
}

TEST_F(DownloadEngineTest, UnexpectedExceptionKeepsAttemptCount) {
    transport->push(ScriptedResponse::httpError(503));
    int fetches = 0;
    transport->onFetch = [&fetches](const FetchRequest&) {
        if (++fetches == 2) {
            throw std::runtime_error("transport exploded");
        }
    };

    DownloadOutcome outcome = makeEngine().run(request());

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.attemptsUsed, 2);
    ASSERT_TRUE(outcome.errorMessage.has_value());
    EXPECT_EQ(*outcome.errorMessage, "Failed after 2 attempts. Last error: Unexpected error: transport exploded");
    EXPECT_TRUE(listDir().empty());
}
