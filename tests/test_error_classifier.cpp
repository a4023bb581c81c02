#include <gtest/gtest.h>
#include "core/downloader/ErrorClassifier.hpp"
#include "core/downloader/HttpTransport.hpp"

using namespace docfetch::core::downloader;

TEST(ErrorClassifierTest, ServerErrorsAreRetried) {
    for (int status : {500, 502, 503, 504, 599}) {
        Classification c = ErrorClassifier::classify(TransferFailure::httpError(status));
        EXPECT_EQ(c.disposition, RetryDisposition::Retry) << status;
        EXPECT_FALSE(c.rotateIdentity) << status;
        EXPECT_NE(c.description.find(std::to_string(status)), std::string::npos);
    }
}

TEST(ErrorClassifierTest, ClientErrorsAreTerminal) {
    for (int status : {400, 401, 403, 404, 410, 451}) {
        Classification c = ErrorClassifier::classify(TransferFailure::httpError(status));
        EXPECT_EQ(c.disposition, RetryDisposition::NoRetry) << status;
    }
}

TEST(ErrorClassifierTest, RequestTimeoutIsRetried) {
    Classification c = ErrorClassifier::classify(TransferFailure::httpError(408));
    EXPECT_EQ(c.disposition, RetryDisposition::Retry);
}

TEST(ErrorClassifierTest, RateLimitCarriesServerDelay) {
    Classification c = ErrorClassifier::classify(TransferFailure::httpError(429, 42.0));
    EXPECT_EQ(c.disposition, RetryDisposition::Retry);
    ASSERT_TRUE(c.serverDelaySeconds.has_value());
    EXPECT_DOUBLE_EQ(*c.serverDelaySeconds, 42.0);
    EXPECT_TRUE(c.rotateIdentity);
    EXPECT_EQ(c.description, "Rate limited (HTTP 429)");
}

TEST(ErrorClassifierTest, RetryAfterIgnoredOutsideRateLimit) {
    Classification c = ErrorClassifier::classify(TransferFailure::httpError(503, 42.0));
    EXPECT_FALSE(c.serverDelaySeconds.has_value());
}

TEST(ErrorClassifierTest, NetworkConditions) {
    struct Case {
        NetworkCondition condition;
        RetryDisposition disposition;
        bool rotate;
    };
    const Case cases[] = {
        {NetworkCondition::ConnectFailure, RetryDisposition::Retry, true},
        {NetworkCondition::Timeout, RetryDisposition::Retry, false},
        {NetworkCondition::TlsFailure, RetryDisposition::Retry, true},
        {NetworkCondition::ShortBody, RetryDisposition::Retry, false},
        {NetworkCondition::ReceiveError, RetryDisposition::Retry, false},
        {NetworkCondition::Other, RetryDisposition::Retry, false},
        {NetworkCondition::MalformedUrl, RetryDisposition::NoRetry, false},
    };

    for (const auto& tc : cases) {
        Classification c = ErrorClassifier::classify(TransferFailure::networkError(tc.condition, "boom"));
        EXPECT_EQ(c.disposition, tc.disposition);
        EXPECT_EQ(c.rotateIdentity, tc.rotate);
        EXPECT_NE(c.description.find("boom"), std::string::npos);
    }
}

TEST(ErrorClassifierTest, ValidationDiscardsPartialData) {
    Classification c = ErrorClassifier::classify(TransferFailure::validationError("Size mismatch"));
    EXPECT_EQ(c.disposition, RetryDisposition::PartialRetry);
    EXPECT_EQ(c.description, "Validation failed: Size mismatch");
}

TEST(ErrorClassifierTest, LocalFailuresAreTerminal) {
    EXPECT_EQ(ErrorClassifier::classify(TransferFailure::filesystemError("disk full")).disposition,
              RetryDisposition::NoRetry);
    EXPECT_EQ(ErrorClassifier::classify(TransferFailure::configurationError("bad url")).disposition,
              RetryDisposition::NoRetry);
    EXPECT_EQ(ErrorClassifier::classify(TransferFailure::cancelled()).disposition,
              RetryDisposition::NoRetry);
}

TEST(ErrorClassifierTest, StatusPredicates) {
    EXPECT_TRUE(ErrorClassifier::isRetryableStatus(429));
    EXPECT_TRUE(ErrorClassifier::isRetryableStatus(500));
    EXPECT_FALSE(ErrorClassifier::isRetryableStatus(404));
    EXPECT_TRUE(ErrorClassifier::isTerminalStatus(404));
    EXPECT_FALSE(ErrorClassifier::isTerminalStatus(408));
    EXPECT_FALSE(ErrorClassifier::isTerminalStatus(200));
}

TEST(ErrorClassifierTest, DispositionNames) {
    EXPECT_STREQ(toString(RetryDisposition::Retry), "RETRY");
    EXPECT_STREQ(toString(RetryDisposition::NoRetry), "NO_RETRY");
    EXPECT_STREQ(toString(RetryDisposition::PartialRetry), "PARTIAL_RETRY");
}

TEST(HttpTransportTest, CurlCodesMapToConditions) {
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_COULDNT_CONNECT), NetworkCondition::ConnectFailure);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_COULDNT_RESOLVE_HOST), NetworkCondition::ConnectFailure);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_OPERATION_TIMEDOUT), NetworkCondition::Timeout);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_PEER_FAILED_VERIFICATION), NetworkCondition::TlsFailure);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_PARTIAL_FILE), NetworkCondition::ShortBody);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_RECV_ERROR), NetworkCondition::ReceiveError);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_URL_MALFORMAT), NetworkCondition::MalformedUrl);
    EXPECT_EQ(HttpTransport::conditionFor(CURLE_FAILED_INIT), NetworkCondition::Other);
}

TEST(ErrorClassifierTest, DescriptionIsNeverEmpty) {
    TransferFailure unknown;
    unknown.kind = static_cast<FailureKind>(99);
    Classification c = ErrorClassifier::classify(unknown);
    EXPECT_EQ(c.disposition, RetryDisposition::Retry);
    EXPECT_EQ(c.description, "RETRY");

    EXPECT_FALSE(ErrorClassifier::classify(TransferFailure::cancelled()).description.empty());
}
