#include <gtest/gtest.h>
#include "core/downloader/DownloadOutcome.hpp"

using docfetch::core::downloader::DownloadOutcome;

TEST(DownloadOutcomeTest, SuccessJson) {
    DownloadOutcome outcome;
    outcome.success = true;
    outcome.localPath = "/tmp/paper.pdf";
    outcome.fileSizeBytes = 2048;
    outcome.attemptsUsed = 2;
    outcome.maxRetries = 3;
    outcome.pdfVersion = "1.7";

    auto j = outcome.toJson();
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["local_path"], "/tmp/paper.pdf");
    EXPECT_TRUE(j["error_message"].is_null());
    EXPECT_EQ(j["attempts_used"], 2);
    EXPECT_EQ(j["pdf_version"], "1.7");
    EXPECT_FALSE(j.contains("warnings"));
}

TEST(DownloadOutcomeTest, FailureJson) {
    DownloadOutcome outcome;
    outcome.errorMessage = "Failed after 4 attempt(s). Last error: Server error (HTTP 503)";
    outcome.attemptsUsed = 4;
    outcome.maxRetries = 3;

    auto j = outcome.toJson();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j["local_path"].is_null());
    EXPECT_EQ(j["error_message"], *outcome.errorMessage);
}

TEST(DownloadOutcomeTest, SuccessSummary) {
    DownloadOutcome outcome;
    outcome.success = true;
    outcome.localPath = "/tmp/paper.pdf";
    outcome.attemptsUsed = 1;
    outcome.maxRetries = 3;
    outcome.resumed = true;
    outcome.warnings = {"No xref table found"};

    std::string text = outcome.summary();
    EXPECT_NE(text.find("PDF Download Successful"), std::string::npos);
    EXPECT_NE(text.find("Attempts Used: 1/4"), std::string::npos);
    EXPECT_NE(text.find("Resumed: yes"), std::string::npos);
    EXPECT_NE(text.find("Warning: No xref table found"), std::string::npos);
}

TEST(DownloadOutcomeTest, FailureSummary) {
    DownloadOutcome outcome;
    outcome.errorMessage = "Download cancelled";
    outcome.maxRetries = 2;

    std::string text = outcome.summary();
    EXPECT_NE(text.find("PDF Download Failed"), std::string::npos);
    EXPECT_NE(text.find("Error: Download cancelled"), std::string::npos);
    EXPECT_NE(text.find("Attempts Used: 0/3"), std::string::npos);
}
