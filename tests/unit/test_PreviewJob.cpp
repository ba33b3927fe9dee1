#include <gtest/gtest.h>
#include "preview/job/Job.hpp"

#include <nlohmann/json.hpp>

using namespace ds::preview::job;

TEST(PreviewJobTest, StatusStrings) {
    EXPECT_EQ(Job::toString(Job::Status::PENDING), "pending");
    EXPECT_EQ(Job::toString(Job::Status::PROCESSING), "processing");
    EXPECT_EQ(Job::toString(Job::Status::COMPLETED), "completed");
    EXPECT_EQ(Job::toString(Job::Status::FAILED), "failed");
}

TEST(PreviewJobTest, ParseStatusIsCaseInsensitive) {
    Job::Status s = Job::Status::PENDING;
    EXPECT_TRUE(Job::tryParseStatus("Processing", s));
    EXPECT_EQ(s, Job::Status::PROCESSING);
    EXPECT_TRUE(Job::tryParseStatus("FAILED", s));
    EXPECT_EQ(s, Job::Status::FAILED);
}

TEST(PreviewJobTest, ParseStatusRejectsUnknown) {
    Job::Status s = Job::Status::COMPLETED;
    EXPECT_FALSE(Job::tryParseStatus("queued", s));
    EXPECT_EQ(s, Job::Status::COMPLETED);
}

TEST(PreviewJobTest, InFlightPredicate) {
    Job j;
    j.status = Job::Status::PENDING;
    EXPECT_TRUE(j.isInFlight());
    j.status = Job::Status::PROCESSING;
    EXPECT_TRUE(j.isInFlight());
    j.status = Job::Status::COMPLETED;
    EXPECT_FALSE(j.isInFlight());
}

TEST(PreviewJobTest, RetryableOnlyWhenFailedWithAttemptsLeft) {
    Job j;
    j.max_attempts = 3;
    j.status = Job::Status::FAILED;
    j.attempts = 2;
    EXPECT_TRUE(j.isRetryable());
    EXPECT_FALSE(j.isTerminal());

    j.attempts = 3;
    EXPECT_FALSE(j.isRetryable());
    EXPECT_TRUE(j.isTerminal());

    j.status = Job::Status::PENDING;
    j.attempts = 1;
    EXPECT_FALSE(j.isRetryable());
}

TEST(PreviewJobTest, CompletedIsTerminal) {
    Job j;
    j.status = Job::Status::COMPLETED;
    j.attempts = 0;
    EXPECT_TRUE(j.isTerminal());
}

TEST(PreviewJobTest, JsonExposesPollFields) {
    Job j;
    j.id = "job-1";
    j.file_id = "file-1";
    j.status = Job::Status::PENDING;
    j.attempts = 1;
    j.max_attempts = 3;
    j.last_error = "gotenberg unavailable";
    j.created_at = 1700000000;
    j.updated_at = 1700000030;
    j.next_retry_at = 1700000060;

    const nlohmann::json out = j;
    EXPECT_EQ(out.at("id"), "job-1");
    EXPECT_EQ(out.at("fileID"), "file-1");
    EXPECT_EQ(out.at("status"), "pending");
    EXPECT_EQ(out.at("attempts"), 1);
    EXPECT_EQ(out.at("maxAttempts"), 3);
    EXPECT_EQ(out.at("lastError"), "gotenberg unavailable");
    EXPECT_EQ(out.at("createdAt"), "2023-11-14T22:13:20Z");
    EXPECT_EQ(out.at("nextRetryAt"), "2023-11-14T22:14:20Z");
    EXPECT_FALSE(out.contains("startedAt"));
    EXPECT_FALSE(out.contains("completedAt"));
    EXPECT_FALSE(out.contains("requestedByID"));
}
