#include <gtest/gtest.h>
#include "preview/Backoff.hpp"

#include <stdexcept>

using namespace ds::preview;
using namespace std::chrono;

class BackoffTest : public ::testing::Test {
protected:
    std::vector<seconds> schedule{seconds(30), minutes(2), minutes(10)};
};

TEST_F(BackoffTest, FirstFailureUsesFirstDelay) {
    EXPECT_EQ(retryDelay(schedule, 1), seconds(30));
}

TEST_F(BackoffTest, IndexesByAttemptCount) {
    EXPECT_EQ(retryDelay(schedule, 2), minutes(2));
    EXPECT_EQ(retryDelay(schedule, 3), minutes(10));
}

TEST_F(BackoffTest, ClampsToLastDelay) {
    EXPECT_EQ(retryDelay(schedule, 4), minutes(10));
    EXPECT_EQ(retryDelay(schedule, 50), minutes(10));
}

TEST_F(BackoffTest, ZeroAttemptsUsesFirstDelay) {
    EXPECT_EQ(retryDelay(schedule, 0), seconds(30));
}

TEST_F(BackoffTest, SingleEntrySchedule) {
    const std::vector<seconds> single{seconds(5)};
    EXPECT_EQ(retryDelay(single, 1), seconds(5));
    EXPECT_EQ(retryDelay(single, 7), seconds(5));
}

TEST_F(BackoffTest, EmptyScheduleThrows) {
    EXPECT_THROW(retryDelay({}, 1), std::invalid_argument);
}
