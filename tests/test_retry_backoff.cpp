// test_retry_backoff.cpp
#include <gtest/gtest.h>
#include "retry_backoff.h"

using std::chrono::milliseconds;

TEST(RetryBackoffTest, DoublesFromInitialDelay) {
    RetryBackoff backoff(milliseconds(250), milliseconds(5000));
    EXPECT_EQ(backoff.nextDelay(), milliseconds(250));
    EXPECT_EQ(backoff.nextDelay(), milliseconds(500));
    EXPECT_EQ(backoff.nextDelay(), milliseconds(1000));
    EXPECT_EQ(backoff.nextDelay(), milliseconds(2000));
    EXPECT_EQ(backoff.failures(), 4);
}

TEST(RetryBackoffTest, CapsAtMaximum) {
    RetryBackoff backoff(milliseconds(250), milliseconds(5000));
    milliseconds last{0};
    for (int i = 0; i < 50; ++i) {
        last = backoff.nextDelay();
        EXPECT_LE(last, milliseconds(5000));
    }
    EXPECT_EQ(last, milliseconds(5000));
}

TEST(RetryBackoffTest, ResetStartsOver) {
    RetryBackoff backoff(milliseconds(100), milliseconds(1000));
    backoff.nextDelay();
    backoff.nextDelay();
    backoff.nextDelay();
    backoff.reset();
    EXPECT_EQ(backoff.failures(), 0);
    EXPECT_EQ(backoff.nextDelay(), milliseconds(100));
}

TEST(RetryBackoffTest, MaximumBelowInitialIsRaised) {
    RetryBackoff backoff(milliseconds(300), milliseconds(100));
    EXPECT_EQ(backoff.maxDelay(), milliseconds(300));
    EXPECT_EQ(backoff.nextDelay(), milliseconds(300));
    EXPECT_EQ(backoff.nextDelay(), milliseconds(300));
}
