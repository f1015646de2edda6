#include <gtest/gtest.h>
#include "reconnect_backoff.hpp"

using std::chrono::seconds;

TEST(ReconnectBackoffTest, DoublesUpToCap) {
    ReconnectBackoff backoff(seconds(5), seconds(60));

    EXPECT_EQ(backoff.next_delay(), seconds(5));
    EXPECT_EQ(backoff.next_delay(), seconds(10));
    EXPECT_EQ(backoff.next_delay(), seconds(20));
    EXPECT_EQ(backoff.next_delay(), seconds(40));
    EXPECT_EQ(backoff.next_delay(), seconds(60));
    EXPECT_EQ(backoff.next_delay(), seconds(60));
    EXPECT_EQ(backoff.next_delay(), seconds(60));
}

TEST(ReconnectBackoffTest, ResetGoesBackToInitial) {
    ReconnectBackoff backoff(seconds(5), seconds(60));
    backoff.next_delay();
    backoff.next_delay();
    backoff.next_delay();
    EXPECT_EQ(backoff.current(), seconds(40));

    backoff.reset();
    EXPECT_EQ(backoff.current(), seconds(5));
    EXPECT_EQ(backoff.next_delay(), seconds(5));
    EXPECT_EQ(backoff.next_delay(), seconds(10));
}

TEST(ReconnectBackoffTest, CapBelowInitialUsesInitial) {
    ReconnectBackoff backoff(seconds(5), seconds(1));
    EXPECT_EQ(backoff.next_delay(), seconds(5));
    EXPECT_EQ(backoff.next_delay(), seconds(5));
}
