/**
 * @file test_score_filter.cpp
 * @brief Unit tests for score smoothing
 */

#include <gtest/gtest.h>

#include "sysgram/core/errors.hpp"
#include "sysgram/detection/score_filter.hpp"

using namespace sysgram;
using namespace sysgram::detection;

TEST(ScoreFilterTest, ValidatesParameters) {
    EXPECT_THROW(ScoreFilter(0.0, 5, 2), core::ConfigurationError);
    EXPECT_THROW(ScoreFilter(1.5, 5, 2), core::ConfigurationError);
    EXPECT_THROW(ScoreFilter(0.5, 0, 1), core::ConfigurationError);
    EXPECT_THROW(ScoreFilter(0.5, 5, 0), core::ConfigurationError);
    EXPECT_THROW(ScoreFilter(0.5, 5, 6), core::ConfigurationError);
}

TEST(ScoreFilterTest, ExponentialMovingAverage) {
    ScoreFilter filter(0.75, 5, 2);
    EXPECT_DOUBLE_EQ(filter.Apply(0.0), 0.0);
    EXPECT_DOUBLE_EQ(filter.Apply(1.0), 0.75);
    EXPECT_DOUBLE_EQ(filter.Apply(1.0), 0.9375);
    EXPECT_EQ(filter.GetObserved(), 3u);
}

TEST(ScoreFilterTest, NewPeakIsClippedOnceHistoryIsFull) {
    ScoreFilter filter(1.0, 5, 2);

    EXPECT_DOUBLE_EQ(filter.Apply(0.1), 0.1);
    EXPECT_DOUBLE_EQ(filter.Apply(0.2), 0.2);
    EXPECT_DOUBLE_EQ(filter.Apply(0.3), 0.3);
    EXPECT_DOUBLE_EQ(filter.Apply(0.4), 0.4);

    // Exceeds every earlier value: replaced by the second largest
    EXPECT_DOUBLE_EQ(filter.Apply(0.9), 0.4);

    // Not a new peak
    EXPECT_DOUBLE_EQ(filter.Apply(0.1), 0.1);
}

TEST(ScoreFilterTest, SustainedHighScoresPassThrough) {
    ScoreFilter filter(1.0, 5, 2);
    for (int i = 0; i < 4; ++i) {
        filter.Apply(0.1);
    }
    EXPECT_DOUBLE_EQ(filter.Apply(0.9), 0.1);
    EXPECT_DOUBLE_EQ(filter.Apply(0.9), 0.9);
}

TEST(ScoreFilterTest, ResetForgetsHistory) {
    ScoreFilter filter(0.5, 5, 2);
    filter.Apply(1.0);
    filter.Reset();

    EXPECT_EQ(filter.GetObserved(), 0u);
    EXPECT_DOUBLE_EQ(filter.Apply(0.2), 0.2);
}
