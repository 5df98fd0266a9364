#include <gtest/gtest.h>
#include "aggregation.hpp"

using namespace aggregation;

TEST(AggregationTest, CloseRatingsGiveHighConfidence) {
    auto verdict = aggregate({90, 92, 88});
    EXPECT_EQ(verdict.rating, 90);
    EXPECT_EQ(verdict.confidence, Confidence::High);
    EXPECT_EQ(verdict.rating_count, 3u);
}

TEST(AggregationTest, SpreadRatingsGiveLowConfidence) {
    auto verdict = aggregate({10, 90});
    EXPECT_EQ(verdict.rating, 50);
    EXPECT_EQ(verdict.confidence, Confidence::Low);
}

TEST(AggregationTest, ModerateSpread) {
    EXPECT_EQ(confidence_for({60, 80}), Confidence::Moderate);
    EXPECT_EQ(confidence_for({60, 75}), Confidence::High);
    EXPECT_EQ(confidence_for({60, 90}), Confidence::Moderate);
    EXPECT_EQ(confidence_for({60, 91}), Confidence::Low);
}

TEST(AggregationTest, FewerThanTwoRatingsForceLow) {
    EXPECT_EQ(aggregate({85}).confidence, Confidence::Low);
    EXPECT_EQ(aggregate({85}).rating, 85);

    auto empty = aggregate({});
    EXPECT_EQ(empty.rating, kDefaultRating);
    EXPECT_EQ(empty.confidence, Confidence::Low);
}

TEST(AggregationTest, MeanIsRounded) {
    EXPECT_EQ(aggregate({70, 71}).rating, 71);
    EXPECT_EQ(aggregate({70, 70, 71}).rating, 70);
}

TEST(AggregationTest, ExtractsRatingCaseInsensitively) {
    EXPECT_EQ(extract_rating("Rating: 85\nExplanation: fine"), 85);
    EXPECT_EQ(extract_rating("after analysis, rating:42 overall"), 42);
    EXPECT_EQ(extract_rating("RATING:   0"), 0);
}

TEST(AggregationTest, IgnoresUnparseableRatings) {
    EXPECT_FALSE(extract_rating("No score here").has_value());
    EXPECT_FALSE(extract_rating("Rating: high").has_value());
    EXPECT_FALSE(extract_rating("Rating: 150").has_value());
    EXPECT_FALSE(extract_rating("Rating: 99999").has_value());
}

TEST(AggregationTest, ExtractsExplanationUpToBlankLine) {
    auto explanation = extract_explanation("Rating: 70\nExplanation: Mostly right.\n\nLimitations: few sources");
    ASSERT_TRUE(explanation.has_value());
    EXPECT_EQ(*explanation, "Mostly right.");

    EXPECT_FALSE(extract_explanation("Rating: 70").has_value());
}
