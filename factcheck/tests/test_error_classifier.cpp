#include <gtest/gtest.h>
#include "error_classifier.hpp"
#include "upstream_error.hpp"

using namespace error_classifier;

TEST(ErrorClassifierTest, CategorizesByStatus) {
    EXPECT_EQ(categorize(UpstreamError::http(429, "Too Many Requests")), ErrorCategory::RateLimit);
    EXPECT_EQ(categorize(UpstreamError::http(401, "Unauthorized")), ErrorCategory::AuthError);
    EXPECT_EQ(categorize(UpstreamError::http(403, "Forbidden")), ErrorCategory::AuthError);
    EXPECT_EQ(categorize(UpstreamError::http(503, "Service Unavailable")), ErrorCategory::Temporary);
    EXPECT_EQ(categorize(UpstreamError::http(500, "Internal Server Error")), ErrorCategory::Temporary);
}

TEST(ErrorClassifierTest, TransportFailuresAreTemporary) {
    EXPECT_EQ(categorize(UpstreamError(UpstreamError::Kind::Network, "connection refused")),
              ErrorCategory::Temporary);
    EXPECT_EQ(categorize(UpstreamError(UpstreamError::Kind::Timeout, "no answer")),
              ErrorCategory::Temporary);
}

TEST(ErrorClassifierTest, FallsBackToMessagePhrasing) {
    EXPECT_EQ(categorize(std::runtime_error("Rate limit reached for gpt-4o")), ErrorCategory::RateLimit);
    EXPECT_EQ(categorize(std::runtime_error("Invalid API key provided")), ErrorCategory::AuthError);
    EXPECT_EQ(categorize(std::runtime_error("Request timed out")), ErrorCategory::Temporary);
    EXPECT_EQ(categorize(std::runtime_error("Output blocked by content filter")), ErrorCategory::ContentPolicy);
    EXPECT_EQ(categorize(std::runtime_error("This model's maximum context length is 8192 tokens")),
              ErrorCategory::ContextLength);
    EXPECT_EQ(categorize(std::runtime_error("something odd happened")), ErrorCategory::Unknown);
}

TEST(ErrorClassifierTest, StatusTakesPriorityOverPhrasing) {
    // 429 wins even when the message reads like an auth problem
    EXPECT_EQ(categorize(UpstreamError::http(429, "unauthorized burst")), ErrorCategory::RateLimit);
    EXPECT_EQ(categorize(UpstreamError::http(401, "connection reset")), ErrorCategory::AuthError);
}

TEST(ErrorClassifierTest, RecoveryTableMatchesCategories) {
    auto rate = recovery_for(ErrorCategory::RateLimit);
    EXPECT_TRUE(rate.retry);
    EXPECT_EQ(rate.max_retries, 3);
    EXPECT_EQ(rate.wait, std::chrono::milliseconds(5000));
    EXPECT_FALSE(rate.fallback_model.has_value());

    auto auth = recovery_for(ErrorCategory::AuthError);
    EXPECT_FALSE(auth.retry);
    EXPECT_FALSE(auth.fallback_model.has_value());
    EXPECT_FALSE(auth.user_message.empty());

    auto policy = recovery_for(ErrorCategory::ContentPolicy);
    EXPECT_FALSE(policy.retry);
    EXPECT_TRUE(policy.fallback_model.has_value());
    EXPECT_TRUE(policy.reduce_prompt_size);

    auto length = recovery_for(ErrorCategory::ContextLength);
    EXPECT_TRUE(length.retry);
    EXPECT_EQ(length.max_retries, 1);
    EXPECT_TRUE(length.fallback_model.has_value());
    EXPECT_TRUE(length.reduce_prompt_size);

    auto unknown = recovery_for(ErrorCategory::Unknown);
    EXPECT_TRUE(unknown.retry);
    EXPECT_EQ(unknown.max_retries, 2);
    EXPECT_TRUE(unknown.fallback_model.has_value());
}

TEST(ErrorClassifierTest, FallbackUsesContextTier) {
    RecoveryContext context;
    context.current_tier = ModelTier::Premium;
    auto strategy = recovery_for(ErrorCategory::Unknown, context);
    ASSERT_TRUE(strategy.fallback_model.has_value());
    EXPECT_EQ(*strategy.fallback_model, ModelTier::Standard);
}

TEST(ErrorClassifierTest, FallbackChainConvergesToFast) {
    EXPECT_EQ(select_fallback_model(ModelTier::Premium), ModelTier::Standard);
    EXPECT_EQ(select_fallback_model(ModelTier::Standard), ModelTier::Fast);
    EXPECT_EQ(select_fallback_model(ModelTier::Extraction), ModelTier::Fast);
    EXPECT_EQ(select_fallback_model(ModelTier::Fast), ModelTier::Fast);

    ModelTier tier = ModelTier::Premium;
    int steps = 0;
    while (tier != ModelTier::Fast) {
        tier = select_fallback_model(tier);
        ++steps;
    }
    EXPECT_LE(steps, 2);
    for (int i = 0; i < 5; ++i) {
        tier = select_fallback_model(tier);
        EXPECT_EQ(tier, ModelTier::Fast);
    }
}

TEST(ErrorClassifierTest, UserMessageComesFromStrategy) {
    EXPECT_EQ(user_friendly_message(UpstreamError::http(401, "nope")),
              recovery_for(ErrorCategory::AuthError).user_message);
}
