#include <gtest/gtest.h>
#include "fakes.hpp"
#include "model_client.hpp"

class ModelClientTest : public ::testing::Test {
protected:
    void build(FakeModelProvider::Responder responder = nullptr) {
        provider_ = std::make_shared<FakeModelProvider>(std::move(responder));
        ResponseCacheOptions cache_options;
        cache_options.max_size = 50;
        cache_ = std::make_shared<ResponseCache>(cache_options);
        client_ = std::make_unique<ModelClient>(provider_, fast_queue("model"), cache_, 300);
    }

    std::shared_ptr<FakeModelProvider> provider_;
    std::shared_ptr<ResponseCache> cache_;
    std::unique_ptr<ModelClient> client_;
};

TEST_F(ModelClientTest, SecondIdenticalCallIsServedFromCache) {
    build();
    auto first = client_->call_with_cache("prompt", ModelTier::Standard, 500, true);
    auto second = client_->call_with_cache("prompt", ModelTier::Standard, 500, true);

    EXPECT_EQ(first, second);
    EXPECT_EQ(provider_->calls(), 1);
    EXPECT_EQ(client_->cache_stats().hits, 1u);
}

TEST_F(ModelClientTest, CachingCanBeDisabled) {
    build();
    client_->call_with_cache("prompt", ModelTier::Standard, 500, false);
    client_->call_with_cache("prompt", ModelTier::Standard, 500, false);
    EXPECT_EQ(provider_->calls(), 2);
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(ModelClientTest, TierAndBudgetAreSeparateCacheEntries) {
    build();
    client_->call_with_cache("prompt", ModelTier::Standard, 500, true);
    client_->call_with_cache("prompt", ModelTier::Fast, 500, true);
    client_->call_with_cache("prompt", ModelTier::Standard, 300, true);
    EXPECT_EQ(provider_->calls(), 3);
}

TEST_F(ModelClientTest, RequestCarriesMappedModelAndBudget) {
    build();
    client_->call_with_cache("prompt", ModelTier::Premium, 123, true);

    auto requests = provider_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].model, "fake-premium");
    EXPECT_EQ(requests[0].max_tokens, 123);
    EXPECT_EQ(requests[0].prompt, "prompt");
}

TEST_F(ModelClientTest, UpstreamErrorsPropagate) {
    build([](const ModelRequest&) -> std::string {
        throw UpstreamError::http(401, "Invalid API key");
    });

    try {
        client_->call_with_cache("prompt", ModelTier::Fast, 100, true);
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamError& e) {
        EXPECT_EQ(*e.status(), 401);
    }
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(ModelClientTest, ShortTextIsItsOwnSearchQuery) {
    build();
    std::string text = "The Eiffel Tower is in Paris.";
    EXPECT_EQ(client_->extract_search_query(text), text);
    EXPECT_EQ(provider_->calls(), 0);
}

TEST_F(ModelClientTest, LongTextIsCondensedByExtractionTier) {
    build([](const ModelRequest&) {
        return std::string("The tower is 330 metres tall; It opened in 1889");
    });
    std::string text(400, 'a');

    EXPECT_EQ(client_->extract_search_query(text), "The tower is 330 metres tall; It opened in 1889");
    auto requests = provider_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].model, "fake-extraction");
    EXPECT_EQ(requests[0].max_tokens, 300);
}

TEST_F(ModelClientTest, TooShortExtractionFallsBackToLeadingSentences) {
    build([](const ModelRequest&) { return std::string("n/a"); });
    std::string text = "First claim here. Second claim here! Third claim here? Fourth claim. " + std::string(300, 'z');

    EXPECT_EQ(client_->extract_search_query(text), "First claim here. Second claim here. Third claim here");
}

TEST_F(ModelClientTest, FailedExtractionFallsBackToTwoSentences) {
    build([](const ModelRequest&) -> std::string {
        throw UpstreamError::http(400, "bad request");
    });
    std::string text = "First claim here. Second claim here. Third claim here. " + std::string(300, 'z');

    EXPECT_EQ(client_->extract_search_query(text), "First claim here. Second claim here");
}

TEST(LeadingSentencesTest, ClipsToMaxLength) {
    EXPECT_EQ(leading_sentences("One. Two. Three.", 2, 100), "One. Two");
    EXPECT_EQ(leading_sentences("Alpha beta gamma", 3, 5), "Alpha");
    EXPECT_EQ(leading_sentences("...", 2, 10), "...");
}
