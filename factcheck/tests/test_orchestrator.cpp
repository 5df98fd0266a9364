#include <gtest/gtest.h>
#include "fakes.hpp"
#include "check_server.hpp"
#include "orchestrator.hpp"
#include <atomic>
#include <thread>

using namespace std::chrono_literals;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool is_emergency_prompt(const ModelRequest& request) {
    return contains(request.prompt, "rate its accuracy from 0-100");
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() {
        options_.use_multi_model = false;
        options_.auto_select_model = false;
        options_.default_tier = ModelTier::Standard;
        options_.check_max_retries = 2;
        options_.check_initial_delay = 1ms;
        options_.check_max_delay = 5ms;
    }

    void build(FakeModelProvider::Responder responder = nullptr,
               std::shared_ptr<SearchProvider> search = nullptr) {
        provider_ = std::make_shared<FakeModelProvider>(std::move(responder));
        ResponseCacheOptions cache_options;
        cache_ = std::make_shared<ResponseCache>(cache_options);
        models_ = std::make_shared<ModelClient>(provider_, fast_queue("model"), cache_, 300);
        if (search) {
            search_ = std::make_shared<SearchClient>(search, fast_queue("search"));
        }
        orchestrator_ = std::make_unique<Orchestrator>(models_, search_, options_);
    }

    OrchestratorOptions options_;
    std::shared_ptr<FakeModelProvider> provider_;
    std::shared_ptr<ResponseCache> cache_;
    std::shared_ptr<ModelClient> models_;
    std::shared_ptr<SearchClient> search_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

TEST_F(OrchestratorTest, SingleModelCheckReturnsRating) {
    build([](const ModelRequest&) {
        return std::string("Rating: 82\nExplanation: Supported by sources.");
    });

    auto result = orchestrator_->check("The Eiffel Tower is in Paris.");

    ASSERT_TRUE(result.rating.has_value());
    EXPECT_EQ(*result.rating, 82);
    EXPECT_FALSE(result.degraded);
    EXPECT_FALSE(result.error_category.has_value());
    EXPECT_EQ(result.model, "fake-standard");
    EXPECT_EQ(result.query_text, "The Eiffel Tower is in Paris.");
    EXPECT_TRUE(contains(result.result, "Model: fake-standard"));
    EXPECT_TRUE(contains(result.result, "References:"));
}

TEST_F(OrchestratorTest, ConcurrentIdenticalChecksShareOneExecution) {
    options_.enable_caching = false;
    std::promise<void> release;
    auto gate = release.get_future().share();
    build([gate](const ModelRequest&) {
        gate.wait();
        return std::string("Rating: 64\nExplanation: Partly accurate.");
    });

    auto first = orchestrator_->check_async("same text");
    auto second = orchestrator_->check_async("same text");
    EXPECT_EQ(orchestrator_->pending_count(), 1u);

    release.set_value();
    auto a = first.get();
    auto b = second.get();

    EXPECT_EQ(provider_->calls(), 1);
    EXPECT_EQ(a.result, b.result);
    EXPECT_EQ(a.rating, b.rating);
    EXPECT_EQ(orchestrator_->pending_count(), 0u);
}

TEST_F(OrchestratorTest, SettledCheckLeavesRegistry) {
    options_.enable_caching = false;
    build();

    orchestrator_->check("repeatable text");
    EXPECT_EQ(orchestrator_->pending_count(), 0u);
    orchestrator_->check("repeatable text");
    EXPECT_EQ(provider_->calls(), 2);
}

TEST_F(OrchestratorTest, FingerprintUsesBoundedPrefix) {
    std::string prefix(Orchestrator::kFingerprintPrefix, 'p');
    EXPECT_EQ(Orchestrator::fingerprint(prefix + "tail one"), Orchestrator::fingerprint(prefix + "tail two"));
    EXPECT_NE(Orchestrator::fingerprint("a"), Orchestrator::fingerprint("b"));
}

TEST_F(OrchestratorTest, MultiModelAggregatesAgreeingRatings) {
    options_.use_multi_model = true;
    build([](const ModelRequest& request) {
        if (request.model == "fake-standard") {
            return std::string("Rating: 90\nExplanation: Evidence supports it.");
        }
        return std::string("Rating: 92\nExplanation: Internally consistent.");
    });

    auto result = orchestrator_->check("Water boils at 100 degrees Celsius at sea level.");

    ASSERT_TRUE(result.rating.has_value());
    EXPECT_EQ(*result.rating, 91);
    ASSERT_TRUE(result.confidence.has_value());
    EXPECT_EQ(*result.confidence, Confidence::High);
    EXPECT_TRUE(contains(result.result, "Evidence Analysis: Evidence supports it."));
    EXPECT_TRUE(contains(result.result, "Logical Consistency: Internally consistent."));
    EXPECT_TRUE(contains(result.result, "Primary Model: fake-standard"));
    EXPECT_TRUE(contains(result.result, "Secondary Model(s): fake-fast"));
    EXPECT_EQ(provider_->calls(), 2);
}

TEST_F(OrchestratorTest, MultiModelDisagreementLowersConfidence) {
    options_.use_multi_model = true;
    build([](const ModelRequest& request) {
        return request.model == "fake-standard" ? std::string("Rating: 10\nExplanation: False.")
                                                : std::string("Rating: 90\nExplanation: Consistent.");
    });

    auto result = orchestrator_->check("A disputed statement about history.");
    EXPECT_EQ(*result.rating, 50);
    EXPECT_EQ(*result.confidence, Confidence::Low);
}

TEST_F(OrchestratorTest, MultiModelToleratesOneFailedPrompt) {
    options_.use_multi_model = true;
    build([](const ModelRequest& request) -> std::string {
        if (request.model == "fake-fast") {
            throw UpstreamError::http(500, "server error");
        }
        return "Rating: 70\nExplanation: Mostly right.";
    });

    auto result = orchestrator_->check("Some statement to verify.");
    EXPECT_EQ(*result.rating, 70);
    EXPECT_EQ(*result.confidence, Confidence::Low);
    EXPECT_TRUE(contains(result.result, "limited analysis methods available"));
    EXPECT_FALSE(result.degraded);
}

TEST_F(OrchestratorTest, UnknownFailureFallsBackToEmergencyCheck) {
    build([](const ModelRequest& request) -> std::string {
        if (is_emergency_prompt(request)) {
            return "Rating: 40\nExplanation: Simplified verdict.";
        }
        throw UpstreamError::http(400, "bad request payload");
    });

    auto result = orchestrator_->check("A statement that keeps failing.");

    ASSERT_TRUE(result.rating.has_value());
    EXPECT_EQ(*result.rating, 40);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(result.model, "fake-fast");
    EXPECT_EQ(*result.confidence, Confidence::Low);
    EXPECT_TRUE(contains(result.result, "emergency mode"));

    // One attempt plus two whole-pipeline retries before falling back
    int primary_attempts = 0;
    for (const auto& request : provider_->requests()) {
        if (!is_emergency_prompt(request)) {
            primary_attempts++;
        }
    }
    EXPECT_EQ(primary_attempts, 3);
}

TEST_F(OrchestratorTest, ContentPolicyShrinksEmergencyInput) {
    build([](const ModelRequest& request) -> std::string {
        if (is_emergency_prompt(request)) {
            return "Rating: 55\nExplanation: Reduced check.";
        }
        throw std::runtime_error("Request violates content policy");
    });

    std::string text(600, 'x');
    auto result = orchestrator_->check(text);
    EXPECT_EQ(*result.rating, 55);
    EXPECT_TRUE(result.degraded);

    bool saw_emergency = false;
    for (const auto& request : provider_->requests()) {
        if (is_emergency_prompt(request)) {
            saw_emergency = true;
            EXPECT_TRUE(contains(request.prompt, std::string(500, 'x')));
            EXPECT_FALSE(contains(request.prompt, std::string(501, 'x')));
            EXPECT_EQ(request.max_tokens, 300);
        }
    }
    EXPECT_TRUE(saw_emergency);
}

TEST_F(OrchestratorTest, AuthFailureSurfacesWithoutRetryOrFallback) {
    build([](const ModelRequest&) -> std::string {
        throw UpstreamError::http(401, "Invalid API key");
    });

    CheckResult result;
    EXPECT_NO_THROW(result = orchestrator_->check("Any statement at all."));

    EXPECT_FALSE(result.rating.has_value());
    ASSERT_TRUE(result.error_category.has_value());
    EXPECT_EQ(*result.error_category, ErrorCategory::AuthError);
    EXPECT_EQ(result.result, error_classifier::recovery_for(ErrorCategory::AuthError).user_message);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(provider_->calls(), 1);
}

TEST_F(OrchestratorTest, EmergencyFailureResolvesToStructuredFailure) {
    build([](const ModelRequest&) -> std::string {
        throw std::runtime_error("something odd");
    });

    CheckResult result;
    EXPECT_NO_THROW(result = orchestrator_->check("Another statement."));
    EXPECT_FALSE(result.rating.has_value());
    EXPECT_EQ(result.error_category, ErrorCategory::Unknown);
    EXPECT_FALSE(result.result.empty());
}

TEST_F(OrchestratorTest, ExhaustedRateLimitCarriesRetryAfter) {
    options_.check_max_retries = 1;
    build([](const ModelRequest&) -> std::string {
        throw std::runtime_error("Rate limit reached for requests");
    });

    auto result = orchestrator_->check("Rate limited statement.");
    EXPECT_FALSE(result.rating.has_value());
    EXPECT_EQ(result.error_category, ErrorCategory::RateLimit);
    ASSERT_TRUE(result.retry_after.has_value());
    EXPECT_EQ(*result.retry_after, 5000ms);
    EXPECT_EQ(provider_->calls(), 2);
}

TEST_F(OrchestratorTest, EmptyTextIsRejectedWithoutCalls) {
    build();
    auto result = orchestrator_->check("   \n\t ");
    EXPECT_FALSE(result.rating.has_value());
    EXPECT_FALSE(result.result.empty());
    EXPECT_EQ(provider_->calls(), 0);
}

TEST_F(OrchestratorTest, OverlongInputIsTruncated) {
    options_.max_chars = 50;
    build();

    orchestrator_->check(std::string(80, 'a'));
    auto requests = provider_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(contains(requests[0].prompt, std::string(50, 'a')));
    EXPECT_FALSE(contains(requests[0].prompt, std::string(51, 'a')));
}

TEST_F(OrchestratorTest, LongCyrillicInputStillProducesRatedResult) {
    // Serialize like the real providers do, so a split character would fail the call
    build([](const ModelRequest& request) {
        nlohmann::json{{"prompt", request.prompt}}.dump();
        return std::string("Rating: 70\nExplanation: Mostly accurate.");
    });

    auto text = cyrillic_text(7000);
    ASSERT_EQ(text.size(), 14001u);

    auto result = orchestrator_->check(text);

    ASSERT_TRUE(result.rating.has_value());
    EXPECT_EQ(*result.rating, 70);
    EXPECT_FALSE(result.degraded);
    EXPECT_FALSE(result.error_category.has_value());
    EXPECT_TRUE(is_valid_utf8(result.query_text));
    EXPECT_NO_THROW(check_result_json(result).dump());
    for (const auto& request : provider_->requests()) {
        EXPECT_TRUE(is_valid_utf8(request.prompt));
    }
}

TEST_F(OrchestratorTest, SearchEvidenceReachesPromptAndReferences) {
    auto search = std::make_shared<FakeSearchProvider>([](const std::string&) {
        return std::vector<SearchResult>{
            make_result("Tower facts", "https://www.reuters.com/world/tower", "www.reuters.com", "2024-03-01")
        };
    });
    build(nullptr, search);

    auto result = orchestrator_->check("The Eiffel Tower was completed in 1889 for the World Fair.");

    auto requests = provider_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(contains(requests[0].prompt, "REFERENCE INFORMATION"));
    EXPECT_TRUE(contains(requests[0].prompt, "Tower facts"));
    EXPECT_TRUE(contains(result.result, "https://www.reuters.com/world/tower"));
}

TEST_F(OrchestratorTest, FailingSearchDoesNotFailCheck) {
    auto search = std::make_shared<FakeSearchProvider>([](const std::string&) -> std::vector<SearchResult> {
        throw UpstreamError(UpstreamError::Kind::Network, "dns failure");
    });
    build(nullptr, search);

    auto result = orchestrator_->check("The Eiffel Tower was completed in 1889 for the World Fair.");
    ASSERT_TRUE(result.rating.has_value());
    EXPECT_TRUE(contains(result.result, "No references available."));
}

TEST_F(OrchestratorTest, ProgressListenerSeesStagesInOrder) {
    build();
    std::mutex mutex;
    std::vector<CheckStage> stages;
    orchestrator_->set_progress_listener([&](CheckStage stage, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        stages.push_back(stage);
    });

    orchestrator_->check("Short statement for progress.");

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(stages, (std::vector<CheckStage>{CheckStage::Start, CheckStage::Analysis, CheckStage::Verification}));
}

TEST_F(OrchestratorTest, CancelAllResolvesInFlightCheck) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    build([gate](const ModelRequest&) {
        gate.wait();
        return std::string("Rating: 50\nExplanation: late.");
    });

    auto future = orchestrator_->check_async("A slow statement.");
    for (int i = 0; i < 200 && provider_->calls() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(provider_->calls(), 1);

    orchestrator_->cancel_all();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto result = future.get();
    EXPECT_FALSE(result.rating.has_value());
    EXPECT_TRUE(contains(result.result, "cancelled"));

    release.set_value();
}

TEST_F(OrchestratorTest, AutoSelectionPicksFastForCostSensitiveShortText) {
    options_.auto_select_model = true;
    options_.cost_sensitive = true;
    build();

    auto result = orchestrator_->check("Paris is the capital of France.");
    EXPECT_EQ(result.model, "fake-fast");
}
