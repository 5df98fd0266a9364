#pragma once
#include "cancellation.hpp"
#include "error_classifier.hpp"
#include "model_client.hpp"
#include "search_client.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct OrchestratorOptions {
    bool use_multi_model = true;
    int consistency_prompts = 1;
    bool auto_select_model = true;
    ModelTier default_tier = ModelTier::Standard;
    bool cost_sensitive = true;
    Urgency urgency = Urgency::Medium;
    bool enable_caching = true;
    int max_tokens = 500;
    int emergency_max_tokens = 300;
    size_t max_chars = 12000;

    // Whole-pipeline retry for rate limit, temporary and unknown failures
    int check_max_retries = 2;
    std::chrono::milliseconds check_initial_delay{2000};
    std::chrono::milliseconds check_max_delay{30000};
};

using ProgressListener = std::function<void(CheckStage stage, const std::string& fingerprint)>;

// Top-level fact check. Concurrent checks of the same text share one
// execution, and every check resolves to a CheckResult: failures become
// an emergency verdict or a structured failure, never an exception.
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<ModelClient> models, std::shared_ptr<SearchClient> search,
                 OrchestratorOptions options);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    std::shared_future<CheckResult> check_async(const std::string& text);
    CheckResult check(const std::string& text);

    void set_progress_listener(ProgressListener listener);

    // Cancels every in-flight check; later checks run normally
    void cancel_all();

    size_t pending_count() const;

    // Hash over the first kFingerprintPrefix characters of the text
    static std::string fingerprint(const std::string& text);

    static constexpr size_t kFingerprintPrefix = 1000;
    static constexpr size_t kQueryPreviewLength = 100;

private:
    struct CheckState {
        std::string fingerprint;
        ModelTier tier = ModelTier::Standard;
        std::string query_text;
    };

    struct Analysis {
        std::string name;
        ModelTier tier;
        std::string prompt;
        std::string response;
        bool failed = false;
    };

    CheckResult run_check(const std::string& text, CheckState& state, const CancellationToken& token);
    CheckResult perform_check(const std::string& text, CheckState& state, const CancellationToken& token);
    std::string single_model_check(const std::string& text, const std::string& search_context,
                                   ModelTier tier, const CancellationToken& token);
    std::string multi_model_check(const std::string& text, const std::string& search_context,
                                  ModelTier tier, const CancellationToken& token,
                                  std::optional<Confidence>& confidence);
    CheckResult recover(const std::string& text, const std::exception& error, CheckState& state,
                        const CancellationToken& token);
    CheckResult emergency_check(const std::string& text, ModelTier tier, bool shrink_input,
                                const CancellationToken& token);

    Evidence gather_evidence(std::future<Evidence>& pending_search);
    void notify(CheckStage stage, const std::string& fingerprint);
    void reap_finished_tasks();

    std::shared_ptr<ModelClient> models_;
    std::shared_ptr<SearchClient> search_;
    OrchestratorOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<CheckResult>> pending_;
    std::vector<std::future<void>> tasks_;
    CancellationToken token_;
    ProgressListener listener_;
};

// Failure result carrying a user facing message and no rating
CheckResult failure_result(const std::string& text, const std::string& message,
                           std::optional<ErrorCategory> category = std::nullopt);
