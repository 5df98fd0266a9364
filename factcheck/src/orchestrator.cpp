#include "orchestrator.hpp"
#include "aggregation.hpp"
#include "model_policy.hpp"
#include "prompts.hpp"
#include "retry_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <map>
#include <stdexcept>

namespace {

std::string today_long_date() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%A, %B %d, %Y", &tm_buf);
    return buffer;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += separator;
        }
        out += part;
    }
    return out;
}

} // namespace

CheckResult failure_result(const std::string& text, const std::string& message,
                           std::optional<ErrorCategory> category) {
    CheckResult result;
    result.result = message;
    result.query_text = util::truncate_utf8(text, Orchestrator::kQueryPreviewLength);
    result.error_category = category;
    return result;
}

Orchestrator::Orchestrator(std::shared_ptr<ModelClient> models, std::shared_ptr<SearchClient> search,
                           OrchestratorOptions options)
    : models_(std::move(models)),
      search_(std::move(search)),
      options_(std::move(options)) {
    if (!models_) {
        throw std::invalid_argument("Orchestrator requires a model client");
    }
}

Orchestrator::~Orchestrator() {
    cancel_all();

    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        task.wait();
    }
}

std::string Orchestrator::fingerprint(const std::string& text) {
    return util::sha256_hex(text.substr(0, kFingerprintPrefix));
}

std::shared_future<CheckResult> Orchestrator::check_async(const std::string& text) {
    auto fp = fingerprint(text);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(fp);
    if (it != pending_.end()) {
        spdlog::info("Joining in-flight check {}", fp.substr(0, 12));
        return it->second;
    }

    reap_finished_tasks();

    auto promise = std::make_shared<std::promise<CheckResult>>();
    std::shared_future<CheckResult> shared = promise->get_future().share();
    pending_.emplace(fp, shared);

    CancellationToken token = token_;
    tasks_.push_back(std::async(std::launch::async, [this, text, fp, token, promise]() {
        CheckState state;
        state.fingerprint = fp;
        CheckResult result;
        try {
            result = run_check(text, state, token);
        } catch (const std::exception& e) {
            spdlog::critical("Check {} failed outside the recovery path: {}", fp.substr(0, 12), e.what());
            result = failure_result(text, "An unexpected error occurred while fact-checking.",
                                    ErrorCategory::Unknown);
        }
        {
            // Leave the registry before settling so a follow-up check starts fresh
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(fp);
        }
        promise->set_value(std::move(result));
    }));

    return shared;
}

CheckResult Orchestrator::check(const std::string& text) {
    return check_async(text).get();
}

void Orchestrator::set_progress_listener(ProgressListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void Orchestrator::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        spdlog::info("Cancelling {} in-flight check(s)", pending_.size());
    }
    token_.cancel();
    token_ = CancellationToken();
}

size_t Orchestrator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

CheckResult Orchestrator::run_check(const std::string& text, CheckState& state, const CancellationToken& token) {
    auto started = std::chrono::steady_clock::now();
    notify(CheckStage::Start, state.fingerprint);

    if (util::trim(text).empty()) {
        spdlog::warn("Rejected empty check request");
        return failure_result(text, "No text provided to fact-check.");
    }

    std::string input = text;
    if (input.size() > options_.max_chars) {
        spdlog::info("Truncating input from {} to {} characters", input.size(), options_.max_chars);
        input = util::truncate_utf8(input, options_.max_chars);
    }

    std::map<ErrorCategory, int> retries_by_category;

    RetryOptions retry;
    retry.max_retries = options_.check_max_retries;
    retry.initial_delay = options_.check_initial_delay;
    retry.max_delay = options_.check_max_delay;
    retry.should_retry = [&](const std::exception& error) {
        auto category = error_classifier::categorize(error);
        RecoveryContext context{models_->provider(), state.tier, "factCheck"};
        auto strategy = error_classifier::recovery_for(category, context);
        if (!strategy.retry || strategy.reduce_prompt_size) {
            return false;
        }
        int& spent = retries_by_category[category];
        if (spent >= strategy.max_retries) {
            return false;
        }
        ++spent;
        return true;
    };
    retry.on_retry = [&](const std::exception& error, const RetryInfo& info) {
        spdlog::warn("Check {} retry {}/{} in {}ms ({})", state.fingerprint.substr(0, 12),
                     info.retry_count, info.max_retries, info.delay.count(),
                     to_string(error_classifier::categorize(error)));
        notify(CheckStage::Retry, state.fingerprint);
    };

    CheckResult result;
    try {
        result = retry_with_backoff([&]() { return perform_check(input, state, token); }, retry, token);
    } catch (const CancelledError&) {
        spdlog::info("Check {} cancelled", state.fingerprint.substr(0, 12));
        result = failure_result(input, "The fact-check was cancelled before it completed.");
    } catch (const std::exception& e) {
        result = recover(input, e, state, token);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Check {} finished in {}ms (rating: {}, degraded: {})", state.fingerprint.substr(0, 12),
                 elapsed.count(), result.rating ? std::to_string(*result.rating) : "none", result.degraded);
    return result;
}

CheckResult Orchestrator::perform_check(const std::string& text, CheckState& state, const CancellationToken& token) {
    token.throw_if_cancelled();

    if (options_.auto_select_model) {
        ModelSelectionOptions selection;
        selection.provider = models_->provider();
        selection.text_length = text.size();
        selection.complexity = model_policy::estimate_complexity(text);
        selection.urgency = options_.urgency;
        selection.cost_sensitive = options_.cost_sensitive;
        selection.task = Task::FactCheck;
        state.tier = model_policy::select_optimal_model(selection);
        spdlog::info("Selected {} tier ({} complexity, {} chars)", to_string(state.tier),
                     to_string(selection.complexity), text.size());
    } else {
        state.tier = options_.default_tier;
    }

    state.query_text = models_->extract_search_query(text, token);

    std::future<Evidence> pending_search;
    if (search_) {
        notify(CheckStage::Search, state.fingerprint);
        pending_search = std::async(std::launch::async, [this, query = state.query_text, token]() {
            return search_->search(query, token);
        });
    }
    Evidence evidence = gather_evidence(pending_search);

    notify(CheckStage::Analysis, state.fingerprint);

    CheckResult result;
    result.query_text = state.query_text;
    result.model = models_->model_id(state.tier);

    std::string body;
    if (options_.use_multi_model) {
        body = multi_model_check(text, evidence.search_context, state.tier, token, result.confidence);
    } else {
        body = single_model_check(text, evidence.search_context, state.tier, token);
        body += "\n\nModel: " + result.model;
    }

    notify(CheckStage::Verification, state.fingerprint);

    result.rating = aggregation::extract_rating(body);
    if (!result.rating) {
        spdlog::debug("No rating found in check result");
    }
    result.result = body + "\n\n" + evidence.references;
    return result;
}

Evidence Orchestrator::gather_evidence(std::future<Evidence>& pending_search) {
    Evidence evidence;
    if (!pending_search.valid()) {
        evidence.references = "References:\nUnable to fetch references - no search provider is configured.";
        return evidence;
    }

    try {
        evidence = pending_search.get();
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Search failed: {}", e.what());
        evidence.references = std::string("References:\nError fetching references: ") + e.what();
    }
    return evidence;
}

std::string Orchestrator::single_model_check(const std::string& text, const std::string& search_context,
                                             ModelTier tier, const CancellationToken& token) {
    auto prompt = prompts::fact_check(text, search_context, today_long_date());
    return models_->call_with_cache(prompt, tier, options_.max_tokens, options_.enable_caching, token);
}

std::string Orchestrator::multi_model_check(const std::string& text, const std::string& search_context,
                                            ModelTier tier, const CancellationToken& token,
                                            std::optional<Confidence>& confidence) {
    auto secondary_tiers = model_policy::select_secondary_tiers(tier, options_.consistency_prompts);

    std::vector<Analysis> analyses;
    analyses.push_back({"Evidence Analysis", tier, prompts::evidence_analysis(text, search_context), "", false});
    for (size_t i = 0; i < secondary_tiers.size(); ++i) {
        std::string name = "Logical Consistency";
        if (i > 0) {
            name += " " + std::to_string(i + 1);
        }
        analyses.push_back({name, secondary_tiers[i],
                            prompts::logical_consistency(text, static_cast<int>(i)), "", false});
    }

    std::vector<std::future<std::string>> futures;
    futures.reserve(analyses.size());
    for (const auto& analysis : analyses) {
        futures.push_back(std::async(std::launch::async, [this, &analysis, token]() {
            return models_->call_with_cache(analysis.prompt, analysis.tier, options_.max_tokens,
                                            options_.enable_caching, token);
        }));
    }

    std::exception_ptr first_error;
    bool cancelled = false;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            analyses[i].response = futures[i].get();
        } catch (const CancelledError&) {
            cancelled = true;
            analyses[i].failed = true;
        } catch (const std::exception& e) {
            spdlog::error("{} prompt failed on {} tier: {}", analyses[i].name, to_string(analyses[i].tier), e.what());
            if (!first_error) {
                first_error = std::current_exception();
            }
            analyses[i].failed = true;
            analyses[i].response = "Error: Could not complete " + analyses[i].name + " analysis.";
        }
    }

    if (cancelled) {
        throw CancelledError();
    }

    bool all_failed = std::all_of(analyses.begin(), analyses.end(), [](const Analysis& a) { return a.failed; });
    if (all_failed && first_error) {
        std::rethrow_exception(first_error);
    }

    std::vector<int> ratings;
    for (const auto& analysis : analyses) {
        if (analysis.failed) {
            continue;
        }
        if (auto rating = aggregation::extract_rating(analysis.response)) {
            ratings.push_back(*rating);
        }
    }

    auto verdict = aggregation::aggregate(ratings);
    confidence = verdict.confidence;
    spdlog::info("Aggregated {} rating(s) into {} ({} confidence)", verdict.rating_count, verdict.rating,
                 to_string(verdict.confidence));

    std::string combined = "Rating: " + std::to_string(verdict.rating) + "\n\nExplanation: ";

    bool any_valid = false;
    for (const auto& analysis : analyses) {
        if (analysis.failed || analysis.response.size() <= 20) {
            continue;
        }
        any_valid = true;
        auto explanation = aggregation::extract_explanation(analysis.response);
        combined += "\n\n" + analysis.name + ": " + (explanation ? *explanation : util::trim(analysis.response));
    }
    if (!any_valid) {
        combined += "Could not perform a complete fact-check due to technical issues. "
                    "The rating provided is a default value and may not be accurate.";
    }

    if (ratings.size() > 1) {
        combined += std::string("\n\nConfidence Level: ") + to_string(verdict.confidence) +
                    " (based on agreement between different analysis methods)";
    } else {
        combined += "\n\nConfidence Level: Low (limited analysis methods available)";
    }

    std::vector<std::string> secondary_models;
    for (auto secondary : secondary_tiers) {
        secondary_models.push_back(models_->model_id(secondary));
    }
    combined += "\n\nPrimary Model: " + models_->model_id(tier);
    if (!secondary_models.empty()) {
        combined += "\nSecondary Model(s): " + join(secondary_models, ", ");
    }
    return combined;
}

CheckResult Orchestrator::recover(const std::string& text, const std::exception& error, CheckState& state,
                                  const CancellationToken& token) {
    RecoveryContext context{models_->provider(), state.tier, "factCheck"};
    error_classifier::log_error(error, context);

    auto category = error_classifier::categorize(error);
    auto strategy = error_classifier::recovery_for(category, context);

    if (strategy.fallback_model) {
        notify(CheckStage::Fallback, state.fingerprint);
        try {
            return emergency_check(text, *strategy.fallback_model, strategy.reduce_prompt_size, token);
        } catch (const CancelledError&) {
            return failure_result(text, "The fact-check was cancelled before it completed.");
        } catch (const std::exception& e) {
            spdlog::error("Emergency fallback failed: {}", e.what());
        }
    }

    auto result = failure_result(text, strategy.user_message, category);
    if (category == ErrorCategory::RateLimit) {
        result.retry_after = strategy.wait;
    }
    return result;
}

CheckResult Orchestrator::emergency_check(const std::string& text, ModelTier tier, bool shrink_input,
                                          const CancellationToken& token) {
    size_t limit = shrink_input ? kFingerprintPrefix / 2 : kFingerprintPrefix;
    auto prompt = prompts::emergency(util::truncate_utf8(text, limit));
    auto model = models_->model_id(tier);
    spdlog::warn("Running emergency check on {} tier ({})", to_string(tier), model);

    RetryOptions retry;
    retry.max_retries = 1;
    retry.initial_delay = std::chrono::milliseconds(1000);
    retry.should_retry = [](const std::exception& e) { return error_classifier::is_temporary_error(e); };

    auto response = retry_with_backoff([&]() {
        return models_->call_with_cache(prompt, tier, options_.emergency_max_tokens, true, token);
    }, retry, token);

    CheckResult result;
    result.rating = aggregation::extract_rating(response);
    result.confidence = Confidence::Low;
    result.model = model;
    result.degraded = true;
    result.query_text = util::truncate_utf8(text, kQueryPreviewLength);
    result.result = response +
        "\n\nReferences:\nNo references available (emergency mode)." +
        "\n\nNote: This is a simplified fact-check using the " + model + " model.";
    return result;
}

void Orchestrator::notify(CheckStage stage, const std::string& fingerprint) {
    ProgressListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (!listener) {
        return;
    }
    try {
        listener(stage, fingerprint);
    } catch (const std::exception& e) {
        spdlog::warn("Progress listener threw at stage {}: {}", to_string(stage), e.what());
    }
}

void Orchestrator::reap_finished_tasks() {
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(), [](std::future<void>& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), tasks_.end());
}
