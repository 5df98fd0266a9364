#include "model_policy.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace model_policy {

namespace {

const std::vector<std::string> kTechnicalTerms = {
    "quantum", "algorithm", "methodology", "statistical", "molecular",
    "hypothesis", "correlation", "causation", "analysis", "synthesis",
    "theoretical", "empirical", "paradigm", "mechanism", "infrastructure"
};

double average_words_per_sentence(const std::string& text) {
    size_t sentence_count = 0;
    size_t word_count = 0;

    for (const auto& sentence : util::split_any(text, ".!?")) {
        if (util::trim(sentence).empty()) {
            continue;
        }
        sentence_count++;

        std::istringstream words(sentence);
        std::string word;
        while (words >> word) {
            word_count++;
        }
    }

    return static_cast<double>(word_count) / std::max<size_t>(sentence_count, 1);
}

size_t count_technical_terms(const std::string& text) {
    static const std::regex pattern = []() {
        std::string alternatives;
        for (const auto& term : kTechnicalTerms) {
            if (!alternatives.empty()) alternatives += "|";
            alternatives += term;
        }
        return std::regex("\\b(?:" + alternatives + ")\\w*\\b", std::regex::icase);
    }();

    return static_cast<size_t>(std::distance(
        std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
}

} // namespace

int complexity_score(const std::string& text) {
    if (text.empty()) {
        return 0;
    }

    int score = 0;

    double avg_words = average_words_per_sentence(text);
    if (avg_words > 25) score += 3;
    else if (avg_words > 18) score += 2;
    else if (avg_words > 12) score += 1;

    size_t length = text.size();
    if (length > 5000) score += 3;
    else if (length > 2000) score += 2;
    else if (length > 800) score += 1;

    double density = static_cast<double>(count_technical_terms(text)) / (static_cast<double>(length) / 100.0);
    if (density > 0.5) score += 3;
    else if (density > 0.2) score += 2;
    else if (density > 0.1) score += 1;

    return score;
}

Complexity estimate_complexity(const std::string& text) {
    int score = complexity_score(text);
    if (score >= 6) return Complexity::High;
    if (score >= 3) return Complexity::Medium;
    return Complexity::Low;
}

ModelTier select_optimal_model(const ModelSelectionOptions& options) {
    // Extraction and query generation never need more than the cheapest model
    if (options.task == Task::ClaimExtraction) {
        return ModelTier::Extraction;
    }
    if (options.task == Task::SearchQuery) {
        return ModelTier::Fast;
    }

    if (options.urgency == Urgency::High) {
        return ModelTier::Fast;
    }

    if (options.complexity == Complexity::High &&
        options.text_length > kPremiumLengthThreshold &&
        options.urgency == Urgency::Low &&
        !options.cost_sensitive) {
        return ModelTier::Premium;
    }

    bool medium_length = options.text_length > kMediumLengthFloor &&
                         options.text_length <= kPremiumLengthThreshold;
    if ((options.complexity == Complexity::Medium || medium_length) && !options.cost_sensitive) {
        return ModelTier::Standard;
    }

    return ModelTier::Fast;
}

ModelTier tier_below(ModelTier primary) {
    switch (primary) {
        case ModelTier::Premium: return ModelTier::Standard;
        case ModelTier::Standard: return ModelTier::Fast;
        case ModelTier::Fast:
        case ModelTier::Extraction:
            return ModelTier::Fast;
    }
    return ModelTier::Fast;
}

std::vector<ModelTier> select_secondary_tiers(ModelTier primary, int count) {
    return std::vector<ModelTier>(static_cast<size_t>(std::max(count, 1)), tier_below(primary));
}

} // namespace model_policy
