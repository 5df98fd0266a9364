#include "aggregation.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <regex>

namespace aggregation {

std::optional<int> extract_rating(const std::string& response) {
    static const std::regex pattern(R"(rating:\s*(\d+))", std::regex::icase);

    std::smatch match;
    if (!std::regex_search(response, match, pattern)) {
        return std::nullopt;
    }

    const std::string digits = match[1].str();
    if (digits.size() > 3) {
        return std::nullopt;
    }
    int value = std::stoi(digits);
    if (value > 100) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> extract_explanation(const std::string& response) {
    auto lower = util::to_lower(response);
    auto start = lower.find("explanation:");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += std::string("explanation:").size();

    auto end = response.find("\n\n", start);
    auto explanation = util::trim(response.substr(start, end == std::string::npos ? std::string::npos : end - start));
    if (explanation.empty()) {
        return std::nullopt;
    }
    return explanation;
}

Confidence confidence_for(const std::vector<int>& ratings) {
    if (ratings.size() < 2) {
        return Confidence::Low;
    }

    auto [min_it, max_it] = std::minmax_element(ratings.begin(), ratings.end());
    int spread = *max_it - *min_it;
    if (spread <= kHighAgreementSpread) {
        return Confidence::High;
    }
    if (spread <= kModerateAgreementSpread) {
        return Confidence::Moderate;
    }
    return Confidence::Low;
}

Verdict aggregate(const std::vector<int>& ratings) {
    Verdict verdict;
    verdict.rating_count = ratings.size();
    verdict.confidence = confidence_for(ratings);

    if (!ratings.empty()) {
        double sum = std::accumulate(ratings.begin(), ratings.end(), 0.0);
        verdict.rating = static_cast<int>(std::lround(sum / static_cast<double>(ratings.size())));
    }
    return verdict;
}

} // namespace aggregation
