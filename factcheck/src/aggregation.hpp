#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aggregation {

// Default verdict when no response carried a rating
constexpr int kDefaultRating = 50;
constexpr int kHighAgreementSpread = 15;
constexpr int kModerateAgreementSpread = 30;

struct Verdict {
    int rating = kDefaultRating;
    Confidence confidence = Confidence::Low;
    size_t rating_count = 0;
};

// "Rating: <n>" anywhere in the response, case-insensitive, 0-100
std::optional<int> extract_rating(const std::string& response);

// Text following "Explanation:" up to a blank line or the end
std::optional<std::string> extract_explanation(const std::string& response);

Confidence confidence_for(const std::vector<int>& ratings);

Verdict aggregate(const std::vector<int>& ratings);

} // namespace aggregation
