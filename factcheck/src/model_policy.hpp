#pragma once
#include "types.hpp"
#include <string>
#include <vector>

struct ModelSelectionOptions {
    Provider provider = Provider::OpenAI;
    size_t text_length = 0;
    Complexity complexity = Complexity::Medium;
    Urgency urgency = Urgency::Medium;
    bool cost_sensitive = true;
    Task task = Task::FactCheck;
};

// Pure, deterministic tier selection. No state, no randomness.
namespace model_policy {

// Texts longer than this (with high complexity) may justify the premium tier
constexpr size_t kPremiumLengthThreshold = 3000;
constexpr size_t kMediumLengthFloor = 1000;

// Weighted 0-9 score over sentence length, text length and technical term
// density; >= 6 is High, >= 3 is Medium.
Complexity estimate_complexity(const std::string& text);
int complexity_score(const std::string& text);

ModelTier select_optimal_model(const ModelSelectionOptions& options);

// The tier immediately below `primary`, never below Fast
ModelTier tier_below(ModelTier primary);

std::vector<ModelTier> select_secondary_tiers(ModelTier primary, int count = 1);

} // namespace model_policy
