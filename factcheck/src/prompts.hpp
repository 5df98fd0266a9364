#pragma once
#include <string>

namespace prompts {

// Full evaluation framework used by single-model checks
std::string fact_check(const std::string& text, const std::string& search_context, const std::string& today);

// Primary prompt of a multi-model check; judged against the search
// context when there is one, otherwise against model knowledge
std::string evidence_analysis(const std::string& text, const std::string& search_context);

// Secondary prompt; `variant` > 0 asks for an independent repeat
std::string logical_consistency(const std::string& text, int variant);

std::string emergency(const std::string& text);

} // namespace prompts
