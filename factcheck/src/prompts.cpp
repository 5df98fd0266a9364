#include "prompts.hpp"

namespace prompts {

std::string fact_check(const std::string& text, const std::string& search_context, const std::string& today) {
    std::string prompt =
        "I need your help to fact-check the following statement. Please carefully analyze this for accuracy:\n\n"
        "STATEMENT TO VERIFY: \"" + text + "\"\n\n";

    if (!search_context.empty()) {
        prompt += "REFERENCE INFORMATION:\n" + search_context + "\n\n";
    }

    prompt +=
        "TODAY'S DATE: " + today + "\n\n"
        "Please follow this specific evaluation framework:\n\n"
        "1. KEY CLAIMS IDENTIFICATION:\n"
        "   - Identify the 2-3 main factual claims in the statement\n"
        "   - For each claim, note if it's verifiable with available information\n\n"
        "2. EVIDENCE EVALUATION:\n"
        "   - Rate the strength of supporting evidence from references (Strong/Moderate/Weak/None)\n"
        "   - Note contradictory evidence where applicable\n"
        "   - Consider source credibility and recency\n"
        "   - Identify information gaps\n\n"
        "3. CONTEXTUAL ANALYSIS:\n"
        "   - Note any missing context that affects interpretation\n"
        "   - Identify if the statement misleads through selective presentation\n\n"
        "4. VERDICT:\n"
        "   - Assign a numerical accuracy score (0-100):\n"
        "     * 90-100: Completely or almost completely accurate\n"
        "     * 70-89: Mostly accurate with minor issues\n"
        "     * 50-69: Mixed accuracy with significant issues\n"
        "     * 30-49: Mostly inaccurate with some truth\n"
        "     * 0-29: Completely or almost completely false\n"
        "   - Provide a concise explanation for your rating\n\n"
        "5. LIMITATIONS:\n"
        "   - Note any limitations in your assessment due to incomplete information\n\n"
        "FORMAT YOUR RESPONSE WITH THESE HEADERS:\n"
        "\"Rating: [numerical score]\"\n"
        "\"Explanation: [your concise explanation with specific references]\"\n";
    return prompt;
}

std::string evidence_analysis(const std::string& text, const std::string& search_context) {
    if (search_context.empty()) {
        return "Analyze the factual claims in: \"" + text + "\".\n"
               "Based on your knowledge, evaluate how accurate these claims are likely to be.\n"
               "Provide a numeric accuracy rating from 0-100 and brief explanation.\n"
               "Format: \"Rating: [score]\" then \"Explanation: [text]\"";
    }

    return "Based strictly on the provided search context, evaluate the factual claims in: \"" + text + "\".\n"
           "List each claim and assess whether the search results support, contradict, or are silent on each claim.\n"
           "Provide a numeric accuracy rating from 0-100 and brief explanation.\n"
           "Format: \"Rating: [score]\" then \"Explanation: [text]\"\n\n"
           "Search Context:\n" + search_context;
}

std::string logical_consistency(const std::string& text, int variant) {
    std::string prompt =
        "Analyze the internal logical consistency of the following statement: \"" + text + "\".\n"
        "Identify if there are any contradictions or logical fallacies.\n"
        "Provide a numeric consistency rating from 0-100 and brief explanation.\n"
        "Format: \"Rating: [score]\" then \"Explanation: [text]\"";
    if (variant > 0) {
        prompt += "\nThis is independent review #" + std::to_string(variant + 1) +
                  "; reason from scratch without assuming earlier conclusions.";
    }
    return prompt;
}

std::string emergency(const std::string& text) {
    return "Please fact-check the following statement and rate its accuracy from 0-100:\n"
           "\"" + text + "\"\n\n"
           "Format your response with:\n"
           "\"Rating: [numerical score]\"\n"
           "\"Explanation: [your brief explanation]\"";
}

} // namespace prompts
