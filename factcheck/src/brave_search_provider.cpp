#include "brave_search_provider.hpp"
#include "http_errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

void append_results(const nlohmann::json& section, const std::string& type,
                    std::vector<SearchResult>& out) {
    if (!section.is_object() || !section.contains("results") || !section["results"].is_array()) {
        return;
    }

    for (const auto& item : section["results"]) {
        if (!item.contains("url") || !item["url"].is_string()) {
            continue;
        }

        SearchResult result;
        result.url = item["url"].get<std::string>();
        result.title = item.value("title", "No title");
        result.description = item.value("description", "");
        if (result.description.empty()) {
            result.description = item.value("snippet", "");
        }
        result.domain = BraveSearchProvider::hostname_of(result.url);
        result.date = item.value("published_date", "");
        result.type = type;
        out.push_back(std::move(result));
    }
}

} // namespace

BraveSearchProvider::BraveSearchProvider(std::string api_key, std::string api_url,
                                         int results_count, int timeout_ms)
    : api_key_(std::move(api_key)),
      api_url_(std::move(api_url)),
      results_count_(results_count),
      timeout_ms_(timeout_ms) {}

std::vector<SearchResult> BraveSearchProvider::search(const std::string& query) {
    spdlog::debug("Brave search: {}", query);

    auto response = cpr::Get(
        cpr::Url{api_url_},
        cpr::Parameters{{"q", query}, {"count", std::to_string(results_count_)}},
        cpr::Header{{"Accept", "application/json"}, {"X-Subscription-Token", api_key_}},
        cpr::Timeout{timeout_ms_}
    );

    raise_for_response(response, "Brave search");

    auto json_res = nlohmann::json::parse(response.text, nullptr, false);
    if (json_res.is_discarded() || !json_res.is_object()) {
        throw UpstreamError(UpstreamError::Kind::InvalidResponse, "Brave search returned malformed JSON");
    }

    std::vector<SearchResult> results;
    try {
        if (json_res.contains("web")) {
            append_results(json_res["web"], "web", results);
        }
        if (json_res.contains("news")) {
            append_results(json_res["news"], "news", results);
        }
    } catch (const nlohmann::json::exception& e) {
        throw UpstreamError(UpstreamError::Kind::InvalidResponse,
                            std::string("Unexpected Brave search response: ") + e.what());
    }

    spdlog::debug("Brave search returned {} result(s)", results.size());
    return results;
}

std::string BraveSearchProvider::hostname_of(const std::string& url) {
    auto start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;

    auto end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    auto colon = authority.find(':');
    if (colon != std::string::npos) {
        authority = authority.substr(0, colon);
    }
    return authority;
}
