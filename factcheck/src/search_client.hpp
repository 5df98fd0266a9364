#pragma once
#include "cancellation.hpp"
#include "provider.hpp"
#include "request_queue.hpp"
#include <memory>
#include <string>
#include <vector>

// Evidence gathering over a SearchProvider with its own rate limited queue
class SearchClient {
public:
    SearchClient(std::shared_ptr<SearchProvider> provider, RequestQueueOptions queue_options);
    ~SearchClient();

    // Never fails on upstream errors: failed searches contribute no results
    Evidence search(const std::string& query_text, const CancellationToken& token = CancellationToken());

    size_t pending() const;
    void shutdown();

    static constexpr size_t kMaxClaims = 2;
    static constexpr size_t kMaxClaimLength = 80;
    static constexpr size_t kMinClaimLength = 10;

    // Splits on ';' and '.', keeps substantial claims, sanitized and clipped
    static std::vector<std::string> build_queries(const std::string& query_text);
    static std::string sanitize_claim(const std::string& claim);

    static bool is_fact_check_source(const SearchResult& result);
    static bool is_credible_source(const SearchResult& result);

    // Drops repeated URLs (first occurrence wins), then orders fact-checking
    // sources first and newer dated results ahead of older or undated ones
    static std::vector<SearchResult> rank_results(std::vector<SearchResult> results);

    static std::string render_context(const std::vector<SearchResult>& results);
    static std::string render_references(const std::vector<SearchResult>& results);

private:
    std::shared_ptr<SearchProvider> provider_;
    RequestQueue<std::string, std::vector<SearchResult>> queue_;
};
