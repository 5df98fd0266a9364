#include "search_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

const std::vector<std::string> kFactCheckDomains = {
    "factcheck.org", "politifact.com", "snopes.com", "fullfact.org",
    "reuters.com/fact-check", "apnews.com/hub/ap-fact-check",
    "factchecker.washingtonpost.com", "checkyourfact.com", "truthorfiction.com",
    "factcheck.afp.com", "leadstories.com", "mediabiasfactcheck.com",
    "poynter.org/ifcn", "bbc.com/news/reality_check", "channel4.com/news/factcheck",
    "vox.com/pages/facts-matter", "factcrescendo.com", "hoax-slayer.net",
    "verafiles.org", "africacheck.org"
};

const std::vector<std::string> kCredibleDomains = {
    "reuters.com", "apnews.com", "bbc.com", "npr.org", "washingtonpost.com",
    "nytimes.com", "wsj.com", "economist.com", "science.org", "nature.com",
    "scientificamerican.com", "theguardian.com", "bloomberg.com", "ft.com",
    "theatlantic.com", "newyorker.com", "time.com", "pbs.org", "cnn.com",
    "cbsnews.com", "abcnews.go.com", "nbcnews.com", "thehill.com", "politico.com",
    "pnas.org", "sciencedirect.com", "nih.gov", "cdc.gov", "who.int", "un.org",
    "worldbank.org", "imf.org"
};

// Entries with a path only match against the full URL
bool matches_source(const SearchResult& result, const std::vector<std::string>& sources) {
    for (const auto& source : sources) {
        if (source.find('/') != std::string::npos) {
            if (util::contains_ci(result.url, source)) {
                return true;
            }
        } else if (util::contains_ci(result.domain, source)) {
            return true;
        }
    }
    return false;
}

} // namespace

SearchClient::SearchClient(std::shared_ptr<SearchProvider> provider, RequestQueueOptions queue_options)
    : provider_(std::move(provider)),
      queue_(std::move(queue_options), [p = provider_](const std::string& query) {
          return p->search(query);
      }) {}

SearchClient::~SearchClient() {
    shutdown();
}

Evidence SearchClient::search(const std::string& query_text, const CancellationToken& token) {
    auto queries = build_queries(query_text);
    spdlog::debug("Searching {} claim(s)", queries.size());

    std::vector<std::future<std::vector<SearchResult>>> futures;
    futures.reserve(queries.size());
    for (const auto& query : queries) {
        futures.push_back(queue_.enqueue(query, token));
    }

    std::vector<SearchResult> all_results;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            auto results = await_result(futures[i], token);
            all_results.insert(all_results.end(), results.begin(), results.end());
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::warn("Search for '{}' failed: {}", queries[i], e.what());
        }
    }

    Evidence evidence;
    evidence.results = rank_results(std::move(all_results));
    evidence.search_context = render_context(evidence.results);
    evidence.references = render_references(evidence.results);

    spdlog::info("Search produced {} unique result(s)", evidence.results.size());
    return evidence;
}

size_t SearchClient::pending() const {
    return queue_.pending();
}

void SearchClient::shutdown() {
    queue_.shutdown();
}

std::vector<std::string> SearchClient::build_queries(const std::string& query_text) {
    std::vector<std::string> queries;
    for (const auto& piece : util::split_any(query_text, ";.")) {
        auto claim = util::trim(piece);
        if (claim.size() <= kMinClaimLength) {
            continue;
        }

        auto sanitized = sanitize_claim(claim);
        if (sanitized.empty()) {
            continue;
        }
        queries.push_back(sanitized.substr(0, kMaxClaimLength));
        if (queries.size() == kMaxClaims) {
            break;
        }
    }
    return queries;
}

std::string SearchClient::sanitize_claim(const std::string& claim) {
    std::string out = claim;
    for (auto& c : out) {
        auto uc = static_cast<unsigned char>(c);
        bool keep = std::isalnum(uc) || std::isspace(uc) || c == '_' || c == '.' ||
                    c == ',' || c == '\'' || c == '"';
        if (!keep) {
            c = ' ';
        }
    }
    return util::trim(out);
}

bool SearchClient::is_fact_check_source(const SearchResult& result) {
    return matches_source(result, kFactCheckDomains);
}

bool SearchClient::is_credible_source(const SearchResult& result) {
    return matches_source(result, kCredibleDomains);
}

std::vector<SearchResult> SearchClient::rank_results(std::vector<SearchResult> results) {
    struct Ranked {
        SearchResult result;
        bool fact_check;
        std::optional<std::chrono::system_clock::time_point> date;
    };

    std::vector<Ranked> ranked;
    std::unordered_set<std::string> seen_urls;
    for (auto& result : results) {
        if (!seen_urls.insert(result.url).second) {
            continue;
        }
        bool fact_check = is_fact_check_source(result);
        auto date = result.date.empty() ? std::nullopt : util::parse_iso8601(result.date);
        ranked.push_back({std::move(result), fact_check, date});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.fact_check != b.fact_check) {
            return a.fact_check;
        }
        if (a.date.has_value() != b.date.has_value()) {
            return a.date.has_value();
        }
        if (a.date && b.date) {
            return *a.date > *b.date;
        }
        return false;
    });

    std::vector<SearchResult> out;
    out.reserve(ranked.size());
    for (auto& entry : ranked) {
        out.push_back(std::move(entry.result));
    }
    return out;
}

std::string SearchClient::render_context(const std::vector<SearchResult>& results) {
    std::string context;
    for (const auto& result : results) {
        if (!context.empty()) {
            context += "\n\n";
        }
        context += "Source: " + result.title + " (" + result.domain + ")";
        if (!result.date.empty()) {
            context += " [" + result.date + "]";
        }
        context += "\nContent: " + result.description;
    }
    return context;
}

std::string SearchClient::render_references(const std::vector<SearchResult>& results) {
    std::string references = "References:";
    if (results.empty()) {
        return references + "\nNo references available.";
    }

    for (const auto& result : results) {
        references += "\n[" + result.type + "] ";
        if (is_fact_check_source(result)) {
            references += "Fact-Check: ";
        } else if (is_credible_source(result)) {
            references += "Credible: ";
        }
        references += result.title + " - " + result.url;
    }
    return references;
}
