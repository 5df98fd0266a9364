#pragma once
#include "provider.hpp"
#include <string>

class BraveSearchProvider : public SearchProvider {
public:
    BraveSearchProvider(std::string api_key, std::string api_url, int results_count = 2,
                        int timeout_ms = 30000);

    std::vector<SearchResult> search(const std::string& query) override;

    // Host part of an absolute URL, empty if there is none
    static std::string hostname_of(const std::string& url);

private:
    std::string api_key_;
    std::string api_url_;
    int results_count_;
    int timeout_ms_;
};
