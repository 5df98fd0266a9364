#pragma once
#include "provider.hpp"
#include "request_queue.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// In-process model upstream; records every request it receives
class FakeModelProvider : public ModelProvider {
public:
    using Responder = std::function<std::string(const ModelRequest&)>;

    explicit FakeModelProvider(Responder responder = nullptr)
        : responder_(std::move(responder)) {}

    std::string call(const ModelRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        calls_++;
        if (responder_) {
            return responder_(request);
        }
        return "Rating: 75\nExplanation: The statement is broadly accurate.";
    }

    std::string map_model(ModelTier tier) const override {
        return std::string("fake-") + to_string(tier);
    }

    Provider provider() const override { return Provider::OpenAI; }

    int calls() const { return calls_.load(); }

    std::vector<ModelRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Responder responder_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<ModelRequest> requests_;
};

class FakeSearchProvider : public SearchProvider {
public:
    using Responder = std::function<std::vector<SearchResult>(const std::string&)>;

    explicit FakeSearchProvider(Responder responder)
        : responder_(std::move(responder)) {}

    std::vector<SearchResult> search(const std::string& query) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queries_.push_back(query);
        }
        return responder_(query);
    }

    std::vector<std::string> queries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::vector<std::string> queries_;
};

// Unlimited queue with millisecond backoff so failure paths run fast
inline RequestQueueOptions fast_queue(const std::string& name) {
    RequestQueueOptions options;
    options.name = name;
    options.rate_limit_per_minute = 0;
    options.backoff = BackoffPolicy(std::chrono::milliseconds(1), 2.0, std::chrono::milliseconds(5));
    options.rate_limit_poll = std::chrono::milliseconds(5);
    return options;
}

inline SearchResult make_result(const std::string& title, const std::string& url,
                                const std::string& domain, const std::string& date = "") {
    SearchResult result;
    result.title = title;
    result.description = title + " description";
    result.url = url;
    result.domain = domain;
    result.date = date;
    return result;
}

// nlohmann's strict dump rejects malformed UTF-8
inline bool is_valid_utf8(const std::string& text) {
    try {
        nlohmann::json(text).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

// "a" followed by two-byte Cyrillic letters, so even byte offsets fall mid-character
inline std::string cyrillic_text(size_t letters) {
    std::string text = "a";
    for (size_t i = 0; i < letters; ++i) {
        text += "\xD0\xAF";
    }
    return text;
}
