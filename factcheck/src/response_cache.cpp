#include "response_cache.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

ResponseCache::ResponseCache(ResponseCacheOptions options)
    : options_(std::move(options)) {
    if (options_.max_size == 0) {
        options_.max_size = 1;
    }

    if (options_.store) {
        load();
        persist_thread_ = std::thread([this]() { persist_loop(); });
    }
}

ResponseCache::~ResponseCache() {
    if (!persist_thread_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(persist_mutex_);
        stopping_ = true;
    }
    persist_cv_.notify_all();
    persist_thread_.join();
}

std::string ResponseCache::generate_key(const std::string& prompt, const std::string& model,
                                        std::optional<int> max_tokens) {
    std::string material = prompt + model;
    if (max_tokens) {
        material += ":" + std::to_string(*max_tokens);
    }
    return util::sha256_hex(material).substr(0, kKeyLength);
}

std::optional<std::string> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (is_expired(it->second.timestamp_ms, util::now_epoch_ms())) {
        entries_.erase(it);
        misses_++;
        return std::nullopt;
    }

    hits_++;
    spdlog::debug("Cache hit for key: {}...", key.substr(0, 20));
    return it->second.response;
}

std::optional<std::string> ResponseCache::lookup(const std::string& query, const std::string& model,
                                                 std::optional<int> max_tokens) {
    auto key = generate_key(query, model, max_tokens);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.query != query || it->second.model != model) {
        misses_++;
        return std::nullopt;
    }

    if (is_expired(it->second.timestamp_ms, util::now_epoch_ms())) {
        entries_.erase(it);
        misses_++;
        return std::nullopt;
    }

    hits_++;
    spdlog::debug("Cache hit for {} prompt ({} chars)", model, query.size());
    return it->second.response;
}

void ResponseCache::set(const std::string& key, const std::string& query, const std::string& model,
                        const std::string& response, std::optional<int64_t> timestamp_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        CacheEntry entry;
        entry.key = key;
        entry.query = query;
        entry.model = model;
        entry.response = response;
        entry.timestamp_ms = timestamp_ms ? *timestamp_ms : util::now_epoch_ms();
        entry.sequence = ++next_sequence_;

        entries_[key] = std::move(entry);
        enforce_limit();
    }

    schedule_persist();
}

void ResponseCache::store(const std::string& query, const std::string& model, std::optional<int> max_tokens,
                          const std::string& response) {
    set(generate_key(query, model, max_tokens), query, model, response);
}

bool ResponseCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

CacheStats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats stats;
    stats.size = entries_.size();
    stats.hits = hits_;
    stats.misses = misses_;

    size_t total = hits_ + misses_;
    stats.hit_rate = total == 0 ? 0.0 : static_cast<double>(hits_) / total;
    return stats;
}

void ResponseCache::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(persist_mutex_);
        dirty_ = false;
    }

    if (options_.store) {
        options_.store->remove(options_.store_namespace);
    }
    spdlog::info("Response cache cleared");
}

void ResponseCache::flush() {
    if (!options_.store) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(persist_mutex_);
        if (!dirty_) {
            return;
        }
        dirty_ = false;
    }
    persist_now();
}

void ResponseCache::load() {
    auto payload = options_.store->get(options_.store_namespace);
    if (!payload) {
        return;
    }

    try {
        auto stored = nlohmann::json::parse(*payload);
        auto now_ms = util::now_epoch_ms();

        // Replay in timestamp order so insertion sequence follows age
        std::vector<CacheEntry> loaded;
        size_t expired = 0;
        for (auto it = stored.begin(); it != stored.end(); ++it) {
            const auto& record = it.value();
            int64_t timestamp_ms = record.value("timestamp", int64_t{0});
            if (is_expired(timestamp_ms, now_ms)) {
                expired++;
                continue;
            }

            const auto& value = record.at("value");
            CacheEntry entry;
            entry.key = it.key();
            entry.query = value.value("query", "");
            entry.model = value.value("model", "");
            entry.response = value.value("response", "");
            entry.timestamp_ms = timestamp_ms;
            loaded.push_back(std::move(entry));
        }

        std::sort(loaded.begin(), loaded.end(), [](const CacheEntry& a, const CacheEntry& b) {
            return a.timestamp_ms < b.timestamp_ms;
        });

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : loaded) {
            entry.sequence = ++next_sequence_;
            entries_[entry.key] = std::move(entry);
        }
        enforce_limit();

        spdlog::info("Loaded {} cache entries from storage ({} expired entries dropped)",
                     entries_.size(), expired);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Error parsing cache from storage: {}", e.what());
    }
}

// Caller holds mutex_
void ResponseCache::enforce_limit() {
    if (entries_.size() <= options_.max_size) {
        return;
    }

    std::vector<const CacheEntry*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ordered.push_back(&entry);
    }

    std::sort(ordered.begin(), ordered.end(), [](const CacheEntry* a, const CacheEntry* b) {
        if (a->timestamp_ms != b->timestamp_ms) {
            return a->timestamp_ms < b->timestamp_ms;
        }
        return a->sequence < b->sequence;
    });

    size_t to_remove = entries_.size() - options_.max_size;
    std::vector<std::string> victims;
    victims.reserve(to_remove);
    for (size_t i = 0; i < to_remove; ++i) {
        victims.push_back(ordered[i]->key);
    }
    for (const auto& key : victims) {
        entries_.erase(key);
    }

    spdlog::debug("Removed {} oldest cache entries", to_remove);
}

bool ResponseCache::is_expired(int64_t timestamp_ms, int64_t now_ms) const {
    auto ttl_ms = std::chrono::duration_cast<std::chrono::milliseconds>(options_.ttl).count();
    return now_ms - timestamp_ms > ttl_ms;
}

void ResponseCache::schedule_persist() {
    if (!options_.store) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(persist_mutex_);
        // The window opens on the first change; later changes ride along
        if (!dirty_) {
            dirty_ = true;
            persist_deadline_ = std::chrono::steady_clock::now() + options_.persist_debounce;
        }
    }
    persist_cv_.notify_all();
}

void ResponseCache::persist_loop() {
    std::unique_lock<std::mutex> lock(persist_mutex_);

    while (true) {
        persist_cv_.wait(lock, [this]() { return stopping_ || dirty_; });

        if (!stopping_) {
            persist_cv_.wait_until(lock, persist_deadline_, [this]() { return stopping_ || !dirty_; });
        }

        if (dirty_) {
            dirty_ = false;
            lock.unlock();
            persist_now();
            lock.lock();
        }

        if (stopping_) {
            break;
        }
    }
}

void ResponseCache::persist_now() {
    nlohmann::json payload = nlohmann::json::object();
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            payload[key] = {
                {"value", {
                    {"query", entry.query},
                    {"model", entry.model},
                    {"response", entry.response}
                }},
                {"timestamp", entry.timestamp_ms}
            };
        }
        count = entries_.size();
    }

    try {
        options_.store->set(options_.store_namespace,
                            payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        spdlog::debug("Persisted {} cache entries to storage", count);
    } catch (const std::exception& e) {
        spdlog::error("Error persisting cache to storage: {}", e.what());
    }
}
