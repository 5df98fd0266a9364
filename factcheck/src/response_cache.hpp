#pragma once
#include "byte_store.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

struct CacheEntry {
    std::string key;
    std::string query;
    std::string model;
    std::string response;
    int64_t timestamp_ms = 0;
    uint64_t sequence = 0; // insertion order, breaks timestamp ties on eviction
};

struct CacheStats {
    size_t size = 0;
    size_t hits = 0;
    size_t misses = 0;
    double hit_rate = 0.0;
};

struct ResponseCacheOptions {
    size_t max_size = 100;
    std::chrono::hours ttl{24};
    // Optional durable backing; writes are coalesced within persist_debounce
    std::shared_ptr<ByteStore> store;
    std::string store_namespace = "apiCache";
    std::chrono::milliseconds persist_debounce{5000};
};

// Content-addressed memo of (prompt, model) -> response, bounded by size
// with oldest-first eviction.
class ResponseCache {
public:
    explicit ResponseCache(ResponseCacheOptions options);
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Truncated SHA-256 over prompt, model and (when given) the token budget
    static std::string generate_key(const std::string& prompt, const std::string& model,
                                    std::optional<int> max_tokens = std::nullopt);

    std::optional<std::string> get(const std::string& key);

    // Key lookup plus an exact match on query and model, guarding against
    // collisions of the truncated hash
    std::optional<std::string> lookup(const std::string& query, const std::string& model,
                                      std::optional<int> max_tokens = std::nullopt);

    void set(const std::string& key, const std::string& query, const std::string& model,
             const std::string& response, std::optional<int64_t> timestamp_ms = std::nullopt);

    void store(const std::string& query, const std::string& model, std::optional<int> max_tokens,
               const std::string& response);

    bool contains(const std::string& key) const;
    size_t size() const;
    CacheStats stats() const;

    void clear();

    // Writes pending changes now instead of waiting for the debounce window
    void flush();

    static constexpr size_t kKeyLength = 50;

private:
    void load();
    void enforce_limit();
    bool is_expired(int64_t timestamp_ms, int64_t now_ms) const;
    void schedule_persist();
    void persist_loop();
    void persist_now();

    ResponseCacheOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
    uint64_t next_sequence_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;

    std::mutex persist_mutex_;
    std::condition_variable persist_cv_;
    bool dirty_ = false;
    bool stopping_ = false;
    std::chrono::steady_clock::time_point persist_deadline_;
    std::thread persist_thread_;
};
