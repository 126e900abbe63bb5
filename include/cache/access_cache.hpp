#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reviewgate {

/**
 * @brief Generational tool-result cache
 *
 * Keyed by (user_id, access_version, fingerprint). A grant change bumps
 * access_version, so entries written under an older version are simply
 * never looked up again; they age out through LRU eviction or TTL. There
 * is no explicit invalidation path.
 */
class AccessCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 5000;
        size_t num_shards = 16;
        std::chrono::seconds ttl{300};   // 0 = no expiry
    };

    explicit AccessCache(const Config& config);

    /// Lookup cached result. Returns nullopt on miss or expiry.
    [[nodiscard]] std::optional<ToolResult> get(
        UserId user_id, uint64_t access_version, const std::string& fingerprint);

    /// Upsert by key.
    void put(UserId user_id, uint64_t access_version, const std::string& fingerprint,
             const ToolResult& result);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        ToolResult result;
        std::chrono::steady_clock::time_point expires_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<ToolResult> get(const std::string& key);
        void put(const std::string& key, ToolResult result,
                 std::chrono::steady_clock::time_point expires_at);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
    };

    static std::string make_key(UserId user_id, uint64_t access_version,
                                const std::string& fingerprint);
    size_t select_shard(const std::string& key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace reviewgate
