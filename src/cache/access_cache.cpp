#include "cache/access_cache.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace reviewgate {

// ============================================================================
// AccessCache
// ============================================================================

AccessCache::AccessCache(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

std::string AccessCache::make_key(UserId user_id, uint64_t access_version,
                                  const std::string& fingerprint) {
    return std::format("{}:{}:{}", user_id, access_version, fingerprint);
}

size_t AccessCache::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::optional<ToolResult> AccessCache::get(
    UserId user_id, uint64_t access_version, const std::string& fingerprint) {
    if (!config_.enabled) return std::nullopt;

    const auto key = make_key(user_id, access_version, fingerprint);
    auto& shard = *shards_[select_shard(key)];
    auto result = shard.get(key);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void AccessCache::put(UserId user_id, uint64_t access_version, const std::string& fingerprint,
                      const ToolResult& result) {
    if (!config_.enabled) return;

    const auto key = make_key(user_id, access_version, fingerprint);
    const auto expires = config_.ttl.count() > 0
        ? std::chrono::steady_clock::now() + config_.ttl
        : std::chrono::steady_clock::time_point::max();
    auto& shard = *shards_[select_shard(key)];
    shard.put(key, result, expires);
}

AccessCache::Stats AccessCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<ToolResult> AccessCache::Shard::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;

    if (std::chrono::steady_clock::now() >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.result;
}

void AccessCache::Shard::put(const std::string& key, ToolResult result,
                             std::chrono::steady_clock::time_point expires_at) {
    std::lock_guard lock(mutex_);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->result = std::move(result);
        it->second->expires_at = expires_at;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(result), expires_at});
    map_[key] = lru_list_.begin();
}

size_t AccessCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace reviewgate
