#include <catch2/catch_test_macros.hpp>
#include "cache/access_cache.hpp"

#include <chrono>
#include <thread>

using namespace reviewgate;

static ToolResult make_distribution(const std::string& category, uint64_t five_star) {
    RatingDistributionResult r;
    r.category = category;
    r.counts = {0, 0, 0, 0, five_star};
    r.total = five_star;
    return r;
}

static AccessCache::Config enabled_config(size_t max_entries = 100, size_t shards = 4) {
    AccessCache::Config cfg;
    cfg.enabled = true;
    cfg.max_entries = max_entries;
    cfg.num_shards = shards;
    cfg.ttl = std::chrono::seconds(60);
    return cfg;
}

TEST_CASE("AccessCache: disabled cache never stores", "[cache]") {
    AccessCache::Config cfg;
    cfg.enabled = false;
    AccessCache cache(cfg);

    cache.put(1, 0, "fp", make_distribution("Tablets", 3));
    CHECK_FALSE(cache.get(1, 0, "fp").has_value());
    CHECK_FALSE(cache.is_enabled());
}

TEST_CASE("AccessCache: put then get returns the same result", "[cache]") {
    AccessCache cache(enabled_config());
    const auto original = make_distribution("Tablets", 3);
    cache.put(2, 7, "abc", original);

    auto cached = cache.get(2, 7, "abc");
    REQUIRE(cached.has_value());
    CHECK(*cached == original);
    CHECK(cache.get_stats().hits == 1);
}

TEST_CASE("AccessCache: a newer access version never sees older entries", "[cache]") {
    AccessCache cache(enabled_config());
    cache.put(2, 7, "abc", make_distribution("Tablets", 3));

    CHECK_FALSE(cache.get(2, 8, "abc").has_value());
    CHECK(cache.get_stats().misses == 1);
}

TEST_CASE("AccessCache: entries are private to one user", "[cache]") {
    AccessCache cache(enabled_config());
    cache.put(2, 1, "abc", make_distribution("Tablets", 3));

    CHECK_FALSE(cache.get(3, 1, "abc").has_value());
    CHECK(cache.get(2, 1, "abc").has_value());
}

TEST_CASE("AccessCache: put overwrites the same key", "[cache]") {
    AccessCache cache(enabled_config());
    cache.put(2, 1, "abc", make_distribution("Tablets", 3));
    cache.put(2, 1, "abc", make_distribution("Tablets", 4));

    auto cached = cache.get(2, 1, "abc");
    REQUIRE(cached.has_value());
    CHECK(std::get<RatingDistributionResult>(*cached).total == 4);
    CHECK(cache.get_stats().current_entries == 1);
}

TEST_CASE("AccessCache: LRU eviction at capacity", "[cache]") {
    AccessCache cache(enabled_config(2, 1));
    cache.put(1, 0, "a", make_distribution("A", 1));
    cache.put(1, 0, "b", make_distribution("B", 1));
    (void)cache.get(1, 0, "a");                         // "a" becomes most recent
    cache.put(1, 0, "c", make_distribution("C", 1));    // evicts "b"

    CHECK(cache.get(1, 0, "a").has_value());
    CHECK_FALSE(cache.get(1, 0, "b").has_value());
    CHECK(cache.get(1, 0, "c").has_value());
    CHECK(cache.get_stats().evictions == 1);
}

TEST_CASE("AccessCache: TTL expiry", "[cache]") {
    auto cfg = enabled_config(100, 1);
    cfg.ttl = std::chrono::seconds(1);
    AccessCache cache(cfg);

    cache.put(1, 0, "fp", make_distribution("A", 1));
    REQUIRE(cache.get(1, 0, "fp").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    CHECK_FALSE(cache.get(1, 0, "fp").has_value());
}
