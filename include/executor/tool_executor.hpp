#pragma once

#include "access/access_model.hpp"
#include "cache/access_cache.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "data/review_source.hpp"
#include "executor/review_metrics.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace reviewgate {

/**
 * @brief Runs a validated ToolCall against the review data source
 *
 * Every read is a ReviewQuery scoped to the caller's visible categories,
 * taken from one AccessSnapshot together with the access_version used in
 * the cache key. A referenced category outside that scope yields
 * AccessDenied; an in-scope category without rows yields NoData.
 * Data-source failures come back as DATA_SOURCE_ERROR and are never cached.
 */
class ToolExecutor {
public:
    struct Config {
        metrics::NpsThresholds nps;
        size_t top_terms = 10;
    };

    ToolExecutor(std::shared_ptr<AccessModel> access,
                 std::shared_ptr<IReviewSource> source,
                 std::shared_ptr<AccessCache> cache,
                 const Config& config);

    [[nodiscard]] Result<ToolResult> execute(const ToolCall& call, UserId user_id);

    /// SHA-256 over the canonical tool+arguments form (fallback metadata excluded).
    [[nodiscard]] static std::string fingerprint(const ToolCall& call);

    struct Stats {
        uint64_t executions;
        uint64_t cache_hits;
        uint64_t access_denied;
        uint64_t data_source_errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] Result<ToolResult> run(const ToolArgs& args, const AccessSnapshot& scope) const;

    [[nodiscard]] Result<ToolResult> top_categories(const TopCategoriesArgs& a, const AccessSnapshot& s) const;
    [[nodiscard]] Result<ToolResult> rating_distribution(const RatingDistributionArgs& a, const AccessSnapshot& s) const;
    [[nodiscard]] Result<ToolResult> sentiment_summary(const SentimentSummaryArgs& a, const AccessSnapshot& s) const;
    [[nodiscard]] Result<ToolResult> compare_categories(const CompareCategoriesArgs& a, const AccessSnapshot& s) const;
    [[nodiscard]] Result<ToolResult> general_query(const GeneralQueryArgs& a, const AccessSnapshot& s) const;

    [[nodiscard]] Result<std::vector<ReviewRow>> fetch(const AccessSnapshot& s,
                                                       const std::vector<std::string>& categories) const;

    std::shared_ptr<AccessModel> access_;
    std::shared_ptr<IReviewSource> source_;
    std::shared_ptr<AccessCache> cache_;
    Config config_;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> access_denied_{0};
    std::atomic<uint64_t> data_source_errors_{0};
};

} // namespace reviewgate
