#pragma once

#include "core/types.hpp"
#include "data/review_source.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace reviewgate::metrics {

struct NpsThresholds {
    int promoter_min = 4;    // rating >= promoter_min counts as promoter
    int detractor_max = 2;   // rating <= detractor_max counts as detractor
};

/**
 * @brief Running rating aggregate (exact counts, unrounded sums)
 */
class RatingAccumulator {
public:
    void add(int rating);

    [[nodiscard]] uint64_t total() const { return total_; }
    [[nodiscard]] const std::array<uint64_t, 5>& counts() const { return counts_; }
    [[nodiscard]] double average() const;

    /// (%promoters - %detractors) * 100. 0 when empty.
    [[nodiscard]] double nps(const NpsThresholds& th) const;

private:
    std::array<uint64_t, 5> counts_{};
    uint64_t total_ = 0;
    double sum_ = 0.0;
};

/// Per-category metrics for every category present in `rows`, sorted by name.
[[nodiscard]] std::vector<CategoryMetrics> aggregate_by_category(
    const std::vector<ReviewRow>& rows, const NpsThresholds& th);

/// Order by metric (desc for TOP, asc for BOTTOM), ties by category ascending.
void rank(std::vector<CategoryMetrics>& rows, Metric metric, SortOrder order);

/// Most frequent lowercase terms (letters only, length >= 3, stopwords removed).
/// Ties broken alphabetically.
[[nodiscard]] std::vector<std::pair<std::string, uint64_t>> top_terms(
    const std::vector<const ReviewRow*>& rows, size_t limit);

} // namespace reviewgate::metrics
