#include "executor/review_metrics.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace reviewgate::metrics {

namespace {

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> kStopwords = {
        "the", "and", "for", "are", "but", "not", "you", "all", "any", "can",
        "had", "her", "was", "one", "our", "out", "has", "have", "him", "his",
        "how", "its", "may", "new", "now", "old", "see", "two", "who", "did",
        "get", "got", "let", "put", "say", "she", "too", "use", "this", "that",
        "with", "from", "they", "them", "then", "than", "there", "their", "what",
        "when", "which", "will", "would", "could", "should", "been", "were",
        "into", "just", "like", "also", "very", "much", "more", "some", "only",
        "about", "after", "before", "because", "while", "your", "yours", "it's",
        "i'm", "don't", "does", "doesn't", "didn't", "over", "even", "well",
        "really", "these", "those", "other", "being", "each", "here", "where",
        "own", "same", "such", "off", "again", "once", "bought",
    };
    return kStopwords;
}

} // anonymous namespace

// ============================================================================
// RatingAccumulator
// ============================================================================

void RatingAccumulator::add(int rating) {
    if (rating < 1 || rating > 5) return;
    ++counts_[static_cast<size_t>(rating - 1)];
    ++total_;
    sum_ += rating;
}

double RatingAccumulator::average() const {
    return total_ == 0 ? 0.0 : sum_ / static_cast<double>(total_);
}

double RatingAccumulator::nps(const NpsThresholds& th) const {
    if (total_ == 0) return 0.0;
    uint64_t promoters = 0;
    uint64_t detractors = 0;
    for (int r = 1; r <= 5; ++r) {
        const auto n = counts_[static_cast<size_t>(r - 1)];
        if (r >= th.promoter_min) promoters += n;
        if (r <= th.detractor_max) detractors += n;
    }
    const double total = static_cast<double>(total_);
    return (static_cast<double>(promoters) / total -
            static_cast<double>(detractors) / total) * 100.0;
}

// ============================================================================
// Aggregation
// ============================================================================

std::vector<CategoryMetrics> aggregate_by_category(
    const std::vector<ReviewRow>& rows, const NpsThresholds& th) {
    std::map<std::string, RatingAccumulator> acc;
    for (const auto& row : rows) {
        acc[row.category].add(row.rating);
    }

    std::vector<CategoryMetrics> out;
    out.reserve(acc.size());
    for (const auto& [category, a] : acc) {
        out.push_back(CategoryMetrics{
            .category = category,
            .review_count = a.total(),
            .avg_rating = a.average(),
            .nps = a.nps(th),
        });
    }
    return out;
}

void rank(std::vector<CategoryMetrics>& rows, Metric metric, SortOrder order) {
    const auto key = [metric](const CategoryMetrics& m) -> double {
        switch (metric) {
            case Metric::AVG_RATING: return m.avg_rating;
            case Metric::NPS:        return m.nps;
            default:                 return static_cast<double>(m.review_count);
        }
    };
    std::sort(rows.begin(), rows.end(),
        [&](const CategoryMetrics& a, const CategoryMetrics& b) {
            const double ka = key(a);
            const double kb = key(b);
            if (ka != kb) {
                return order == SortOrder::TOP ? ka > kb : ka < kb;
            }
            return a.category < b.category;
        });
}

// ============================================================================
// Terms
// ============================================================================

std::vector<std::pair<std::string, uint64_t>> top_terms(
    const std::vector<const ReviewRow*>& rows, size_t limit) {
    std::unordered_map<std::string, uint64_t> freq;
    const auto& stop = stopwords();

    const auto scan = [&](const std::string& text) {
        std::string word;
        const auto flush = [&] {
            if (word.size() >= 3 && !stop.contains(word)) ++freq[word];
            word.clear();
        };
        for (const char ch : text) {
            const auto uc = static_cast<unsigned char>(ch);
            if (std::isalpha(uc) || (ch == '\'' && !word.empty())) {
                word += static_cast<char>(std::tolower(uc));
            } else {
                flush();
            }
        }
        flush();
    };

    for (const auto* row : rows) {
        scan(row->title);
        scan(row->text);
    }

    std::vector<std::pair<std::string, uint64_t>> out(freq.begin(), freq.end());
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}

} // namespace reviewgate::metrics
