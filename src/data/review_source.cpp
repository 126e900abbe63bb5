#include "data/review_source.hpp"

namespace reviewgate {

ReviewQuery& ReviewQuery::restrict_to(const std::vector<std::string>& categories) {
    std::set<std::string> narrowed;
    for (const auto& c : categories) {
        if (scope_.contains(c)) narrowed.insert(c);
    }
    scope_ = std::move(narrowed);
    return *this;
}

InMemoryReviewSource::InMemoryReviewSource(std::vector<ReviewRow> rows)
    : row_count_(rows.size()) {
    for (auto& row : rows) {
        auto& bucket = by_category_[row.category];
        bucket.push_back(std::move(row));
    }
}

Result<std::vector<ReviewRow>> InMemoryReviewSource::query(const ReviewQuery& q) const {
    std::vector<ReviewRow> out;
    for (const auto& category : q.scope()) {
        const auto it = by_category_.find(category);
        if (it == by_category_.end()) continue;
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    return Result<std::vector<ReviewRow>>::ok(std::move(out));
}

std::set<std::string> InMemoryReviewSource::list_categories() const {
    std::set<std::string> out;
    for (const auto& [category, rows] : by_category_) {
        out.insert(category);
    }
    return out;
}

} // namespace reviewgate
