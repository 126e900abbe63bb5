#pragma once

#include "access/user_directory.hpp"
#include "core/error.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace reviewgate {

/**
 * @brief One cleaned review attributed to one category
 *
 * A review listed under several categories appears once per category,
 * all copies sharing the same review_index.
 */
struct ReviewRow {
    uint64_t review_index = 0;   // Position of the source review in the corpus
    std::string product_id;
    std::string product_name;
    std::string category;
    int rating = 0;              // 1..5
    std::string title;
    std::string text;
    std::string date;
};

/**
 * @brief Access-scoped read request
 *
 * The scope is mandatory: there is no way to build a query that is not
 * bounded by a visible-category set. `restrict_to` can only narrow it.
 */
class ReviewQuery {
public:
    explicit ReviewQuery(std::set<std::string> scope) : scope_(std::move(scope)) {}

    /// Narrow to the given categories (intersected with the scope).
    ReviewQuery& restrict_to(const std::vector<std::string>& categories);

    [[nodiscard]] const std::set<std::string>& scope() const { return scope_; }
    [[nodiscard]] bool admits(const std::string& category) const { return scope_.contains(category); }

private:
    std::set<std::string> scope_;
};

/**
 * @brief Read-only review data source
 */
class IReviewSource {
public:
    virtual ~IReviewSource() = default;

    /// Rows whose category is in the query scope, in corpus order per category.
    [[nodiscard]] virtual Result<std::vector<ReviewRow>> query(const ReviewQuery& q) const = 0;
};

/**
 * @brief Review corpus held in memory, indexed by category
 *
 * Immutable after construction, so concurrent reads need no locking.
 */
class InMemoryReviewSource : public IReviewSource, public ICategoryCatalog {
public:
    InMemoryReviewSource() = default;
    explicit InMemoryReviewSource(std::vector<ReviewRow> rows);

    [[nodiscard]] Result<std::vector<ReviewRow>> query(const ReviewQuery& q) const override;
    [[nodiscard]] std::set<std::string> list_categories() const override;

    [[nodiscard]] size_t row_count() const { return row_count_; }

private:
    std::map<std::string, std::vector<ReviewRow>> by_category_;
    size_t row_count_ = 0;
};

} // namespace reviewgate
