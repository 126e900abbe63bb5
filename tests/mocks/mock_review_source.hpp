#pragma once

#include "data/review_source.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace reviewgate::testing {

/**
 * @brief In-memory source that counts reads and can be told to fail
 */
class MockReviewSource : public IReviewSource, public ICategoryCatalog {
public:
    explicit MockReviewSource(std::vector<ReviewRow> rows, bool should_succeed = true)
        : inner_(std::move(rows)), should_succeed_(should_succeed) {}

    [[nodiscard]] Result<std::vector<ReviewRow>> query(const ReviewQuery& q) const override {
        query_count_.fetch_add(1, std::memory_order_relaxed);
        if (!should_succeed_.load(std::memory_order_relaxed)) {
            return Result<std::vector<ReviewRow>>::error(ErrorCategory::DATA_SOURCE_ERROR,
                                                         "Mock failure: source offline");
        }
        return inner_.query(q);
    }

    [[nodiscard]] std::set<std::string> list_categories() const override {
        return inner_.list_categories();
    }

    [[nodiscard]] uint64_t query_count() const {
        return query_count_.load(std::memory_order_relaxed);
    }

    void set_should_succeed(bool v) { should_succeed_.store(v, std::memory_order_relaxed); }

private:
    InMemoryReviewSource inner_;
    std::atomic<bool> should_succeed_;
    mutable std::atomic<uint64_t> query_count_{0};
};

} // namespace reviewgate::testing
