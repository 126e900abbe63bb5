#include "executor/tool_executor.hpp"
#include "core/digest.hpp"
#include "core/serialization.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <unordered_set>

namespace reviewgate {

ToolExecutor::ToolExecutor(std::shared_ptr<AccessModel> access,
                           std::shared_ptr<IReviewSource> source,
                           std::shared_ptr<AccessCache> cache,
                           const Config& config)
    : access_(std::move(access)),
      source_(std::move(source)),
      cache_(std::move(cache)),
      config_(config) {}

std::string ToolExecutor::fingerprint(const ToolCall& call) {
    return utils::sha256_hex(tool_args_to_json(call.args, /*canonical=*/true));
}

Result<ToolResult> ToolExecutor::execute(const ToolCall& call, UserId user_id) {
    executions_.fetch_add(1, std::memory_order_relaxed);

    // Scope and version from one read
    const auto snapshot = access_->snapshot(user_id);
    if (!snapshot) {
        access_denied_.fetch_add(1, std::memory_order_relaxed);
        return Result<ToolResult>::ok(AccessDenied{});
    }

    for (const auto& category : referenced_categories(call.args)) {
        if (!snapshot->visible.contains(category)) {
            access_denied_.fetch_add(1, std::memory_order_relaxed);
            return Result<ToolResult>::ok(AccessDenied{});
        }
    }

    const auto fp = fingerprint(call);
    if (cache_) {
        if (auto cached = cache_->get(user_id, snapshot->version, fp)) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format("executor: cache hit for user {} ({})",
                                          user_id, tool_name_to_string(call.tool())));
            return Result<ToolResult>::ok(std::move(*cached));
        }
    }

    auto result = run(call.args, *snapshot);
    if (result.is_error()) {
        data_source_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("executor: {} failed for user {}: {}",
            tool_name_to_string(call.tool()), user_id, result.error_message()));
        return result;
    }

    if (cache_) {
        cache_->put(user_id, snapshot->version, fp, result.value());
    }
    return result;
}

ToolExecutor::Stats ToolExecutor::get_stats() const {
    return {
        .executions = executions_.load(std::memory_order_relaxed),
        .cache_hits = cache_hits_.load(std::memory_order_relaxed),
        .access_denied = access_denied_.load(std::memory_order_relaxed),
        .data_source_errors = data_source_errors_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Dispatch
// ============================================================================

Result<ToolResult> ToolExecutor::run(const ToolArgs& args, const AccessSnapshot& scope) const {
    return std::visit([&](const auto& a) -> Result<ToolResult> {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, TopCategoriesArgs>) {
            return top_categories(a, scope);
        } else if constexpr (std::is_same_v<T, RatingDistributionArgs>) {
            return rating_distribution(a, scope);
        } else if constexpr (std::is_same_v<T, SentimentSummaryArgs>) {
            return sentiment_summary(a, scope);
        } else if constexpr (std::is_same_v<T, CompareCategoriesArgs>) {
            return compare_categories(a, scope);
        } else {
            return general_query(a, scope);
        }
    }, args);
}

Result<std::vector<ReviewRow>> ToolExecutor::fetch(
    const AccessSnapshot& s, const std::vector<std::string>& categories) const {
    ReviewQuery query(s.visible);
    if (!categories.empty()) {
        query.restrict_to(categories);
    }
    if (query.scope().empty()) {
        return Result<std::vector<ReviewRow>>::ok({});
    }
    return source_->query(query);
}

// ============================================================================
// Tools
// ============================================================================

Result<ToolResult> ToolExecutor::top_categories(const TopCategoriesArgs& a,
                                                const AccessSnapshot& s) const {
    auto rows = fetch(s, a.categories);
    if (rows.is_error()) return Result<ToolResult>::propagate(rows);

    auto ranked = metrics::aggregate_by_category(rows.value(), config_.nps);
    if (ranked.empty()) {
        return Result<ToolResult>::ok(NoData{a.categories});
    }

    metrics::rank(ranked, a.metric, a.order);
    if (a.top_n > 0 && ranked.size() > static_cast<size_t>(a.top_n)) {
        ranked.resize(static_cast<size_t>(a.top_n));
    }
    return Result<ToolResult>::ok(TopCategoriesResult{
        .metric = a.metric,
        .order = a.order,
        .rows = std::move(ranked),
    });
}

Result<ToolResult> ToolExecutor::rating_distribution(const RatingDistributionArgs& a,
                                                     const AccessSnapshot& s) const {
    auto rows = fetch(s, {a.category});
    if (rows.is_error()) return Result<ToolResult>::propagate(rows);
    if (rows.value().empty()) {
        return Result<ToolResult>::ok(NoData{{a.category}});
    }

    metrics::RatingAccumulator acc;
    for (const auto& row : rows.value()) {
        acc.add(row.rating);
    }
    return Result<ToolResult>::ok(RatingDistributionResult{
        .category = a.category,
        .counts = acc.counts(),
        .total = acc.total(),
    });
}

Result<ToolResult> ToolExecutor::sentiment_summary(const SentimentSummaryArgs& a,
                                                   const AccessSnapshot& s) const {
    auto rows = fetch(s, {a.category});
    if (rows.is_error()) return Result<ToolResult>::propagate(rows);
    if (rows.value().empty()) {
        return Result<ToolResult>::ok(NoData{{a.category}});
    }

    // Distinct non-empty review texts, corpus order
    std::unordered_set<std::string> seen;
    std::vector<const ReviewRow*> sample;
    const auto limit = static_cast<size_t>(std::max(a.max_reviews, 0));
    for (const auto& row : rows.value()) {
        if (sample.size() >= limit) break;
        auto key = utils::to_lower(utils::trim(row.text));
        if (key.empty()) continue;
        if (!seen.insert(std::move(key)).second) continue;
        sample.push_back(&row);
    }

    SentimentSummaryResult out;
    out.category = a.category;
    out.reviews_analyzed = sample.size();
    for (const auto* row : sample) {
        if (row->rating >= config_.nps.promoter_min) {
            ++out.positive;
        } else if (row->rating <= config_.nps.detractor_max) {
            ++out.negative;
        } else {
            ++out.neutral;
        }
    }
    out.top_terms = metrics::top_terms(sample, config_.top_terms);
    return Result<ToolResult>::ok(std::move(out));
}

Result<ToolResult> ToolExecutor::compare_categories(const CompareCategoriesArgs& a,
                                                    const AccessSnapshot& s) const {
    auto rows = fetch(s, {a.category_a, a.category_b});
    if (rows.is_error()) return Result<ToolResult>::propagate(rows);

    const auto per_category = metrics::aggregate_by_category(rows.value(), config_.nps);
    const auto find = [&](const std::string& name) -> const CategoryMetrics* {
        for (const auto& m : per_category) {
            if (m.category == name) return &m;
        }
        return nullptr;
    };

    const auto* ma = find(a.category_a);
    const auto* mb = find(a.category_b);
    if (!ma || !mb) {
        NoData missing;
        if (!ma) missing.categories.push_back(a.category_a);
        if (!mb) missing.categories.push_back(a.category_b);
        return Result<ToolResult>::ok(std::move(missing));
    }
    return Result<ToolResult>::ok(ComparisonResult{.a = *ma, .b = *mb});
}

Result<ToolResult> ToolExecutor::general_query(const GeneralQueryArgs& a,
                                               const AccessSnapshot& s) const {
    GeneralQueryResult out;
    out.query_type = a.query_type;
    out.category_count = s.visible.size();

    switch (a.query_type) {
        case GeneralQueryType::COUNT_CATEGORIES:
            return Result<ToolResult>::ok(std::move(out));

        case GeneralQueryType::LIST_CATEGORIES:
            out.categories.assign(s.visible.begin(), s.visible.end());
            return Result<ToolResult>::ok(std::move(out));

        case GeneralQueryType::CATEGORY_INFO: {
            if (!a.category) {
                return Result<ToolResult>::error(ErrorCategory::INVALID_REQUEST,
                    "category_info requires a category");
            }
            auto rows = fetch(s, {*a.category});
            if (rows.is_error()) return Result<ToolResult>::propagate(rows);
            auto m = metrics::aggregate_by_category(rows.value(), config_.nps);
            if (m.empty()) {
                return Result<ToolResult>::ok(NoData{{*a.category}});
            }
            out.review_count = m.front().review_count;
            out.avg_rating = m.front().avg_rating;
            out.nps = m.front().nps;
            out.category_info = std::move(m.front());
            return Result<ToolResult>::ok(std::move(out));
        }

        case GeneralQueryType::SUMMARY_STATS:
        default: {
            auto rows = fetch(s, {});
            if (rows.is_error()) return Result<ToolResult>::propagate(rows);
            if (rows.value().empty()) {
                return Result<ToolResult>::ok(NoData{});
            }
            metrics::RatingAccumulator acc;
            for (const auto& row : rows.value()) {
                acc.add(row.rating);
            }
            out.review_count = acc.total();
            out.avg_rating = acc.average();
            out.nps = acc.nps(config_.nps);
            return Result<ToolResult>::ok(std::move(out));
        }
    }
}

} // namespace reviewgate
