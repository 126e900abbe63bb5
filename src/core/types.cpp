#include "core/types.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace reviewgate {

// ============================================================================
// Enum <-> wire name
// ============================================================================

const char* role_to_string(Role role) {
    switch (role) {
        case Role::ADMIN:   return "admin";
        case Role::ANALYST: return "analyst";
        default:            return "unknown";
    }
}

std::optional<Role> parse_role(std::string_view name) {
    const auto lower = utils::to_lower(utils::trim(name));
    if (lower == "admin") return Role::ADMIN;
    if (lower == "analyst") return Role::ANALYST;
    return std::nullopt;
}

const char* tool_name_to_string(ToolName tool) {
    switch (tool) {
        case ToolName::METRICS_TOP_CATEGORIES: return "metrics_top_categories";
        case ToolName::RATING_DISTRIBUTION:    return "rating_distribution";
        case ToolName::SENTIMENT_SUMMARY:      return "sentiment_summary";
        case ToolName::COMPARE_CATEGORIES:     return "compare_categories";
        case ToolName::GENERAL_QUERY:          return "general_query";
        default:                               return "unknown";
    }
}

ToolName parse_tool_name(std::string_view name) {
    static constexpr std::array<ToolName, 5> kKnown = {
        ToolName::METRICS_TOP_CATEGORIES, ToolName::RATING_DISTRIBUTION,
        ToolName::SENTIMENT_SUMMARY, ToolName::COMPARE_CATEGORIES,
        ToolName::GENERAL_QUERY,
    };
    for (const auto tool : kKnown) {
        if (name == tool_name_to_string(tool)) return tool;
    }
    return ToolName::UNKNOWN;
}

const char* metric_to_string(Metric metric) {
    switch (metric) {
        case Metric::REVIEW_COUNT: return "review_count";
        case Metric::AVG_RATING:   return "avg_rating";
        case Metric::NPS:          return "nps";
        default:                   return "unknown";
    }
}

std::optional<Metric> parse_metric(std::string_view name) {
    const auto lower = utils::to_lower(utils::trim(name));
    if (lower == "review_count") return Metric::REVIEW_COUNT;
    if (lower == "avg_rating") return Metric::AVG_RATING;
    if (lower == "nps") return Metric::NPS;
    return std::nullopt;
}

const char* sort_order_to_string(SortOrder order) {
    return order == SortOrder::TOP ? "top" : "bottom";
}

std::optional<SortOrder> parse_sort_order(std::string_view name) {
    const auto lower = utils::to_lower(utils::trim(name));
    if (lower == "top") return SortOrder::TOP;
    if (lower == "bottom") return SortOrder::BOTTOM;
    return std::nullopt;
}

const char* general_query_type_to_string(GeneralQueryType type) {
    switch (type) {
        case GeneralQueryType::SUMMARY_STATS:    return "summary_stats";
        case GeneralQueryType::COUNT_CATEGORIES: return "count_categories";
        case GeneralQueryType::LIST_CATEGORIES:  return "list_categories";
        case GeneralQueryType::CATEGORY_INFO:    return "category_info";
        default:                                 return "unknown";
    }
}

std::optional<GeneralQueryType> parse_general_query_type(std::string_view name) {
    const auto lower = utils::to_lower(utils::trim(name));
    if (lower == "summary_stats") return GeneralQueryType::SUMMARY_STATS;
    if (lower == "count_categories") return GeneralQueryType::COUNT_CATEGORIES;
    if (lower == "list_categories") return GeneralQueryType::LIST_CATEGORIES;
    if (lower == "category_info") return GeneralQueryType::CATEGORY_INFO;
    return std::nullopt;
}

const char* decision_status_to_string(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::PROPOSED:                return "proposed";
        case DecisionStatus::UNKNOWN_TOOL:            return "unknown_tool";
        case DecisionStatus::MALFORMED:               return "malformed";
        case DecisionStatus::INTERPRETER_UNAVAILABLE: return "interpreter_unavailable";
        default:                                      return "unknown";
    }
}

const char* rejection_reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::UNSUPPORTED_TOOL:        return "unsupported_tool";
        case RejectionReason::INTERPRETER_UNAVAILABLE: return "interpreter_unavailable";
        case RejectionReason::ACCESS_DENIED:           return "access_denied";
        case RejectionReason::INVALID_ARGUMENTS:       return "invalid_arguments";
        case RejectionReason::AMBIGUOUS_INTENT:        return "ambiguous_intent";
        default:                                       return "unknown";
    }
}

// ============================================================================
// Parameters
// ============================================================================

std::string param_value_to_string(const ParamValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return "[" + utils::join(v, ",") + "]";
        }
    }, value);
}

// ============================================================================
// Router Decision
// ============================================================================

RouterDecision RouterDecision::unavailable(uint32_t attempts, std::string error) {
    RouterDecision d;
    d.status = DecisionStatus::INTERPRETER_UNAVAILABLE;
    d.attempts = attempts;
    d.last_error = std::move(error);
    return d;
}

RouterDecision RouterDecision::malformed(uint32_t attempts, std::string detail) {
    RouterDecision d;
    d.status = DecisionStatus::MALFORMED;
    d.attempts = attempts;
    d.last_error = std::move(detail);
    return d;
}

// ============================================================================
// Tool Args
// ============================================================================

ToolName tool_of(const ToolArgs& args) {
    return std::visit([](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, TopCategoriesArgs>) {
            return ToolName::METRICS_TOP_CATEGORIES;
        } else if constexpr (std::is_same_v<T, RatingDistributionArgs>) {
            return ToolName::RATING_DISTRIBUTION;
        } else if constexpr (std::is_same_v<T, SentimentSummaryArgs>) {
            return ToolName::SENTIMENT_SUMMARY;
        } else if constexpr (std::is_same_v<T, CompareCategoriesArgs>) {
            return ToolName::COMPARE_CATEGORIES;
        } else {
            return ToolName::GENERAL_QUERY;
        }
    }, args);
}

std::vector<std::string> referenced_categories(const ToolArgs& args) {
    return std::visit([](const auto& a) -> std::vector<std::string> {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, TopCategoriesArgs>) {
            return a.categories;
        } else if constexpr (std::is_same_v<T, RatingDistributionArgs> ||
                             std::is_same_v<T, SentimentSummaryArgs>) {
            return {a.category};
        } else if constexpr (std::is_same_v<T, CompareCategoriesArgs>) {
            return {a.category_a, a.category_b};
        } else {
            if (a.category) return {*a.category};
            return {};
        }
    }, args);
}

// ============================================================================
// Tool Result
// ============================================================================

const char* result_kind(const ToolResult& result) {
    return std::visit([](const auto& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, TopCategoriesResult>) return "top_categories";
        else if constexpr (std::is_same_v<T, RatingDistributionResult>) return "rating_distribution";
        else if constexpr (std::is_same_v<T, SentimentSummaryResult>) return "sentiment_summary";
        else if constexpr (std::is_same_v<T, ComparisonResult>) return "comparison";
        else if constexpr (std::is_same_v<T, GeneralQueryResult>) return "general_query";
        else if constexpr (std::is_same_v<T, NoData>) return "no_data";
        else return "access_denied";
    }, result);
}

} // namespace reviewgate
