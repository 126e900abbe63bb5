#include "core/serialization.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

namespace reviewgate {

namespace {

std::string category_metrics_to_json(const CategoryMetrics& m) {
    return std::format(R"({{"category":{},"review_count":{},"avg_rating":{:.2f},"nps":{:.1f}}})",
        utils::json_string(m.category), m.review_count,
        round_to(m.avg_rating, 2), round_to(m.nps, 1));
}

} // anonymous namespace

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += utils::json_string(items[i]);
    }
    out += ']';
    return out;
}

std::string param_map_to_json(const ParamMap& params) {
    std::string out = "{";
    for (const auto& [key, value] : params) {
        if (out.size() > 1) out += ',';
        out += utils::json_string(key);
        out += ':';
        out += std::visit([](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return utils::booltostr(v);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::isfinite(v) ? std::format("{}", v) : "null";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return utils::json_string(v);
            } else {
                return json_string_array(v);
            }
        }, value);
    }
    out += '}';
    return out;
}

std::string tool_args_to_json(const ToolArgs& args, bool canonical) {
    const char* tool = tool_name_to_string(tool_of(args));
    return std::visit([&](const auto& a) -> std::string {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, TopCategoriesArgs>) {
            auto cats = a.categories;
            if (canonical) std::sort(cats.begin(), cats.end());
            return std::format(
                R"({{"tool":"{}","args":{{"metric":"{}","top_n":{},"order":"{}","categories":{}}}}})",
                tool, metric_to_string(a.metric), a.top_n, sort_order_to_string(a.order),
                json_string_array(cats));
        } else if constexpr (std::is_same_v<T, RatingDistributionArgs>) {
            return std::format(R"({{"tool":"{}","args":{{"category":{}}}}})",
                tool, utils::json_string(a.category));
        } else if constexpr (std::is_same_v<T, SentimentSummaryArgs>) {
            return std::format(R"({{"tool":"{}","args":{{"category":{},"max_reviews":{}}}}})",
                tool, utils::json_string(a.category), a.max_reviews);
        } else if constexpr (std::is_same_v<T, CompareCategoriesArgs>) {
            return std::format(R"({{"tool":"{}","args":{{"category_a":{},"category_b":{}}}}})",
                tool, utils::json_string(a.category_a), utils::json_string(a.category_b));
        } else {
            return std::format(R"({{"tool":"{}","args":{{"query_type":"{}","category":{}}}}})",
                tool, general_query_type_to_string(a.query_type),
                a.category ? utils::json_string(*a.category) : std::string("null"));
        }
    }, args);
}

std::string tool_call_to_json(const ToolCall& call) {
    std::string coercions = "[";
    for (size_t i = 0; i < call.coercions.size(); ++i) {
        const auto& c = call.coercions[i];
        if (i > 0) coercions += ',';
        coercions += std::format(R"({{"param":{},"requested":{},"applied":{}}})",
            utils::json_string(c.param), utils::json_string(c.requested),
            utils::json_string(c.applied));
    }
    coercions += ']';

    return std::format(
        R"({{"call":{},"is_fallback":{},"rejection_reason":{},"fallback_rationale":{},"coercions":{}}})",
        tool_args_to_json(call.args),
        utils::booltostr(call.is_fallback),
        call.rejection_reason
            ? utils::json_string(rejection_reason_to_string(*call.rejection_reason))
            : std::string("null"),
        utils::json_string(call.fallback_rationale),
        coercions);
}

std::string tool_result_to_json(const ToolResult& result) {
    const char* kind = result_kind(result);
    return std::visit([&](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, TopCategoriesResult>) {
            std::string rows = "[";
            for (size_t i = 0; i < r.rows.size(); ++i) {
                if (i > 0) rows += ',';
                rows += category_metrics_to_json(r.rows[i]);
            }
            rows += ']';
            return std::format(R"({{"kind":"{}","metric":"{}","order":"{}","rows":{}}})",
                kind, metric_to_string(r.metric), sort_order_to_string(r.order), rows);
        } else if constexpr (std::is_same_v<T, RatingDistributionResult>) {
            return std::format(
                R"({{"kind":"{}","category":{},"total":{},"counts":{{"1":{},"2":{},"3":{},"4":{},"5":{}}}}})",
                kind, utils::json_string(r.category), r.total,
                r.counts[0], r.counts[1], r.counts[2], r.counts[3], r.counts[4]);
        } else if constexpr (std::is_same_v<T, SentimentSummaryResult>) {
            std::string terms = "[";
            for (size_t i = 0; i < r.top_terms.size(); ++i) {
                if (i > 0) terms += ',';
                terms += std::format(R"({{"term":{},"count":{}}})",
                    utils::json_string(r.top_terms[i].first), r.top_terms[i].second);
            }
            terms += ']';
            return std::format(
                R"({{"kind":"{}","category":{},"reviews_analyzed":{},"positive":{},"neutral":{},"negative":{},"top_terms":{}}})",
                kind, utils::json_string(r.category), r.reviews_analyzed,
                r.positive, r.neutral, r.negative, terms);
        } else if constexpr (std::is_same_v<T, ComparisonResult>) {
            return std::format(R"({{"kind":"{}","a":{},"b":{}}})",
                kind, category_metrics_to_json(r.a), category_metrics_to_json(r.b));
        } else if constexpr (std::is_same_v<T, GeneralQueryResult>) {
            std::string out = std::format(
                R"({{"kind":"{}","query_type":"{}","category_count":{},"review_count":{},"avg_rating":{:.2f},"nps":{:.1f})",
                kind, general_query_type_to_string(r.query_type), r.category_count,
                r.review_count, round_to(r.avg_rating, 2), round_to(r.nps, 1));
            if (r.query_type == GeneralQueryType::LIST_CATEGORIES) {
                out += R"(,"categories":)" + json_string_array(r.categories);
            }
            if (r.category_info) {
                out += R"(,"category_info":)" + category_metrics_to_json(*r.category_info);
            }
            out += '}';
            return out;
        } else if constexpr (std::is_same_v<T, NoData>) {
            return std::format(R"({{"kind":"{}","categories":{}}})",
                kind, json_string_array(r.categories));
        } else {
            return std::format(R"({{"kind":"{}"}})", kind);
        }
    }, result);
}

} // namespace reviewgate
