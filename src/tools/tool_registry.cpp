#include "tools/tool_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace reviewgate {

namespace {

ParamSpec int_param_spec(std::string name, int64_t lo, int64_t hi, int64_t def,
                         std::string description) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::INT;
    p.min_value = lo;
    p.max_value = hi;
    p.default_int = def;
    p.description = std::move(description);
    return p;
}

ParamSpec enum_param_spec(std::string name, std::vector<std::string> allowed,
                          std::string def, std::string description) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::ENUM;
    p.allowed = std::move(allowed);
    p.default_enum = std::move(def);
    p.description = std::move(description);
    return p;
}

ParamSpec category_param_spec(std::string name, bool required, std::string description) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::CATEGORY;
    p.required = required;
    p.description = std::move(description);
    return p;
}

std::vector<ToolSchema> builtin_tools() {
    std::vector<ToolSchema> tools;

    {
        ToolSchema s;
        s.name = ToolName::METRICS_TOP_CATEGORIES;
        s.description = "Rank categories by a metric";
        s.params.push_back(enum_param_spec("metric", {"review_count", "avg_rating", "nps"},
                                           "review_count", "ranking metric"));
        s.params.push_back(int_param_spec("top_n", 1, 50, 5, "number of categories"));
        s.params.push_back(enum_param_spec("order", {"top", "bottom"}, "top",
                                           "highest or lowest first"));
        ParamSpec cats;
        cats.name = "categories";
        cats.kind = ParamKind::CATEGORY_LIST;
        cats.description = "restrict ranking to these categories (optional)";
        s.params.push_back(std::move(cats));
        s.aliases = {{"n", "top_n"}, {"limit", "top_n"}};
        tools.push_back(std::move(s));
    }
    {
        ToolSchema s;
        s.name = ToolName::RATING_DISTRIBUTION;
        s.description = "Count of reviews per star rating (1-5) for one category";
        s.params.push_back(category_param_spec("category", true, "category name"));
        tools.push_back(std::move(s));
    }
    {
        ToolSchema s;
        s.name = ToolName::SENTIMENT_SUMMARY;
        s.description = "Positive/neutral/negative split and frequent terms for one category";
        s.params.push_back(category_param_spec("category", true, "category name"));
        s.params.push_back(int_param_spec("max_reviews", 5, 50, 30, "reviews to analyze"));
        tools.push_back(std::move(s));
    }
    {
        ToolSchema s;
        s.name = ToolName::COMPARE_CATEGORIES;
        s.description = "Side-by-side review count, average rating and NPS of two categories";
        s.params.push_back(category_param_spec("category_a", true, "first category"));
        s.params.push_back(category_param_spec("category_b", true, "second category"));
        tools.push_back(std::move(s));
    }
    {
        ToolSchema s;
        s.name = ToolName::GENERAL_QUERY;
        s.description = "Dataset-level questions over the visible categories";
        s.params.push_back(enum_param_spec("query_type",
            {"summary_stats", "count_categories", "list_categories", "category_info"},
            "summary_stats", "kind of question"));
        s.params.push_back(category_param_spec("category", false,
                                               "category (required for category_info)"));
        tools.push_back(std::move(s));
    }

    return tools;
}

} // anonymous namespace

// ============================================================================
// ToolSchema
// ============================================================================

const ParamSpec* ToolSchema::find(std::string_view param) const {
    std::string_view canonical = param;
    if (const auto it = aliases.find(std::string(param)); it != aliases.end()) {
        canonical = it->second;
    }
    for (const auto& p : params) {
        if (p.name == canonical) return &p;
    }
    return nullptr;
}

// ============================================================================
// ToolRegistry
// ============================================================================

ToolRegistry::ToolRegistry() : tools_(builtin_tools()) {}

ToolRegistry::ToolRegistry(const Config& config) : tools_(builtin_tools()) {
    for (const auto& ov : config.overrides) {
        apply(ov);
    }
}

void ToolRegistry::apply(const ParamOverride& ov) {
    const ToolSchema* schema = lookup(std::string_view(ov.tool));
    if (!schema) {
        utils::log::warn(std::format("tools: override for unknown tool '{}' ignored", ov.tool));
        return;
    }
    auto& mutable_schema = tools_[static_cast<size_t>(schema - tools_.data())];
    ParamSpec* spec = nullptr;
    for (auto& p : mutable_schema.params) {
        if (p.name == ov.param) spec = &p;
    }
    if (!spec || spec->kind != ParamKind::INT) {
        utils::log::warn(std::format("tools: override for '{}.{}' ignored (not an integer parameter)",
                                     ov.tool, ov.param));
        return;
    }

    const int64_t lo = ov.min_value.value_or(spec->min_value);
    const int64_t hi = ov.max_value.value_or(spec->max_value);
    if (lo > hi) {
        utils::log::warn(std::format("tools: override for '{}.{}' ignored (min {} > max {})",
                                     ov.tool, ov.param, lo, hi));
        return;
    }
    spec->min_value = lo;
    spec->max_value = hi;
    spec->default_int = std::clamp(ov.default_value.value_or(spec->default_int), lo, hi);
}

const ToolSchema* ToolRegistry::lookup(ToolName tool) const {
    for (const auto& s : tools_) {
        if (s.name == tool) return &s;
    }
    return nullptr;
}

const ToolSchema* ToolRegistry::lookup(std::string_view tool_name) const {
    const auto tool = parse_tool_name(tool_name);
    if (tool == ToolName::UNKNOWN) return nullptr;
    return lookup(tool);
}

const ParamSpec* ToolRegistry::int_param(ToolName tool, std::string_view param) const {
    const auto* schema = lookup(tool);
    if (!schema) return nullptr;
    const auto* spec = schema->find(param);
    return (spec && spec->kind == ParamKind::INT) ? spec : nullptr;
}

std::string ToolRegistry::catalog_description() const {
    std::string out;
    for (const auto& s : tools_) {
        out += std::format("- {}: {}\n", tool_name_to_string(s.name), s.description);
        for (const auto& p : s.params) {
            std::string domain;
            switch (p.kind) {
                case ParamKind::INT:
                    domain = std::format("integer {}..{}, default {}",
                                         p.min_value, p.max_value, p.default_int);
                    break;
                case ParamKind::ENUM:
                    domain = std::format("one of {{{}}}, default {}",
                                         utils::join(p.allowed, ", "), p.default_enum);
                    break;
                case ParamKind::CATEGORY:
                    domain = "category name";
                    break;
                case ParamKind::CATEGORY_LIST:
                    domain = "list of category names";
                    break;
            }
            out += std::format("    {} ({}{}): {}\n", p.name, domain,
                               p.required ? ", required" : "", p.description);
        }
    }
    return out;
}

} // namespace reviewgate
