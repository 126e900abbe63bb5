#include "validator/validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace reviewgate {

const char* verdict_to_string(Verdict v) {
    switch (v) {
        case Verdict::PASS:   return "pass";
        case Verdict::COERCE: return "coerce";
        case Verdict::REJECT: return "reject";
        default:              return "unknown";
    }
}

namespace {

ValidationOutcome reject(RejectionReason reason, ToolName tool, std::string detail) {
    ValidationOutcome out;
    out.verdict = Verdict::REJECT;
    out.reason = reason;
    out.proposed_tool = tool;
    out.detail = std::move(detail);
    return out;
}

/**
 * Reads typed arguments out of the untyped parameter bag, applying the
 * schema's domains and recording every adjustment.
 */
class ArgReader {
public:
    ArgReader(const ToolSchema& schema, const ParamMap& raw,
              const std::set<std::string>& visible)
        : schema_(schema), visible_(visible) {
        for (const auto& [key, value] : raw) {
            const auto* spec = schema.find(key);
            if (!spec) continue;   // Unknown parameters are ignored
            if (key == spec->name) {
                params_[spec->name] = value;
            } else {
                params_.try_emplace(spec->name, value);
            }
        }
    }

    int64_t read_int(const std::string& name) {
        const auto* spec = schema_.find(name);
        const auto* v = present(name);
        if (!v) return spec->default_int;

        const auto requested = param_value_to_string(*v);
        std::optional<int64_t> parsed;

        if (const auto* i = std::get_if<int64_t>(v)) {
            parsed = *i;
        } else if (const auto* d = std::get_if<double>(v)) {
            parsed = truncate(*d);
        } else if (const auto* s = std::get_if<std::string>(v)) {
            const auto t = utils::trim(*s);
            parsed = utils::try_parse_int<int64_t>(t);
            if (!parsed) {
                if (const auto dd = utils::try_parse_double(t)) parsed = truncate(*dd);
            }
        }

        if (!parsed) {
            note(name, requested, std::to_string(spec->default_int));
            return spec->default_int;
        }

        const int64_t applied = std::clamp(*parsed, spec->min_value, spec->max_value);
        if (applied != *parsed || !std::holds_alternative<int64_t>(*v)) {
            note(name, requested, std::to_string(applied));
        }
        return applied;
    }

    std::string read_enum(const std::string& name) {
        const auto* spec = schema_.find(name);
        const auto* v = present(name);
        if (!v) return spec->default_enum;

        if (const auto* s = std::get_if<std::string>(v)) {
            const auto lowered = utils::to_lower(utils::trim(*s));
            if (std::find(spec->allowed.begin(), spec->allowed.end(), lowered) != spec->allowed.end()) {
                return lowered;
            }
        }
        note(name, param_value_to_string(*v), spec->default_enum);
        return spec->default_enum;
    }

    /// Trimmed name, canonicalized against the visible set. nullopt if absent.
    std::optional<std::string> read_category(const std::string& name) {
        const auto* v = present(name);
        if (!v) return std::nullopt;

        if (const auto* s = std::get_if<std::string>(v)) {
            auto c = canonical(*s);
            if (c.empty()) return std::nullopt;
            return c;
        }
        if (const auto* list = std::get_if<std::vector<std::string>>(v); list && list->size() == 1) {
            auto c = canonical(list->front());
            if (c.empty()) return std::nullopt;
            return c;
        }
        return std::nullopt;
    }

    std::vector<std::string> read_category_list(const std::string& name) {
        const auto* v = present(name);
        if (!v) return {};

        std::vector<std::string> raw;
        if (const auto* list = std::get_if<std::vector<std::string>>(v)) {
            raw = *list;
        } else if (const auto* s = std::get_if<std::string>(v)) {
            raw = utils::split(*s, ',');
        }

        std::vector<std::string> out;
        for (const auto& r : raw) {
            auto c = canonical(r);
            if (c.empty()) continue;
            if (std::find(out.begin(), out.end(), c) == out.end()) out.push_back(std::move(c));
        }
        return out;
    }

    std::vector<Coercion> take_coercions() { return std::move(coercions_); }

private:
    const ParamValue* present(const std::string& name) const {
        const auto it = params_.find(name);
        if (it == params_.end() || std::holds_alternative<std::monostate>(it->second)) {
            return nullptr;
        }
        return &it->second;
    }

    std::string canonical(std::string_view raw) const {
        auto trimmed = utils::trim(raw);
        if (trimmed.empty() || visible_.contains(trimmed)) return trimmed;
        for (const auto& v : visible_) {
            if (utils::iequals(v, trimmed)) return v;
        }
        return trimmed;
    }

    static std::optional<int64_t> truncate(double d) {
        if (!std::isfinite(d)) return std::nullopt;
        const double t = std::trunc(d);
        if (t > static_cast<double>(std::numeric_limits<int64_t>::max()) ||
            t < static_cast<double>(std::numeric_limits<int64_t>::min())) {
            return d > 0 ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(t);
    }

    void note(const std::string& param, std::string requested, std::string applied) {
        coercions_.push_back(Coercion{param, std::move(requested), std::move(applied)});
    }

    const ToolSchema& schema_;
    const std::set<std::string>& visible_;
    ParamMap params_;
    std::vector<Coercion> coercions_;
};

} // anonymous namespace

Validator::Validator(std::shared_ptr<const ToolRegistry> registry,
                     std::shared_ptr<AccessModel> access,
                     const Config& config)
    : registry_(std::move(registry)),
      access_(std::move(access)),
      config_(config) {}

ValidationOutcome Validator::validate(const RouterDecision& decision, UserId user_id) const {
    // 0. Interpreter availability
    if (decision.status == DecisionStatus::INTERPRETER_UNAVAILABLE) {
        return reject(RejectionReason::INTERPRETER_UNAVAILABLE, ToolName::UNKNOWN,
                      decision.last_error);
    }

    // 1. Registry membership
    const ToolSchema* schema = nullptr;
    if (decision.status == DecisionStatus::PROPOSED && decision.tool != ToolName::UNKNOWN) {
        schema = registry_->lookup(decision.tool);
    }
    if (!schema) {
        return reject(RejectionReason::UNSUPPORTED_TOOL, ToolName::UNKNOWN,
            std::format("{} tool '{}'", decision_status_to_string(decision.status),
                        decision.raw_tool_name));
    }

    // 2. Ambiguity
    if (decision.ambiguous || decision.confidence < config_.min_confidence) {
        return reject(RejectionReason::AMBIGUOUS_INTENT, decision.tool,
            std::format("ambiguous={} confidence={:.2f}",
                        utils::booltostr(decision.ambiguous), decision.confidence));
    }

    // 3. Schema
    const auto visible = access_->resolve_visible_categories(user_id);
    ArgReader reader(*schema, decision.params, visible);
    std::optional<ToolArgs> args;
    std::string missing;

    switch (decision.tool) {
        case ToolName::METRICS_TOP_CATEGORIES: {
            TopCategoriesArgs a;
            a.metric = parse_metric(reader.read_enum("metric")).value_or(Metric::REVIEW_COUNT);
            a.top_n = static_cast<int>(reader.read_int("top_n"));
            a.order = parse_sort_order(reader.read_enum("order")).value_or(SortOrder::TOP);
            a.categories = reader.read_category_list("categories");
            args = std::move(a);
            break;
        }
        case ToolName::RATING_DISTRIBUTION: {
            auto c = reader.read_category("category");
            if (!c) { missing = "category"; break; }
            args = RatingDistributionArgs{std::move(*c)};
            break;
        }
        case ToolName::SENTIMENT_SUMMARY: {
            auto c = reader.read_category("category");
            const auto n = static_cast<int>(reader.read_int("max_reviews"));
            if (!c) { missing = "category"; break; }
            args = SentimentSummaryArgs{std::move(*c), n};
            break;
        }
        case ToolName::COMPARE_CATEGORIES: {
            auto ca = reader.read_category("category_a");
            auto cb = reader.read_category("category_b");
            if (!ca) { missing = "category_a"; break; }
            if (!cb) { missing = "category_b"; break; }
            args = CompareCategoriesArgs{std::move(*ca), std::move(*cb)};
            break;
        }
        case ToolName::GENERAL_QUERY: {
            GeneralQueryArgs a;
            a.query_type = parse_general_query_type(reader.read_enum("query_type"))
                               .value_or(GeneralQueryType::SUMMARY_STATS);
            auto c = reader.read_category("category");
            if (a.query_type == GeneralQueryType::CATEGORY_INFO) a.category = std::move(c);
            args = std::move(a);
            break;
        }
        default:
            return reject(RejectionReason::UNSUPPORTED_TOOL, decision.tool, "unregistered tool");
    }

    auto coercions = reader.take_coercions();

    if (!args) {
        auto out = reject(RejectionReason::INVALID_ARGUMENTS, decision.tool,
                          std::format("missing required parameter '{}'", missing));
        out.coercions = std::move(coercions);
        return out;
    }

    // 4. Authorization
    for (const auto& category : referenced_categories(*args)) {
        if (access_->authorize(user_id, category) == AccessDecision::DENIED) {
            auto out = reject(RejectionReason::ACCESS_DENIED, decision.tool,
                              "category outside caller scope");
            out.offending_category = category;
            out.attempted = std::move(args);
            out.coercions = std::move(coercions);
            return out;
        }
    }

    // 5. Consistency
    if (const auto* cmp = std::get_if<CompareCategoriesArgs>(&*args);
        cmp && cmp->category_a == cmp->category_b) {
        auto out = reject(RejectionReason::INVALID_ARGUMENTS, decision.tool,
                          "compare_categories requires two distinct categories");
        out.attempted = std::move(args);
        out.coercions = std::move(coercions);
        return out;
    }
    if (const auto* gq = std::get_if<GeneralQueryArgs>(&*args);
        gq && gq->query_type == GeneralQueryType::CATEGORY_INFO && !gq->category) {
        auto out = reject(RejectionReason::INVALID_ARGUMENTS, decision.tool,
                          "category_info requires a category");
        out.attempted = std::move(args);
        out.coercions = std::move(coercions);
        return out;
    }

    ValidationOutcome out;
    out.verdict = coercions.empty() ? Verdict::PASS : Verdict::COERCE;
    out.proposed_tool = decision.tool;
    out.coercions = coercions;
    out.call = ToolCall{
        .args = std::move(*args),
        .is_fallback = false,
        .rejection_reason = std::nullopt,
        .fallback_rationale = {},
        .coercions = std::move(coercions),
    };
    return out;
}

} // namespace reviewgate
