#include "fallback/fallback_policy.hpp"

namespace reviewgate {

FallbackPolicy::FallbackPolicy(std::shared_ptr<AccessModel> access, const Config& config)
    : access_(std::move(access)), config_(config) {}

std::string FallbackPolicy::disclosure(const ToolCall& call) {
    if (!call.is_fallback) return {};
    return call.fallback_rationale;
}

ToolCall FallbackPolicy::make(ToolArgs args, RejectionReason reason, std::string rationale) const {
    return ToolCall{
        .args = std::move(args),
        .is_fallback = true,
        .rejection_reason = reason,
        .fallback_rationale = std::move(rationale),
        .coercions = {},
    };
}

TopCategoriesArgs FallbackPolicy::default_overview() const {
    TopCategoriesArgs a;
    a.metric = config_.default_metric;
    a.top_n = config_.default_top_n;
    a.order = SortOrder::TOP;
    return a;
}

ToolCall FallbackPolicy::resolve(const ValidationOutcome& rejection,
                                 UserId user_id,
                                 const std::optional<ToolCall>& last_good_call) const {
    const auto reason = rejection.reason.value_or(RejectionReason::INVALID_ARGUMENTS);

    // Rule 1
    if (reason == RejectionReason::UNSUPPORTED_TOOL) {
        return make(GeneralQueryArgs{GeneralQueryType::SUMMARY_STATS, std::nullopt}, reason,
            "I couldn't determine a supported analysis for that request, "
            "so here are overall summary statistics instead.");
    }
    if (reason == RejectionReason::INTERPRETER_UNAVAILABLE) {
        return make(GeneralQueryArgs{GeneralQueryType::SUMMARY_STATS, std::nullopt}, reason,
            "The language service is unavailable right now, "
            "so here are overall summary statistics instead.");
    }

    // Rule 2
    if (reason == RejectionReason::ACCESS_DENIED) {
        const auto visible = access_->resolve_visible_categories(user_id);
        auto a = default_overview();
        a.categories.assign(visible.begin(), visible.end());
        return make(std::move(a), reason,
            "That category isn't available based on your access, "
            "so here are your top categories instead.");
    }

    // Rule 3
    if (reason == RejectionReason::INVALID_ARGUMENTS && rejection.attempted) {
        if (const auto* cmp = std::get_if<CompareCategoriesArgs>(&*rejection.attempted);
            cmp && cmp->category_a == cmp->category_b) {
            return make(RatingDistributionArgs{cmp->category_a}, reason,
                "You asked to compare a category with itself, "
                "so here is its rating distribution instead.");
        }
    }

    // Rule 4
    if (reason == RejectionReason::AMBIGUOUS_INTENT) {
        return make(default_overview(), reason,
            "I wasn't sure what you were asking, so here are the top categories instead.");
    }

    // Rule 5
    if (last_good_call) {
        const auto visible = access_->resolve_visible_categories(user_id);
        bool still_visible = true;
        for (const auto& c : referenced_categories(last_good_call->args)) {
            if (!visible.contains(c)) {
                still_visible = false;
                break;
            }
        }
        if (still_visible) {
            return make(last_good_call->args, reason,
                "I couldn't safely complete that request, "
                "so I repeated your previous analysis.");
        }
    }
    return make(default_overview(), reason,
        "I couldn't safely complete that request, so here is a general overview instead.");
}

} // namespace reviewgate
