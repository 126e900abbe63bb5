#pragma once

#include "access/access_model.hpp"
#include "core/types.hpp"
#include "validator/validator.hpp"

#include <memory>
#include <optional>
#include <string>

namespace reviewgate {

/**
 * @brief Maps a rejected proposal to a safe deterministic substitute
 *
 * Rules, first match wins:
 *   1. unsupported_tool / interpreter_unavailable -> general_query{summary_stats}
 *   2. access_denied -> metrics_top_categories over the visible set
 *   3. compare_categories with one category twice -> rating_distribution
 *   4. ambiguous_intent -> metrics_top_categories{default metric, default n}
 *   5. otherwise -> last good call if still fully visible, else rule 4's call
 *
 * The returned call always has is_fallback set and a disclosure line.
 */
class FallbackPolicy {
public:
    struct Config {
        int default_top_n = 5;
        Metric default_metric = Metric::REVIEW_COUNT;
    };

    FallbackPolicy(std::shared_ptr<AccessModel> access, const Config& config);

    [[nodiscard]] ToolCall resolve(const ValidationOutcome& rejection,
                                   UserId user_id,
                                   const std::optional<ToolCall>& last_good_call) const;

    /// User-facing line explaining the substitution. Empty for non-fallback calls.
    [[nodiscard]] static std::string disclosure(const ToolCall& call);

private:
    [[nodiscard]] ToolCall make(ToolArgs args, RejectionReason reason, std::string rationale) const;
    [[nodiscard]] TopCategoriesArgs default_overview() const;

    std::shared_ptr<AccessModel> access_;
    Config config_;
};

} // namespace reviewgate
