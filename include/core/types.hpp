#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace reviewgate {

using UserId = int64_t;
using ConversationId = int64_t;

// ============================================================================
// Users & Roles
// ============================================================================

enum class Role {
    ADMIN,
    ANALYST
};

[[nodiscard]] const char* role_to_string(Role role);
[[nodiscard]] std::optional<Role> parse_role(std::string_view name);

/**
 * @brief One consistent read of a user and their persisted grants
 *
 * Directories return a copy; the core never holds a reference into
 * directory-owned state.
 */
struct UserRecord {
    UserId id = 0;
    std::string name;
    Role role = Role::ANALYST;
    bool active = true;
    uint64_t access_version = 0;
    std::set<std::string> categories;   // Persisted grant (ignored for admins)
    std::string api_key;
};

// ============================================================================
// Tool Vocabulary
// ============================================================================

enum class ToolName {
    METRICS_TOP_CATEGORIES,
    RATING_DISTRIBUTION,
    SENTIMENT_SUMMARY,
    COMPARE_CATEGORIES,
    GENERAL_QUERY,
    UNKNOWN
};

[[nodiscard]] const char* tool_name_to_string(ToolName tool);
/// Exact, case-sensitive wire name match. Anything else maps to UNKNOWN.
[[nodiscard]] ToolName parse_tool_name(std::string_view name);

enum class Metric {
    REVIEW_COUNT,
    AVG_RATING,
    NPS
};

[[nodiscard]] const char* metric_to_string(Metric metric);
[[nodiscard]] std::optional<Metric> parse_metric(std::string_view name);

enum class SortOrder {
    TOP,
    BOTTOM
};

[[nodiscard]] const char* sort_order_to_string(SortOrder order);
[[nodiscard]] std::optional<SortOrder> parse_sort_order(std::string_view name);

enum class GeneralQueryType {
    SUMMARY_STATS,
    COUNT_CATEGORIES,
    LIST_CATEGORIES,
    CATEGORY_INFO
};

[[nodiscard]] const char* general_query_type_to_string(GeneralQueryType type);
[[nodiscard]] std::optional<GeneralQueryType> parse_general_query_type(std::string_view name);

// ============================================================================
// Router Decision (untrusted interpreter proposal)
// ============================================================================

/// A parameter exactly as the interpreter sent it. No field is trusted
/// until the Validator has run it through the tool schema.
using ParamValue = std::variant<std::monostate, bool, int64_t, double,
                                std::string, std::vector<std::string>>;
using ParamMap = std::map<std::string, ParamValue>;

[[nodiscard]] std::string param_value_to_string(const ParamValue& value);

enum class DecisionStatus {
    PROPOSED,                 // Well-formed reply naming a known tool
    UNKNOWN_TOOL,             // Well-formed reply naming a tool outside the registry
    MALFORMED,                // Reply could not be parsed into the proposal shape
    INTERPRETER_UNAVAILABLE   // Sentinel: retries exhausted or non-transient failure
};

[[nodiscard]] const char* decision_status_to_string(DecisionStatus status);

struct RouterDecision {
    DecisionStatus status = DecisionStatus::MALFORMED;
    ToolName tool = ToolName::UNKNOWN;
    std::string raw_tool_name;
    ParamMap params;
    double confidence = 0.0;
    bool ambiguous = false;
    std::string rationale;

    // Transport bookkeeping (trace only)
    uint32_t attempts = 0;
    std::string last_error;

    [[nodiscard]] static RouterDecision unavailable(uint32_t attempts, std::string error);
    [[nodiscard]] static RouterDecision malformed(uint32_t attempts, std::string detail);
};

// ============================================================================
// Tool Call (validated action)
// ============================================================================

struct TopCategoriesArgs {
    Metric metric = Metric::REVIEW_COUNT;
    int top_n = 5;
    SortOrder order = SortOrder::TOP;
    std::vector<std::string> categories;    // Empty = every visible category

    bool operator==(const TopCategoriesArgs&) const = default;
};

struct RatingDistributionArgs {
    std::string category;

    bool operator==(const RatingDistributionArgs&) const = default;
};

struct SentimentSummaryArgs {
    std::string category;
    int max_reviews = 30;

    bool operator==(const SentimentSummaryArgs&) const = default;
};

struct CompareCategoriesArgs {
    std::string category_a;
    std::string category_b;

    bool operator==(const CompareCategoriesArgs&) const = default;
};

struct GeneralQueryArgs {
    GeneralQueryType query_type = GeneralQueryType::SUMMARY_STATS;
    std::optional<std::string> category;

    bool operator==(const GeneralQueryArgs&) const = default;
};

using ToolArgs = std::variant<TopCategoriesArgs, RatingDistributionArgs,
                              SentimentSummaryArgs, CompareCategoriesArgs,
                              GeneralQueryArgs>;

[[nodiscard]] ToolName tool_of(const ToolArgs& args);
[[nodiscard]] std::vector<std::string> referenced_categories(const ToolArgs& args);

enum class RejectionReason {
    UNSUPPORTED_TOOL,
    INTERPRETER_UNAVAILABLE,
    ACCESS_DENIED,
    INVALID_ARGUMENTS,
    AMBIGUOUS_INTENT
};

[[nodiscard]] const char* rejection_reason_to_string(RejectionReason reason);

struct Coercion {
    std::string param;
    std::string requested;
    std::string applied;

    bool operator==(const Coercion&) const = default;
};

struct ToolCall {
    ToolArgs args;
    bool is_fallback = false;
    std::optional<RejectionReason> rejection_reason;
    std::string fallback_rationale;
    std::vector<Coercion> coercions;

    [[nodiscard]] ToolName tool() const { return tool_of(args); }
};

// ============================================================================
// Tool Result
// ============================================================================

struct CategoryMetrics {
    std::string category;
    uint64_t review_count = 0;
    double avg_rating = 0.0;    // Unrounded
    double nps = 0.0;           // Unrounded, range [-100, 100]

    bool operator==(const CategoryMetrics&) const = default;
};

struct TopCategoriesResult {
    Metric metric = Metric::REVIEW_COUNT;
    SortOrder order = SortOrder::TOP;
    std::vector<CategoryMetrics> rows;

    bool operator==(const TopCategoriesResult&) const = default;
};

struct RatingDistributionResult {
    std::string category;
    std::array<uint64_t, 5> counts{};   // counts[i] = reviews rated i + 1
    uint64_t total = 0;

    bool operator==(const RatingDistributionResult&) const = default;
};

struct SentimentSummaryResult {
    std::string category;
    uint64_t reviews_analyzed = 0;
    uint64_t positive = 0;
    uint64_t neutral = 0;
    uint64_t negative = 0;
    std::vector<std::pair<std::string, uint64_t>> top_terms;

    bool operator==(const SentimentSummaryResult&) const = default;
};

struct ComparisonResult {
    CategoryMetrics a;
    CategoryMetrics b;

    bool operator==(const ComparisonResult&) const = default;
};

struct GeneralQueryResult {
    GeneralQueryType query_type = GeneralQueryType::SUMMARY_STATS;
    uint64_t category_count = 0;
    uint64_t review_count = 0;
    double avg_rating = 0.0;
    double nps = 0.0;
    std::vector<std::string> categories;             // LIST_CATEGORIES only
    std::optional<CategoryMetrics> category_info;    // CATEGORY_INFO only

    bool operator==(const GeneralQueryResult&) const = default;
};

/// The referenced category (or the whole visible scope) has zero rows.
struct NoData {
    std::vector<std::string> categories;

    bool operator==(const NoData&) const = default;
};

/// A referenced category lies outside the caller's scope. Carries no detail.
struct AccessDenied {
    bool operator==(const AccessDenied&) const = default;
};

using ToolResult = std::variant<TopCategoriesResult, RatingDistributionResult,
                                SentimentSummaryResult, ComparisonResult,
                                GeneralQueryResult, NoData, AccessDenied>;

[[nodiscard]] const char* result_kind(const ToolResult& result);

} // namespace reviewgate
