#pragma once

#include "access/access_model.hpp"
#include "core/types.hpp"
#include "tools/tool_registry.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace reviewgate {

enum class Verdict {
    PASS,     // Validated as proposed
    COERCE,   // Validated after clamping/defaulting one or more parameters
    REJECT
};

[[nodiscard]] const char* verdict_to_string(Verdict v);

/**
 * @brief Outcome of validating one RouterDecision
 *
 * On PASS/COERCE `call` is set and safe to execute as-is. On REJECT
 * `reason` is set; `attempted` carries the typed arguments when they got
 * that far (used by the fallback policy), and `offending_category` names
 * the denied category. Neither is ever shown to the user.
 */
struct ValidationOutcome {
    Verdict verdict = Verdict::REJECT;
    std::optional<ToolCall> call;
    std::optional<RejectionReason> reason;
    ToolName proposed_tool = ToolName::UNKNOWN;
    std::optional<ToolArgs> attempted;
    std::optional<std::string> offending_category;
    std::vector<Coercion> coercions;
    std::string detail;

    [[nodiscard]] bool is_valid() const { return verdict != Verdict::REJECT; }
};

/**
 * @brief Deterministic gate between the interpreter and the executor
 *
 * Checks run in a fixed order and the first failure wins:
 *   availability -> registry -> ambiguity -> schema -> authorization -> consistency
 * Parameter domains come from the ToolRegistry only.
 */
class Validator {
public:
    struct Config {
        double min_confidence = 0.2;
    };

    Validator(std::shared_ptr<const ToolRegistry> registry,
              std::shared_ptr<AccessModel> access,
              const Config& config);

    [[nodiscard]] ValidationOutcome validate(const RouterDecision& decision, UserId user_id) const;

private:
    std::shared_ptr<const ToolRegistry> registry_;
    std::shared_ptr<AccessModel> access_;
    Config config_;
};

} // namespace reviewgate
