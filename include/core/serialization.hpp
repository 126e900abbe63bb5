#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace reviewgate {

// ============================================================================
// JSON emitters (std::format + utils::escape_json)
//
// Field order is fixed, so equal values always serialize to equal bytes.
// ============================================================================

[[nodiscard]] std::string json_string_array(const std::vector<std::string>& items);

/// Untrusted interpreter parameters, values as received.
[[nodiscard]] std::string param_map_to_json(const ParamMap& params);

/// Tool name plus typed arguments. With `canonical`, category lists are
/// sorted so that argument order does not change the output.
[[nodiscard]] std::string tool_args_to_json(const ToolArgs& args, bool canonical = false);

/// Full ToolCall including fallback metadata and coercions.
[[nodiscard]] std::string tool_call_to_json(const ToolCall& call);

/// Result payload with display rounding (avg_rating 2 dp, nps 1 dp).
[[nodiscard]] std::string tool_result_to_json(const ToolResult& result);

/// Round half away from zero to `decimals` places.
[[nodiscard]] double round_to(double value, int decimals);

} // namespace reviewgate
