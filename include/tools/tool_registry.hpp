#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reviewgate {

enum class ParamKind {
    INT,
    ENUM,
    CATEGORY,       // Single category name
    CATEGORY_LIST   // List of category names
};

/**
 * @brief Descriptor of one tool parameter
 *
 * INT uses min/max/default_int; ENUM uses allowed/default_enum.
 * Category kinds carry no domain here: their domain is the caller's
 * visible set, known only at validation time.
 */
struct ParamSpec {
    std::string name;
    ParamKind kind = ParamKind::INT;
    bool required = false;
    int64_t min_value = 0;
    int64_t max_value = 0;
    int64_t default_int = 0;
    std::vector<std::string> allowed;
    std::string default_enum;
    std::string description;
};

struct ToolSchema {
    ToolName name = ToolName::UNKNOWN;
    std::string description;
    std::vector<ParamSpec> params;
    std::map<std::string, std::string> aliases;   // alias -> canonical param

    [[nodiscard]] const ParamSpec* find(std::string_view param) const;
};

/**
 * @brief Bounds override for one integer parameter ([tools.<name>] in TOML)
 */
struct ParamOverride {
    std::string tool;
    std::string param;
    std::optional<int64_t> min_value;
    std::optional<int64_t> max_value;
    std::optional<int64_t> default_value;
};

/**
 * @brief Closed, immutable set of analytics tools
 *
 * Built once at startup. The single source of truth for parameter
 * domains: nothing downstream hard-codes a bound.
 */
class ToolRegistry {
public:
    struct Config {
        std::vector<ParamOverride> overrides;
    };

    ToolRegistry();
    explicit ToolRegistry(const Config& config);

    /// nullptr when the tool is not registered.
    [[nodiscard]] const ToolSchema* lookup(ToolName tool) const;
    [[nodiscard]] const ToolSchema* lookup(std::string_view tool_name) const;

    [[nodiscard]] const std::vector<ToolSchema>& tools() const { return tools_; }

    /// Human/LLM-readable catalog of every tool and its parameter domains.
    [[nodiscard]] std::string catalog_description() const;

    /// Convenience accessor for integer parameter specs (bounds, default).
    [[nodiscard]] const ParamSpec* int_param(ToolName tool, std::string_view param) const;

private:
    void apply(const ParamOverride& ov);

    std::vector<ToolSchema> tools_;
};

} // namespace reviewgate
