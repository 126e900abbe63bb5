#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reviewgate {

/**
 * @brief Read-only view over a glz::json_t document
 *
 * Used at every untrusted JSON boundary: interpreter replies, provider
 * envelopes and HTTP request bodies. Accessors never throw on a missing
 * key or a type mismatch; they return a null value or std::nullopt so
 * callers can treat any shape violation as "absent".
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_integer() const {
        if (!data_.is_number()) return false;
        const double d = data_.get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access (returns copy, null on miss) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        const auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Checked Extraction =====

    [[nodiscard]] std::optional<std::string> as_string() const {
        if (!data_.is_string()) return std::nullopt;
        return data_.get<std::string>();
    }

    [[nodiscard]] std::optional<double> as_double() const {
        if (!data_.is_number()) return std::nullopt;
        return data_.get<double>();
    }

    /// Integral numbers within +/-9e18 only; anything larger is not an int64.
    [[nodiscard]] std::optional<int64_t> as_int() const {
        if (!is_integer()) return std::nullopt;
        const double d = data_.get<double>();
        if (d < -9.0e18 || d > 9.0e18) return std::nullopt;
        return static_cast<int64_t>(d);
    }

    [[nodiscard]] std::optional<bool> as_bool() const {
        if (!data_.is_boolean()) return std::nullopt;
        return data_.get<bool>();
    }

    /// node.value("key", default), typed lookup with fallback.
    [[nodiscard]] std::string value(std::string_view key, const std::string& default_value) const {
        return (*this)[key].as_string().value_or(default_value);
    }

    [[nodiscard]] int64_t value(std::string_view key, int64_t default_value) const {
        return (*this)[key].as_int().value_or(default_value);
    }

    [[nodiscard]] bool value(std::string_view key, bool default_value) const {
        return (*this)[key].as_bool().value_or(default_value);
    }

    // ===== Iteration =====

    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        const auto& arr = data_.get_array();
        out.reserve(arr.size());
        for (const auto& v : arr) out.emplace_back(v);
        return out;
    }

    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> items() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!data_.is_object()) return out;
        for (const auto& [k, v] : data_.get_object()) {
            out.emplace_back(k, JsonValue(v));
        }
        return out;
    }

    /// String elements of an array; non-string elements are skipped.
    [[nodiscard]] std::vector<std::string> string_elements() const {
        std::vector<std::string> out;
        for (const auto& e : elements()) {
            if (auto s = e.as_string()) out.push_back(std::move(*s));
        }
        return out;
    }

    // ===== Parsing =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    /// Non-throwing parse for untrusted input.
    [[nodiscard]] static std::optional<JsonValue> try_parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        if (glz::read_json(result, buffer)) {
            return std::nullopt;
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace reviewgate
