#pragma once

#include <optional>
#include <string>

namespace reviewgate {

/**
 * @brief Error categories surfaced by fallible core operations
 */
enum class ErrorCategory {
    NONE,
    ACCESS_DENIED,
    NOT_FOUND,
    INVALID_REQUEST,
    DATA_SOURCE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::ACCESS_DENIED:     return "access_denied";
        case ErrorCategory::NOT_FOUND:         return "not_found";
        case ErrorCategory::INVALID_REQUEST:   return "invalid_request";
        case ErrorCategory::DATA_SOURCE_ERROR: return "data_source_error";
        case ErrorCategory::CONFIG_ERROR:      return "config_error";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
        default:                               return "unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Re-wrap another result's error under this result type.
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace reviewgate
