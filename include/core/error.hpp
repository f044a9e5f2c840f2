#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace plansight {

/**
 * @brief Error categories for operations around the analyzer
 *
 * The analyzer itself never fails on plan data; these cover the
 * surrounding I/O (config files, plan files, command line).
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    IO_ERROR,
    USAGE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::IO_ERROR:       return "io_error";
        case ErrorCategory::USAGE_ERROR:    return "usage_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
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

} // namespace plansight
