#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace xrayot {

/**
 * @brief Error categories for fallible loading paths
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    VALIDATION_ERROR,
    INTERNAL_ERROR
};

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

/**
 * @brief API surface the X-Ray model cannot honour
 *
 * Thrown for operation renames and for context injection / extraction.
 * Not recoverable: callers must stop using the operation.
 */
class UnsupportedOperationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief An entity was closed (and possibly emitted) more than once
 */
class AlreadyEmittedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A child entity was requested with no current entity to attach it to
 */
class ContextMissingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace xrayot
