#ifndef VECSYNC_CORE_RESULT_H_
#define VECSYNC_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "vecsync/core/error.h"

namespace vecsync {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error(Error::Code::NOT_FOUND, "error message");
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else if (result.code() == Error::Code::NOT_FOUND) {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    struct ErrorTag {};
    Result(Error::Code code, std::string error_msg, ErrorTag)
        : value_(), code_(code), error_msg_(std::move(error_msg)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)),
          code_(other.code_),
          error_msg_(std::move(other.error_msg_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            code_ = other.code_;
            error_msg_ = std::move(other.error_msg_);
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code code() const { return code_; }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(Error::Code code, const std::string& message) {
        return Result<T>(code, message, ErrorTag{});
    }

    static Result<T> error(const std::string& message) {
        return Result<T>(Error::Code::INTERNAL, message, ErrorTag{});
    }

    // Re-wraps the error of another result with the same code.
    template<typename U>
    static Result<T> propagate(const Result<U>& other) {
        return Result<T>(other.code(), other.error(), ErrorTag{});
    }

private:
    T value_;
    Error::Code code_ = Error::Code::UNKNOWN;
    std::optional<std::string> error_msg_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() = default;

    struct ErrorTag {};
    Result(Error::Code code, std::string error_msg, ErrorTag)
        : code_(code), error_msg_(std::move(error_msg)) {}

    bool ok() const { return !error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code code() const { return code_; }

    static Result<void> error(Error::Code code, const std::string& message) {
        return Result<void>(code, message, ErrorTag{});
    }

    static Result<void> error(const std::string& message) {
        return Result<void>(Error::Code::INTERNAL, message, ErrorTag{});
    }

    template<typename U>
    static Result<void> propagate(const Result<U>& other) {
        return Result<void>(other.code(), other.error(), ErrorTag{});
    }

private:
    Error::Code code_ = Error::Code::UNKNOWN;
    std::optional<std::string> error_msg_;
};

} // namespace core
} // namespace vecsync

#endif // VECSYNC_CORE_RESULT_H_
