#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by the guard and the workspace
 *
 * Errors keep their tag (ErrorCode) all the way up to the C API and the CLI,
 * which are the only layers that flatten them to a message string.
 */

#include "fsgate/export.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace fsgate {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for fsgate operations
 */
enum class ErrorCode {
    // Guard rejections
    INVALID_PATH,
    BOUNDARY_VIOLATION,
    TRAVERSAL_IN_SUFFIX,

    // System / IO
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    IO_ERROR,
};

/// Stable lower-case name of an error code ("boundary_violation", ...)
FSGATE_API const char* error_code_name(ErrorCode code);

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Build an Error from a std::error_code
 *
 * ENOENT/ENOTDIR map to FILE_NOT_FOUND, EACCES/EPERM to PERMISSION_DENIED,
 * everything else to IO_ERROR. The message is "<context>: <ec.message()>".
 */
FSGATE_API Error error_from_errc(const std::error_code& ec, const std::string& context);

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace fsgate
