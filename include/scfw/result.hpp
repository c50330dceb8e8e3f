#pragma once

/**
 * @file result.hpp
 * @brief Error handling types used throughout the SCFW library
 *
 * Fallible operations return a Result<T>. Check isOk() before accessing
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto targets = manager->resolveInstallTargets(command);
 * if (targets.isErr()) {
 *     spdlog::error("{}", targets.error().message());
 *     return 1;
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace scfw {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Package manager invocation
    EXECUTABLE_NOT_FOUND,
    PROCESS_FAILED,
    UNSUPPORTED_VERSION,
    INVALID_COMMAND,

    // Output and input parsing
    PARSE_ERROR,
    INVALID_POLICY,

    // System / IO
    IO_ERROR,
    TIMEOUT,
    CANCELLED,

    // Verification
    VERIFIER_FAILED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::EXECUTABLE_NOT_FOUND: return "EXECUTABLE_NOT_FOUND";
        case ErrorCode::PROCESS_FAILED: return "PROCESS_FAILED";
        case ErrorCode::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
        case ErrorCode::INVALID_COMMAND: return "INVALID_COMMAND";
        case ErrorCode::PARSE_ERROR: return "PARSE_ERROR";
        case ErrorCode::INVALID_POLICY: return "INVALID_POLICY";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::VERIFIER_FAILED: return "VERIFIER_FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
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

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

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

} // namespace scfw
