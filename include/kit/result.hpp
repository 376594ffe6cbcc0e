#pragma once

/**
 * @file result.hpp
 * @brief Error codes and the Result<T> type used across the kit library
 *
 * Fallible operations return Result<T>. Check isOk() before accessing
 * value(), or isErr() before error().
 */

#include <optional>
#include <string>
#include <utility>

namespace kit {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // System / IO
    IO_ERROR,
    PARSE_ERROR,
    CONFIG_INVALID,
    NETWORK_ERROR,

    // Gateway taxonomy
    NOT_FOUND,
    POLICY_DENIED,
    UNSUPPORTED_ECOSYSTEM,
    INSTALLER_UNAVAILABLE,
    INSTALL_FAILED,
    INTENT_CHECK_UNAVAILABLE,  // logged only, never returned to callers
    AUDIT_WRITE_FAILED,
    AUDIT_CORRUPT,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::PARSE_ERROR: return "PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::POLICY_DENIED: return "POLICY_DENIED";
        case ErrorCode::UNSUPPORTED_ECOSYSTEM: return "UNSUPPORTED_ECOSYSTEM";
        case ErrorCode::INSTALLER_UNAVAILABLE: return "INSTALLER_UNAVAILABLE";
        case ErrorCode::INSTALL_FAILED: return "INSTALL_FAILED";
        case ErrorCode::INTENT_CHECK_UNAVAILABLE: return "INTENT_CHECK_UNAVAILABLE";
        case ErrorCode::AUDIT_WRITE_FAILED: return "AUDIT_WRITE_FAILED";
        case ErrorCode::AUDIT_CORRUPT: return "AUDIT_CORRUPT";
    }
    return "UNKNOWN";
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

} // namespace kit
