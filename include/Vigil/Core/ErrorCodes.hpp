/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Vigil connection-health monitor
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 *
 * This file defines all error codes used throughout Vigil, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef VIGIL_CORE_ERROR_CODES_HPP
#define VIGIL_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Vigil {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system and threading errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Vigil operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Thread creation failed
    ThreadCreationFailed = 0x0103,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// File read error
    FileReadError = 0x0906,

    /// File too large
    FileTooLarge = 0x0909,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// JSON parse error
    JsonParseFailed = 0x0A01,

    /// Missing required field
    MissingField = 0x0A03,

    /// Invalid field type
    InvalidFieldType = 0x0A04,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error (default-constructed Result)
    InternalError = 0xFF00,

    /// Object is not in a usable state (e.g. moved-from)
    InvalidState = 0xFF03,

    /// Invalid argument
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<Milliseconds> parseInterval(int64_t raw) {
 *     if (raw <= 0) return ErrorCode::InvalidArgument;
 *     return Milliseconds{raw};
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Static method to create success result
    [[nodiscard]] static Result Success(T value) {
        return Result(std::move(value));
    }

    /// Static method to create error result
    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 *
 * Used for operations that can fail but don't return a value.
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    /// Static method to create success result
    [[nodiscard]] static Result Success() {
        return Result();
    }

    /// Static method to create error result
    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    /// Explicit conversion to bool
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the error code
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * VIGIL_TRY(someOperation());
 * ```
 */
#define VIGIL_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

} // namespace Vigil

#endif // VIGIL_CORE_ERROR_CODES_HPP
