// ==============================================================================
// Error Handling
// ==============================================================================
// This file defines error types and exception classes for the suite.
// Every failure surfaces as one of these, carrying a category, a message and,
// when the source location is known, the span it refers to.
// ==============================================================================

#ifndef SILVERSCRIPT_COMMON_ERROR_HPP
#define SILVERSCRIPT_COMMON_ERROR_HPP

#include <exception>
#include <optional>
#include <string>
#include <sstream>
#include "types.hpp"

namespace sil {

// ==============================================================================
// Error Categories
// ==============================================================================

/**
 * @brief Different categories of errors that can occur
 *
 * - PARSE_ERROR: Couldn't understand the contract source text
 * - COMPILE_ERROR: Source parsed, but is semantically wrong (unknown name,
 *   type mismatch, missing entrypoint, ...)
 * - INPUT_ERROR: An argument value could not be parsed or encoded, or the
 *   requested function does not exist
 * - EXECUTION_ERROR: The script engine failed while running the bytecode
 * - FILE_ERROR: Couldn't read or write a file
 * - INTERNAL_ERROR: Bug in the suite itself (shouldn't happen!)
 */
enum class ErrorCategory {
    PARSE_ERROR,
    COMPILE_ERROR,
    INPUT_ERROR,
    EXECUTION_ERROR,
    FILE_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert ErrorCategory to string for display
 */
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::PARSE_ERROR:     return "Parse Error";
        case ErrorCategory::COMPILE_ERROR:   return "Compile Error";
        case ErrorCategory::INPUT_ERROR:     return "Input Error";
        case ErrorCategory::EXECUTION_ERROR: return "Execution Error";
        case ErrorCategory::FILE_ERROR:      return "File Error";
        case ErrorCategory::INTERNAL_ERROR:  return "Internal Error";
        default:                             return "Unknown Error";
    }
}

// ==============================================================================
// Base Exception Class
// ==============================================================================

/**
 * @brief Base exception class for all suite errors
 *
 * Example usage:
 *   throw CompileError(expr.span, "undefined identifier 'amout'");
 *
 * This will produce:
 *   Compile Error at 7:17-7:22 - undefined identifier 'amout'
 */
class SilError : public std::exception {
public:
    /**
     * @brief Construct an error with full context
     *
     * @param category What kind of error
     * @param span Where in the contract source it occurred (if known)
     * @param message Description of what went wrong
     */
    SilError(ErrorCategory category,
             std::optional<SourceSpan> span,
             const std::string& message)
        : category_(category)
        , span_(span)
        , message_(message)
    {
        std::ostringstream oss;
        oss << error_category_to_string(category);
        if (span_) {
            oss << " at " << span_->to_string();
        }
        oss << " - " << message;
        full_message_ = oss.str();
    }

    /**
     * @brief Construct a simple error without location context
     */
    SilError(ErrorCategory category, const std::string& message)
        : SilError(category, std::nullopt, message)
    {}

    /**
     * @brief Get the full formatted error message
     */
    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCategory category() const { return category_; }

    /**
     * @brief Get the source span (nullopt if the error has no location)
     */
    const std::optional<SourceSpan>& span() const { return span_; }

    /**
     * @brief Get just the error message (without category/location)
     */
    const std::string& message() const { return message_; }

private:
    ErrorCategory category_;
    std::optional<SourceSpan> span_;
    std::string message_;
    std::string full_message_;  // Cached formatted message
};

// ==============================================================================
// Specific Exception Types
// ==============================================================================

/**
 * @brief Parse error - the contract text is malformed
 *
 * Always carries a location: a point where the parser stopped, or a range
 * covering the offending token.
 */
class ParseError : public SilError {
public:
    ParseError(const SourceSpan& span, const std::string& message)
        : SilError(ErrorCategory::PARSE_ERROR, span, message)
    {}
};

/**
 * @brief Compile error - the contract is well-formed but invalid
 *
 * Examples:
 * - Unresolved identifier
 * - Argument count or type mismatch
 * - No entrypoint function / duplicate function name
 */
class CompileError : public SilError {
public:
    CompileError(std::optional<SourceSpan> span, const std::string& message)
        : SilError(ErrorCategory::COMPILE_ERROR, span, message)
    {}

    explicit CompileError(const std::string& message)
        : SilError(ErrorCategory::COMPILE_ERROR, message)
    {}
};

/**
 * @brief Input error - an argument could not be turned into input bytes
 *
 * Examples:
 * - "0x1234" supplied for a bytes4 parameter
 * - "12a" supplied for an int parameter
 * - Unknown function name
 */
class InputError : public SilError {
public:
    explicit InputError(const std::string& message)
        : SilError(ErrorCategory::INPUT_ERROR, message)
    {}
};

/**
 * @brief Execution error - the script engine failed
 *
 * Examples:
 * - OP_VERIFY on a false value (a failed require)
 * - Stack underflow
 * - Step limit exceeded
 */
class ExecutionError : public SilError {
public:
    explicit ExecutionError(const std::string& message)
        : SilError(ErrorCategory::EXECUTION_ERROR, message)
    {}
};

/**
 * @brief File error - couldn't read or write a file
 */
class FileError : public SilError {
public:
    FileError(const std::string& file, const std::string& message)
        : SilError(ErrorCategory::FILE_ERROR, file + ": " + message)
    {}
};

/**
 * @brief Internal error - bug in the suite itself
 *
 * These should never happen in a correct implementation.
 */
class InternalError : public SilError {
public:
    explicit InternalError(const std::string& message)
        : SilError(ErrorCategory::INTERNAL_ERROR, message)
    {}
};

// ==============================================================================
// Error Reporting Helpers
// ==============================================================================

/**
 * @brief Build a helpful error message with context
 *
 * Example:
 *   throw CompileError(span, build_error_message(
 *       "function '", name, "' expects ", expected, " arguments, got ", got));
 */
template<typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream oss;
    // Fold expression (C++17) - concatenate all arguments
    (oss << ... << args);
    return oss.str();
}

/**
 * @brief Format a suggestion for a typo
 *
 * Example:
 *   format_suggestion("uint", "int")
 * Returns:
 *   "'uint' (did you mean 'int'?)"
 */
inline std::string format_suggestion(const std::string& wrong, const std::string& correct) {
    return "'" + wrong + "' (did you mean '" + correct + "'?)";
}

}  // namespace sil

#endif  // SILVERSCRIPT_COMMON_ERROR_HPP
