// ==============================================================================
// Common Type Definitions
// ==============================================================================
// This file defines basic types used throughout the SilverScript debug suite.
// Using explicit types makes the code more readable and helps catch bugs.
// ==============================================================================

#ifndef SILVERSCRIPT_COMMON_TYPES_HPP
#define SILVERSCRIPT_COMMON_TYPES_HPP

#include <cstdint>      // For fixed-width integer types
#include <string>       // For std::string
#include <vector>       // For std::vector
#include <optional>     // For std::optional (values that might not exist)

namespace sil {  // sil = SilverScript namespace

// ==============================================================================
// Byte Types
// ==============================================================================

/**
 * @brief An 8-bit byte
 *
 * The script machine works on byte strings: every stack item, every
 * instruction and every encoded argument is a sequence of these.
 */
using Byte = uint8_t;

/**
 * @brief A byte string
 *
 * Used for bytecode, unlocking input, stack items and encoded values.
 */
using Bytes = std::vector<Byte>;

// ==============================================================================
// Source Locations
// ==============================================================================

/**
 * @brief Source code line number (1-based, 0 if unknown)
 */
using LineNumber = size_t;

/**
 * @brief A region of contract source text
 *
 * Lines and columns are 1-based. A point location (e.g. where the parser
 * gave up) has start == end.
 *
 * Example: `int y = x + 1;` on line 4 starting at column 9 has
 *   SourceSpan{4, 9, 4, 23}
 */
struct SourceSpan {
    uint32_t line = 0;
    uint32_t col = 0;
    uint32_t end_line = 0;
    uint32_t end_col = 0;

    /**
     * @brief Build a zero-width span at one position
     */
    static SourceSpan point(uint32_t line, uint32_t col) {
        return SourceSpan{line, col, line, col};
    }

    /**
     * @brief Build the smallest span that covers both inputs
     */
    static SourceSpan cover(const SourceSpan& first, const SourceSpan& last) {
        return SourceSpan{first.line, first.col, last.end_line, last.end_col};
    }

    bool is_point() const { return line == end_line && col == end_col; }

    bool operator==(const SourceSpan& other) const {
        return line == other.line && col == other.col &&
               end_line == other.end_line && end_col == other.end_col;
    }
    bool operator!=(const SourceSpan& other) const { return !(*this == other); }

    /**
     * @brief Render as "line:col" or "line:col-end_line:end_col"
     */
    std::string to_string() const;
};

/**
 * @brief Symbol name (variable, function, contract name)
 */
using Symbol = std::string;

/**
 * @brief File path
 *
 * Used for loading contract files and reporting errors with file context.
 */
using FilePath = std::string;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Encode bytes as lowercase hex without a prefix
 *
 * Example: to_hex({0xde, 0xad}) returns "dead"
 */
std::string to_hex(const Bytes& bytes);

/**
 * @brief Decode a hex string, with or without a leading "0x"
 *
 * @return The decoded bytes, or nullopt if the text has odd length or
 *         contains a non-hex character
 */
std::optional<Bytes> from_hex(const std::string& text);

/**
 * @brief Remove leading and trailing whitespace
 */
std::string trim(const std::string& text);

/**
 * @brief Check whether a string starts with a prefix
 */
bool starts_with(const std::string& text, const std::string& prefix);

}  // namespace sil

#endif  // SILVERSCRIPT_COMMON_TYPES_HPP
