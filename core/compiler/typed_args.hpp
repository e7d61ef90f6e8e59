// ==============================================================================
// Typed Argument Values
// ==============================================================================
// Raw argument strings ("42", "true", "0xabcd", free text) become literal
// expressions of the declared type, and literals become the stack bytes the
// script machine sees. Constructor arguments and function arguments share
// these rules.
// ==============================================================================

#ifndef SILVERSCRIPT_COMPILER_TYPED_ARGS_HPP
#define SILVERSCRIPT_COMPILER_TYPED_ARGS_HPP

#include "ast.hpp"
#include <string>
#include <vector>

namespace sil {

/**
 * @brief Parse one raw argument string for a declared type
 *
 * - int: decimal, optional leading '-' ("42", "-7")
 * - bool: "true" or "false"
 * - string: taken verbatim
 * - byte types: hex with or without "0x"
 *
 * @throws InputError if the type is unknown or the text does not parse
 */
Expr parse_typed_arg(const std::string& type_name, const std::string& raw);

/**
 * @brief Parse a list of raw strings against a list of type names
 *
 * @throws InputError on count mismatch or any bad value
 */
std::vector<Expr> parse_typed_args(const std::vector<std::string>& type_names,
                                   const std::vector<std::string>& raw_values,
                                   const std::string& context);

/**
 * @brief Encode a literal as stack bytes for a declared type
 *
 * @throws InputError on a kind mismatch or a wrong length for fixed-size
 *         byte types
 */
Bytes encode_typed_value(const TypeRef& type, const Expr& value);

/**
 * @brief Canonical zero value for a type, as a raw string
 *
 * int "0", bool "false", string "", bytes "0x", byte "0x00",
 * bytesN / pubkey / sig / datasig all-zero hex of their size, T[] "[]".
 */
std::string default_raw_value(const std::string& type_name);

/**
 * @brief Pad or default-fill raw values to match a parameter list
 *
 * Missing or blank values are replaced by default_raw_value().
 *
 * @param context Used in the error message, e.g. "function 'main'"
 * @throws InputError if more values than parameters were supplied
 */
std::vector<std::string> fill_raw_args(const std::vector<std::string>& type_names,
                                       const std::vector<std::string>& raw_values,
                                       const std::string& context);

}  // namespace sil

#endif  // SILVERSCRIPT_COMPILER_TYPED_ARGS_HPP
