// ==============================================================================
// Value Formatter
// ==============================================================================
// Renders raw stack bytes as human-readable values using the declared type
// from the debug table. Display only: malformed bytes produce a placeholder,
// never an exception.
// ==============================================================================

#ifndef SILVERSCRIPT_DEBUG_VALUE_FORMATTER_HPP
#define SILVERSCRIPT_DEBUG_VALUE_FORMATTER_HPP

#include "debug_info.hpp"
#include <string>
#include <vector>

namespace sil {

/**
 * @brief A variable resolved to its current raw value
 */
struct VariableBinding {
    std::string name;
    VariableOrigin origin = VariableOrigin::LOCAL;
    std::string type_name;
    Bytes value;
};

/**
 * @brief Decode raw bytes per declared type
 *
 * Examples:
 *   format_value("int", {0x05})        -> "5"
 *   format_value("int", {0x81})        -> "-1"
 *   format_value("bool", {})           -> "false"
 *   format_value("bytes4", {0,0,0,0})  -> "0x00000000"
 *   format_value("string", "hi")       -> "\"hi\""
 *   format_value("int", 9 bytes)       -> "<invalid int 0x...>"
 */
std::string format_value(const std::string& type_name, const Bytes& raw);

/**
 * @brief Untyped rendering of a stack item: "0x..." or "0x" when empty
 */
std::string format_stack_item(const Bytes& item);

/**
 * @brief One-line rendering: "local int y = 3"
 */
std::string format_binding(const VariableBinding& binding);

/**
 * @brief Bottom-first stack rendering: "[0x01, 0x02]"
 */
std::string format_stack(const std::vector<Bytes>& stack);

}  // namespace sil

#endif  // SILVERSCRIPT_DEBUG_VALUE_FORMATTER_HPP
