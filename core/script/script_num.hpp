// ==============================================================================
// Script Numbers
// ==============================================================================
// Integers on the script stack are little-endian sign-magnitude byte strings:
// the high bit of the last byte is the sign. Zero is the empty string.
//
// Examples:
//   0    -> []
//   1    -> [0x01]
//   -1   -> [0x81]
//   128  -> [0x80, 0x00]
//   -255 -> [0xff, 0x80]
// ==============================================================================

#ifndef SILVERSCRIPT_SCRIPT_SCRIPT_NUM_HPP
#define SILVERSCRIPT_SCRIPT_SCRIPT_NUM_HPP

#include "types.hpp"
#include <cstdint>
#include <optional>

namespace sil {

// Numeric operands are at most 8 bytes
constexpr size_t MAX_SCRIPT_NUM_LENGTH = 8;

/**
 * @brief Encode an integer in minimal script-number form
 *
 * INT64_MIN has no 8-byte encoding and is rejected by callers before
 * reaching here; it encodes to 9 bytes.
 */
Bytes encode_script_num(int64_t value);

/**
 * @brief Check the minimal-encoding rule
 *
 * The last byte may only be 0x00 or 0x80 when the byte before it has its
 * high bit set.
 */
bool is_minimally_encoded(const Bytes& bytes);

/**
 * @brief Decode a stack item used as a number
 *
 * @throws ExecutionError if the item is longer than max_length or not
 *         minimally encoded
 */
int64_t decode_script_num(const Bytes& bytes, size_t max_length = MAX_SCRIPT_NUM_LENGTH);

/**
 * @brief Non-throwing decode for display purposes
 *
 * @return nullopt if the bytes are not a valid script number
 */
std::optional<int64_t> try_decode_script_num(const Bytes& bytes);

/**
 * @brief Interpret a stack item as a boolean
 *
 * False is any encoding of zero (all zero bytes, optionally with a final
 * 0x80 for negative zero). Everything else is true.
 */
bool cast_to_bool(const Bytes& bytes);

/**
 * @brief Canonical boolean encodings: true = [0x01], false = []
 */
Bytes encode_bool(bool value);

}  // namespace sil

#endif  // SILVERSCRIPT_SCRIPT_SCRIPT_NUM_HPP
