// ==============================================================================
// Script Opcodes
// ==============================================================================
// This file defines the instruction set of the script machine. Values follow
// the Bitcoin/Kaspa script encoding so disassembly reads the way contract
// authors expect.
// ==============================================================================

#ifndef SILVERSCRIPT_SCRIPT_OPCODES_HPP
#define SILVERSCRIPT_SCRIPT_OPCODES_HPP

#include "types.hpp"
#include <string>

namespace sil {

// ==============================================================================
// Opcode Values
// ==============================================================================

/**
 * @brief Every opcode the script engine understands
 *
 * Bytes 0x01-0x4b are direct pushes of that many data bytes; they have no
 * named constant here (see is_direct_push).
 */
enum class Opcode : Byte {
    // Constants
    OP_0            = 0x00,
    OP_PUSHDATA1    = 0x4c,
    OP_PUSHDATA2    = 0x4d,
    OP_PUSHDATA4    = 0x4e,
    OP_1NEGATE      = 0x4f,
    OP_1            = 0x51,
    OP_2            = 0x52,
    OP_16           = 0x60,

    // Flow control
    OP_NOP          = 0x61,
    OP_IF           = 0x63,
    OP_NOTIF        = 0x64,
    OP_ELSE         = 0x67,
    OP_ENDIF        = 0x68,
    OP_VERIFY       = 0x69,
    OP_RETURN       = 0x6a,

    // Stack
    OP_TOALTSTACK   = 0x6b,
    OP_FROMALTSTACK = 0x6c,
    OP_2DROP        = 0x6d,
    OP_2DUP         = 0x6e,
    OP_IFDUP        = 0x73,
    OP_DEPTH        = 0x74,
    OP_DROP         = 0x75,
    OP_DUP          = 0x76,
    OP_NIP          = 0x77,
    OP_OVER         = 0x78,
    OP_PICK         = 0x79,
    OP_ROLL         = 0x7a,
    OP_ROT          = 0x7b,
    OP_SWAP         = 0x7c,
    OP_TUCK         = 0x7d,

    // Splice
    OP_CAT          = 0x7e,
    OP_SIZE         = 0x82,

    // Bitwise logic
    OP_EQUAL        = 0x87,
    OP_EQUALVERIFY  = 0x88,

    // Arithmetic
    OP_1ADD         = 0x8b,
    OP_1SUB         = 0x8c,
    OP_NEGATE       = 0x8f,
    OP_ABS          = 0x90,
    OP_NOT          = 0x91,
    OP_0NOTEQUAL    = 0x92,
    OP_ADD          = 0x93,
    OP_SUB          = 0x94,
    OP_MUL          = 0x95,
    OP_DIV          = 0x96,
    OP_MOD          = 0x97,
    OP_BOOLAND      = 0x9a,
    OP_BOOLOR       = 0x9b,
    OP_NUMEQUAL     = 0x9c,
    OP_NUMEQUALVERIFY = 0x9d,
    OP_NUMNOTEQUAL  = 0x9e,
    OP_LESSTHAN     = 0x9f,
    OP_GREATERTHAN  = 0xa0,
    OP_LESSTHANOREQUAL    = 0xa1,
    OP_GREATERTHANOREQUAL = 0xa2,
    OP_MIN          = 0xa3,
    OP_MAX          = 0xa4,
    OP_WITHIN       = 0xa5,

    // Crypto
    OP_SHA256       = 0xa8,
    OP_CHECKSIG     = 0xac,
    OP_CHECKSIGVERIFY = 0xad
};

// Largest direct push (0x01-0x4b)
constexpr Byte MAX_DIRECT_PUSH = 0x4b;

// ==============================================================================
// Opcode Helpers
// ==============================================================================

inline Byte to_byte(Opcode op) { return static_cast<Byte>(op); }

/**
 * @brief Opcode for a small integer constant 1..16
 */
inline Opcode small_int_opcode(int value) {
    return static_cast<Opcode>(to_byte(Opcode::OP_1) + value - 1);
}

/**
 * @brief True for 0x01-0x4b (push the next N bytes)
 */
inline bool is_direct_push(Byte op) {
    return op >= 0x01 && op <= MAX_DIRECT_PUSH;
}

/**
 * @brief True for any opcode that only pushes data
 *
 * Includes OP_0, direct pushes, OP_PUSHDATA1/2/4, OP_1NEGATE and OP_1..OP_16.
 */
inline bool is_push_opcode(Byte op) {
    return op <= to_byte(Opcode::OP_16) && op != 0x50;
}

/**
 * @brief True for opcodes evaluated even inside a non-executing branch
 */
inline bool is_conditional_opcode(Byte op) {
    return op == to_byte(Opcode::OP_IF) || op == to_byte(Opcode::OP_NOTIF) ||
           op == to_byte(Opcode::OP_ELSE) || op == to_byte(Opcode::OP_ENDIF);
}

/**
 * @brief Check whether a byte is an opcode the engine implements
 */
bool is_known_opcode(Byte op);

/**
 * @brief Human-readable opcode name
 *
 * Direct pushes render as "OP_DATA_<n>", unknown bytes as "OP_UNKNOWN_0x..".
 *
 * Example: opcode_to_string(0x76) returns "OP_DUP"
 */
std::string opcode_to_string(Byte op);

}  // namespace sil

#endif  // SILVERSCRIPT_SCRIPT_OPCODES_HPP
