// ==============================================================================
// Script Representation
// ==============================================================================
// Building scripts from opcodes and data, and splitting raw script bytes back
// into instructions. The compiler writes scripts with ScriptBuilder; the
// engine and the debugger read them with parse_script.
// ==============================================================================

#ifndef SILVERSCRIPT_SCRIPT_SCRIPT_HPP
#define SILVERSCRIPT_SCRIPT_SCRIPT_HPP

#include "opcodes.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace sil {

// ==============================================================================
// Instructions
// ==============================================================================

/**
 * @brief Which script an instruction belongs to
 *
 * The unlocking input runs first, then the locking bytecode.
 */
enum class ScriptSegment {
    UNLOCKING,
    LOCKING
};

const char* segment_to_string(ScriptSegment segment);

/**
 * @brief One decoded instruction
 *
 * Example: bytes 02 ab cd at offset 5 decode to
 *   Instruction{opcode=0x02, data={0xab,0xcd}, offset=5, size=3}
 */
struct Instruction {
    Byte opcode = 0;
    Bytes data;                 // Pushed bytes (push opcodes only)
    size_t offset = 0;          // Byte offset within its own script
    size_t size = 0;            // Encoded length including the opcode byte
    ScriptSegment segment = ScriptSegment::LOCKING;
};

/**
 * @brief Split raw script bytes into instructions
 *
 * @throws ExecutionError if a push runs past the end of the script
 */
std::vector<Instruction> parse_script(const Bytes& script,
                                      ScriptSegment segment = ScriptSegment::LOCKING);

/**
 * @brief Check that every instruction only pushes data
 */
bool is_push_only(const std::vector<Instruction>& instructions);

/**
 * @brief Check that a push uses the shortest possible encoding
 *
 * Non-push instructions are always minimal.
 */
bool is_minimal_push(const Instruction& instruction);

/**
 * @brief Disassemble one instruction
 *
 * Examples:
 *   "OP_DUP"
 *   "OP_DATA_2 0xabcd"
 */
std::string instruction_to_string(const Instruction& instruction);

// ==============================================================================
// Script Builder
// ==============================================================================

/**
 * @brief Appends opcodes and minimally-encoded pushes to a script
 *
 * Usage:
 *   ScriptBuilder builder;
 *   builder.add_int(5).add_op(Opcode::OP_ADD);
 *   Bytes script = builder.script();
 */
class ScriptBuilder {
public:
    ScriptBuilder& add_op(Opcode op);

    /**
     * @brief Push data using the shortest encoding
     *
     * Empty data becomes OP_0, a single byte 1..16 becomes OP_1..OP_16,
     * 0x81 becomes OP_1NEGATE, otherwise a direct push or OP_PUSHDATA.
     */
    ScriptBuilder& add_data(const Bytes& data);

    /**
     * @brief Push an integer as a script number
     */
    ScriptBuilder& add_int(int64_t value);

    /**
     * @brief Current length, which is also the offset of the next instruction
     */
    size_t size() const { return script_.size(); }

    const Bytes& script() const { return script_; }

private:
    Bytes script_;
};

}  // namespace sil

#endif  // SILVERSCRIPT_SCRIPT_SCRIPT_HPP
