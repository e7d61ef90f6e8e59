// ==============================================================================
// Debug Session
// ==============================================================================
// Source-level debugging wrapper around ScriptEngine. Uses the compiler's
// debug table to translate between locking-script byte offsets and source
// statements, so a contract can be stepped one opcode or one statement at a
// time while variables, stacks and the inlined call chain are rebuilt from
// the engine state.
//
// Both stepping granularities share one primitive, step_opcode(); statement
// stepping repeats it until the next instruction is an executing statement
// boundary.
// ==============================================================================

#ifndef SILVERSCRIPT_DEBUG_DEBUG_SESSION_HPP
#define SILVERSCRIPT_DEBUG_DEBUG_SESSION_HPP

#include "debug_info.hpp"
#include "script_engine.hpp"
#include "value_formatter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sil {

// ==============================================================================
// Session Types
// ==============================================================================

enum class SessionStatus {
    RUNNING,    // Instructions remain
    COMPLETED,  // Every instruction ran and the final checks passed
    FAILED      // The engine reported an error
};

const char* session_status_to_string(SessionStatus status);

struct SessionOptions {
    // Steps after which the session fails instead of continuing
    uint64_t max_steps = 100000;
};

/**
 * @brief Static description of one instruction of the combined program
 */
struct OpcodeMeta {
    size_t index = 0;                   // Position in the combined instruction list
    size_t byte_offset = 0;             // Offset within its own script
    ScriptSegment segment = ScriptSegment::LOCKING;
    std::string display;                // Disassembly, e.g. "OP_DATA_1 0x05"
    std::optional<DebugMapping> mapping;
};

struct StacksSnapshot {
    std::vector<Bytes> main;            // Bottom first
    std::vector<Bytes> alt;             // Bottom first
};

/**
 * @brief Where execution stands right now
 */
struct DebugState {
    size_t pc = 0;
    std::optional<std::string> last_opcode;     // nullopt before the first step
    std::optional<DebugMapping> mapping;        // Mapping of the next instruction
    bool is_executing = true;
};

// ==============================================================================
// Debug Session Class
// ==============================================================================

class DebugSession {
public:
    /**
     * @brief Create a session bound to the canonical debugging transaction
     *
     * @throws ExecutionError if either script is malformed or the unlocking
     *         input is not push-only
     */
    DebugSession(const Bytes& unlocking_script, const Bytes& locking_script,
                 DebugTable debug_info, std::string source,
                 SessionOptions options = {});

    /**
     * @brief Create a session bound to an explicit transaction context
     */
    DebugSession(const Bytes& unlocking_script, const Bytes& locking_script,
                 DebugTable debug_info, std::string source,
                 const TransactionContext& tx, SessionOptions options = {});

    // Back to pc = 0 with the same inputs
    void reset();

    // =========================================================================
    // Execution Control
    // =========================================================================

    /**
     * @brief Execute exactly one instruction
     *
     * @return The instruction just executed, or nullopt once the session is
     *         already completed or failed
     * @throws ExecutionError with the engine message when the instruction
     *         (or the final checks it triggers) fails; the session is then
     *         FAILED and its state points at the failing instruction
     */
    std::optional<OpcodeMeta> step_opcode();

    /**
     * @brief Step until the next instruction begins an executing statement
     *
     * Inlined helper bodies are contiguous in the bytecode, so this steps
     * into helpers without special handling.
     *
     * @return Mapping of the statement now about to run, or nullopt if the
     *         program completed
     * @throws ExecutionError on failure
     */
    std::optional<DebugMapping> step_into();

    /**
     * @brief Skip the unmapped prologue up to the first executing mapped instruction
     *
     * @throws ExecutionError if the program ends or fails first
     */
    void run_to_first_executed_statement();

    // =========================================================================
    // State Inspection
    // =========================================================================

    DebugState state() const;
    SessionStatus status() const { return status_; }
    bool is_executing() const { return status_ == SessionStatus::RUNNING; }
    const std::string& error_message() const { return error_message_; }
    uint64_t steps_taken() const { return steps_; }

    /**
     * @brief Mapping of the next instruction (nullptr if unmapped or finished)
     */
    const DebugMapping* current_mapping() const;

    /**
     * @brief Offset of the next instruction within its script
     *
     * Equals the locking script length once every instruction has run.
     */
    size_t current_byte_offset() const;

    StacksSnapshot stacks_snapshot() const;

    /**
     * @brief Function names of the active inlined frames, outermost first
     */
    std::vector<std::string> call_stack() const;

    /**
     * @brief Description of every instruction, unlocking input first
     */
    std::vector<OpcodeMeta> opcode_metas() const;

    // =========================================================================
    // Variable Inspection
    // =========================================================================

    /**
     * @brief Variables visible at a (sequence, frame) point with their current values
     *
     * Slots above the current stack depth are left out, as are all stack
     * variables while the engine is skipping a branch.
     */
    std::vector<VariableBinding> list_variables_at_sequence(uint32_t sequence,
                                                            uint32_t frame_id) const;

    // Variables at the current mapping; empty while unmapped
    std::vector<VariableBinding> list_variables() const;

    static std::string format_value(const std::string& type_name, const Bytes& raw) {
        return sil::format_value(type_name, raw);
    }

    // =========================================================================
    // Source Access
    // =========================================================================

    const std::string& source() const { return source_; }

    /**
     * @brief Text of a 1-based source line (empty if out of range)
     */
    std::string source_line(LineNumber line) const;

    const DebugTable& debug_info() const { return debug_info_; }
    const ScriptEngine& engine() const { return engine_; }

private:
    ScriptEngine engine_;
    DebugTable debug_info_;
    std::string source_;
    SessionOptions options_;
    size_t locking_size_ = 0;

    SessionStatus status_ = SessionStatus::RUNNING;
    std::string error_message_;
    uint64_t steps_ = 0;

    OpcodeMeta describe(size_t index) const;
    bool at_executing_statement() const;
    [[noreturn]] void fail(const std::string& message);
};

}  // namespace sil

#endif  // SILVERSCRIPT_DEBUG_DEBUG_SESSION_HPP
