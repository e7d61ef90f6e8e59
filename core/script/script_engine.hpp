// ==============================================================================
// Script Execution Engine
// ==============================================================================
// The script engine interprets one instruction at a time. It:
// - Loads an unlocking input and a locking script for one transaction input
// - Runs the unlocking input (push-only) and then the locking script
// - Visits every instruction exactly once: inside a branch that is not taken,
//   only OP_IF/OP_NOTIF/OP_ELSE/OP_ENDIF are interpreted, the rest skipped
// - Exposes its state (pc, stacks, last opcode) for the debugger
//
// There are no jumps, so the number of steps always equals the number of
// instructions.
// ==============================================================================

#ifndef SILVERSCRIPT_SCRIPT_SCRIPT_ENGINE_HPP
#define SILVERSCRIPT_SCRIPT_SCRIPT_ENGINE_HPP

#include "script.hpp"
#include "tx_context.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sil {

// Largest stack item
constexpr size_t MAX_SCRIPT_ELEMENT_SIZE = 520;

// Combined main + alt stack depth limit
constexpr size_t MAX_STACK_SIZE = 1000;

// ==============================================================================
// Execution State
// ==============================================================================

/**
 * @brief Current state of the script engine
 */
enum class EngineState {
    READY,      // Scripts loaded, nothing executed yet
    PAUSED,     // Between steps
    HALTED,     // All instructions executed and the final checks passed
    ERROR       // An instruction or the final checks failed
};

const char* engine_state_to_string(EngineState state);

/**
 * @brief Execution statistics
 */
struct EngineStats {
    uint64_t instructions_executed = 0;  // Instructions that ran
    uint64_t instructions_skipped = 0;   // Instructions in branches not taken
    uint64_t push_count = 0;             // Data pushes executed
    uint64_t sig_checks = 0;             // OP_CHECKSIG(VERIFY) evaluations

    void reset() {
        instructions_executed = 0;
        instructions_skipped = 0;
        push_count = 0;
        sig_checks = 0;
    }
};

// ==============================================================================
// Script Engine Class
// ==============================================================================

/**
 * @brief The script execution engine
 *
 * Basic usage:
 *   ScriptEngine engine;
 *   engine.load(unlocking, locking, TransactionContext::canonical(locking));
 *   EngineState result = engine.run();
 *
 * Debugging usage:
 *   engine.step();                      // Execute one instruction
 *   auto stack = engine.get_stack();    // Inspect state
 */
class ScriptEngine {
public:
    ScriptEngine();

    // =========================================================================
    // Program Loading
    // =========================================================================

    /**
     * @brief Load both scripts and bind them to a transaction
     *
     * @throws ExecutionError if either script is malformed or the unlocking
     *         input contains anything other than pushes
     */
    void load(const Bytes& unlocking_script, const Bytes& locking_script,
              const TransactionContext& tx);

    /**
     * @brief Reset to the state right after load()
     */
    void reset();

    // =========================================================================
    // Execution Control
    // =========================================================================

    /**
     * @brief Run until halt or error
     */
    EngineState run();

    /**
     * @brief Execute (or skip) a single instruction
     *
     * Errors never escape: they move the engine to ERROR with a message.
     *
     * @return New state after execution
     */
    EngineState step();

    EngineState get_state() const { return state_; }

    /**
     * @brief True once HALTED or ERROR
     */
    bool is_finished() const {
        return state_ == EngineState::HALTED || state_ == EngineState::ERROR;
    }

    // =========================================================================
    // State Inspection
    // =========================================================================

    /**
     * @brief Index of the next instruction to execute
     *
     * Counts across both scripts: unlocking instructions come first.
     * Equals get_instruction_count() once everything ran. After an error it
     * stays on the failing instruction.
     */
    size_t get_pc() const { return pc_; }

    const Instruction* get_instruction(size_t index) const;
    const Instruction* get_current_instruction() const { return get_instruction(pc_); }
    size_t get_instruction_count() const { return instructions_.size(); }
    const std::vector<Instruction>& instructions() const { return instructions_; }

    /**
     * @brief Opcode of the most recent instruction executed (nullopt before the first step)
     */
    std::optional<Byte> last_opcode() const { return last_opcode_; }

    /**
     * @brief True when every enclosing OP_IF/OP_ELSE branch is taken
     *
     * This is the state the next instruction would run under.
     */
    bool is_branch_executing() const;

    /**
     * @brief Main stack, bottom first
     */
    const std::vector<Bytes>& get_stack() const { return stack_; }

    /**
     * @brief Auxiliary stack, bottom first
     */
    const std::vector<Bytes>& get_alt_stack() const { return alt_stack_; }

    const EngineStats& get_stats() const { return stats_; }

    const TransactionContext& tx() const { return tx_; }

    // =========================================================================
    // Error Information
    // =========================================================================

    /**
     * @brief Get last error message (if state is ERROR)
     */
    const std::string& get_error_message() const { return error_message_; }

    /**
     * @brief Get the instruction index where the error occurred
     */
    size_t get_error_location() const { return error_location_; }

private:
    // Entries of the conditional stack
    enum class Cond {
        TRUE_BRANCH,    // Branch taken
        FALSE_BRANCH,   // Branch not taken (may flip at OP_ELSE)
        SKIP            // Nested inside a branch not taken
    };

    // =========================================================================
    // Internal State
    // =========================================================================

    std::vector<Instruction> instructions_;
    size_t unlocking_count_ = 0;    // Leading instructions from the unlocking input
    TransactionContext tx_;

    size_t pc_ = 0;
    EngineState state_ = EngineState::READY;
    std::optional<Byte> last_opcode_;
    EngineStats stats_;

    std::vector<Bytes> stack_;
    std::vector<Bytes> alt_stack_;
    std::vector<Cond> cond_stack_;

    std::string error_message_;
    size_t error_location_ = 0;

    // =========================================================================
    // Execution Helpers
    // =========================================================================

    /**
     * @brief Execute the instruction at pc_ (throws on failure)
     */
    void execute_instruction(const Instruction& ins);

    void execute_conditional(const Instruction& ins);
    void execute_push(const Instruction& ins);
    void execute_stack_op(Opcode op);
    void execute_numeric_op(Opcode op);
    void execute_crypto_op(Opcode op);

    /**
     * @brief Checks run when crossing from the unlocking input to the locking script
     */
    void finish_unlocking_script();

    /**
     * @brief Checks run after the last instruction (balanced branches, clean stack)
     */
    void finish_execution();

    // Stack primitives
    Bytes pop();
    int64_t pop_num();
    bool pop_bool();
    void push(Bytes item);
    void push_num(int64_t value);
    void push_bool(bool value);
    const Bytes& peek(size_t depth = 0) const;
    void require_depth(size_t depth, Opcode op) const;
};

}  // namespace sil

#endif  // SILVERSCRIPT_SCRIPT_SCRIPT_ENGINE_HPP
