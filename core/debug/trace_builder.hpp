// ==============================================================================
// Trace Builder
// ==============================================================================
// Glue between source text and the debugger. Each request parses, compiles
// and (for traces) replays one contract call:
//
//   source -> parser -> compiler -> unlocking input -> two debug sessions
//
// The opcode session records one snapshot per instruction, the source
// session one per executed statement. Both sessions are independent and run
// against the same canonical transaction.
// ==============================================================================

#ifndef SILVERSCRIPT_DEBUG_TRACE_BUILDER_HPP
#define SILVERSCRIPT_DEBUG_TRACE_BUILDER_HPP

#include "compiler.hpp"
#include "debug_session.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sil {

// ==============================================================================
// Requests
// ==============================================================================

/**
 * @brief One call of a contract, described by raw strings
 *
 * Missing or blank constructor and function arguments are filled with the
 * default value of their type. An empty function name selects the first
 * entrypoint.
 */
struct TraceRequest {
    std::string source;
    std::string function_name;
    std::vector<std::string> ctor_args;
    std::vector<std::string> args;
    bool expect_no_selector = false;    // Reject contracts with dispatch

    CompileOptions compile_options;
    SessionOptions session_options;
};

// ==============================================================================
// Results
// ==============================================================================

struct ContractOutline {
    std::string contract_name;
    std::vector<AbiParam> constructor_params;
    std::vector<FunctionSignature> functions;
    bool without_selector = false;
};

struct UnlockingResult {
    std::string contract_name;
    std::string function_name;
    std::optional<size_t> selector_index;
    std::string input_hex;
    size_t input_len = 0;
    bool without_selector = false;
};

struct VarSnapshot {
    std::string name;
    std::string origin;     // "const", "arg" or "local"
    std::string type_name;
    std::string value;      // Formatted per type
};

/**
 * @brief Debugger state after one step
 */
struct StepSnapshot {
    size_t pc = 0;
    size_t byte_offset = 0;
    std::optional<std::string> last_opcode;
    std::optional<DebugMapping> mapping;
    std::optional<uint32_t> sequence;
    std::optional<uint32_t> frame_id;
    std::optional<uint32_t> call_depth;
    std::vector<std::string> call_stack;    // Source steps only
    bool is_executing = true;
    StacksSnapshot stacks;
    std::vector<VarSnapshot> vars;
    std::optional<std::string> error;
};

struct TraceMeta {
    std::string contract_name;
    std::string function_name;
    std::optional<size_t> selector_index;
    std::vector<std::string> ctor_args;     // After default-filling
    std::vector<std::string> args;          // After default-filling and signing
    bool without_selector = false;
    std::string input_hex;
    size_t input_len = 0;
    size_t script_len = 0;
    size_t opcode_count = 0;
    size_t opcode_step_count = 0;
    size_t source_step_count = 0;
    uint64_t generated_at_unix_ms = 0;
};

struct Trace {
    TraceMeta meta;
    std::string source;
    std::vector<OpcodeMeta> opcodes;
    std::vector<StepSnapshot> opcode_steps;
    std::vector<StepSnapshot> source_steps;
};

struct GeneratedKeys {
    std::string secret_key_hex;
    std::string public_key_hex;         // x-only, 32 bytes
    std::string public_key_hash_hex;    // SHA-256 of the public key
};

// ==============================================================================
// Operations
// ==============================================================================

/**
 * @brief Name, constructor parameters and entrypoints of a contract
 *
 * @throws ParseError, or CompileError if there is no entrypoint
 */
ContractOutline outline_contract(const std::string& source);

/**
 * @brief Compile and build the unlocking input for one call
 *
 * @throws ParseError, CompileError or InputError
 */
UnlockingResult build_unlocking_from_source(const TraceRequest& request);

/**
 * @brief Compile, build the input and step through the whole call
 *
 * Execution failures do not throw: the failing step carries the message and
 * the trace ends there.
 *
 * @throws ParseError, CompileError or InputError before anything runs
 */
Trace build_trace_from_source(const TraceRequest& request);

/**
 * @brief Capture the session state as a snapshot
 */
StepSnapshot take_snapshot(const DebugSession& session,
                           const std::optional<std::string>& error,
                           bool include_call_stack);

/**
 * @brief Fresh random key pair for use as a test signer
 */
GeneratedKeys generate_keys();

}  // namespace sil

#endif  // SILVERSCRIPT_DEBUG_TRACE_BUILDER_HPP
