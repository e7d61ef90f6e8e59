// ==============================================================================
// SilverScript Compiler
// ==============================================================================
// Lowers a parsed contract plus concrete constructor arguments into locking
// bytecode and a debug table.
//
// The lowering is a single flattening pass:
// - Constructor parameters are folded into the bytecode as constants
// - Helper functions are inlined at every call site, each instance with its
//   own frame id and call depth
// - Contracts with several entrypoints get a selector dispatch prologue
//
// Stack discipline: every variable owns a fixed slot counted from the bottom
// of the main stack. Reads copy the slot to the top, assignments replace it
// in place, and block-local variables are dropped when their block ends, so
// both arms of an if leave the stack with the same shape.
// ==============================================================================

#ifndef SILVERSCRIPT_COMPILER_COMPILER_HPP
#define SILVERSCRIPT_COMPILER_COMPILER_HPP

#include "ast.hpp"
#include "debug_info.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sil {

// ==============================================================================
// Compiler Output
// ==============================================================================

struct AbiParam {
    std::string name;
    std::string type_name;
};

/**
 * @brief Callable surface of one entrypoint
 *
 * selector_index is nullopt for every function when the contract has a
 * single entrypoint, otherwise 0..N-1 in declaration order.
 */
struct FunctionSignature {
    std::string name;
    std::vector<AbiParam> params;
    std::optional<size_t> selector_index;

    std::vector<std::string> type_names() const;
};

/**
 * @brief Everything produced by one compilation
 */
struct CompiledProgram {
    std::string contract_name;
    Bytes bytecode;
    std::vector<FunctionSignature> abi;
    bool without_selector = false;
    DebugTable debug_info;
    std::vector<AbiParam> constructor_params;

    /**
     * @brief Look up an entrypoint by name (nullptr if absent)
     */
    const FunctionSignature* find_function(const std::string& name) const;
};

// ==============================================================================
// Options
// ==============================================================================

struct CompileOptions {
    // Deepest chain of inlined helper calls accepted
    size_t max_inline_depth = 32;
};

// ==============================================================================
// Entry Points
// ==============================================================================

/**
 * @brief Compile a parsed contract
 *
 * @param contract The syntax tree
 * @param constructor_args One literal per constructor parameter
 * @throws CompileError with the offending span when derivable
 */
CompiledProgram compile_contract(const ContractAst& contract,
                                 const std::vector<Expr>& constructor_args,
                                 const CompileOptions& options = {});

/**
 * @brief Parse and compile source text
 *
 * @throws ParseError with the original point or range
 * @throws CompileError
 */
CompiledProgram compile_source(const std::string& source,
                               const std::vector<Expr>& constructor_args,
                               const CompileOptions& options = {});

/**
 * @brief Signatures of all entrypoints without compiling bodies
 *
 * Used to describe a contract before its constructor arguments are known.
 *
 * @throws CompileError if the contract has no entrypoint
 */
std::vector<FunctionSignature> entrypoint_signatures(const ContractAst& contract);

}  // namespace sil

#endif  // SILVERSCRIPT_COMPILER_COMPILER_HPP
