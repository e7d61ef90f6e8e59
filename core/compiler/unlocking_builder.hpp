// ==============================================================================
// Unlocking Input Builder
// ==============================================================================
// Serializes the arguments of one entrypoint call into the push-only script
// the engine runs before the locking bytecode:
//
//   [selector]  arg0  arg1 ... argN-1
//
// The selector is present only when the program dispatches between several
// entrypoints. Each argument is pushed with the minimal push for its encoded
// bytes.
// ==============================================================================

#ifndef SILVERSCRIPT_COMPILER_UNLOCKING_BUILDER_HPP
#define SILVERSCRIPT_COMPILER_UNLOCKING_BUILDER_HPP

#include "compiler.hpp"
#include <string>
#include <vector>

namespace sil {

/**
 * @brief Build the unlocking input for a call
 *
 * @param program Compiled contract
 * @param function_name Entrypoint to invoke
 * @param args One literal per parameter, in declaration order
 * @throws InputError if the function is not in the ABI, on an argument
 *         count mismatch, or when an argument does not encode as its type
 */
Bytes build_unlocking_input(const CompiledProgram& program,
                            const std::string& function_name,
                            const std::vector<Expr>& args);

/**
 * @brief Same, starting from raw argument strings
 *
 * Raw strings are parsed with parse_typed_arg() against the declared types.
 */
Bytes build_unlocking_input_raw(const CompiledProgram& program,
                                const std::string& function_name,
                                const std::vector<std::string>& raw_args);

/**
 * @brief Replace secret keys in signature arguments by real signatures
 *
 * A sig or datasig argument whose raw value is a valid 32-byte secret key
 * (hex, "0x" optional) is replaced by a BIP340 signature over the canonical
 * transaction digest for `locking_script` plus the SIGHASH_ALL byte, as
 * "0x" + 130 hex digits. Every other argument is returned unchanged.
 *
 * Signing uses all-zero auxiliary data, so the result is deterministic.
 */
std::vector<std::string> auto_sign_args(const std::vector<AbiParam>& params,
                                        const std::vector<std::string>& raw_args,
                                        const Bytes& locking_script);

}  // namespace sil

#endif  // SILVERSCRIPT_COMPILER_UNLOCKING_BUILDER_HPP
