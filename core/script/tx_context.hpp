// ==============================================================================
// Transaction Context
// ==============================================================================
// The transaction a script is evaluated against. Signature checks hash this
// context, so the debugger and the auto-signer must agree on it exactly:
// both use TransactionContext::canonical().
// ==============================================================================

#ifndef SILVERSCRIPT_SCRIPT_TX_CONTEXT_HPP
#define SILVERSCRIPT_SCRIPT_TX_CONTEXT_HPP

#include "types.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace sil {

// Only SIGHASH_ALL is supported
constexpr Byte SIGHASH_ALL = 0x01;

// Value of the canonical output and of the coin it spends
constexpr uint64_t CANONICAL_AMOUNT = 5000;

struct TxOutpoint {
    std::array<Byte, 32> txid{};
    uint32_t index = 0;
};

struct TxInput {
    TxOutpoint previous_outpoint;
    Bytes signature_script;     // Not covered by the signature hash
    uint64_t sequence = 0;
    Byte sig_op_count = 0;
};

struct TxOutput {
    uint64_t value = 0;
    Bytes script_public_key;
};

/**
 * @brief The coin being spent by the input under evaluation
 */
struct UtxoEntry {
    uint64_t amount = 0;
    Bytes script_public_key;
};

/**
 * @brief A transaction plus the input being verified
 */
struct TransactionContext {
    uint16_t version = 0;
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    uint64_t lock_time = 0;
    UtxoEntry utxo;
    size_t input_index = 0;

    /**
     * @brief The fixed dummy transaction used for debugging
     *
     * One input spending outpoint 0909..09:0 (sequence 0, sig_op_count 8),
     * one output of value 5000 locked by the bytecode, and a spent coin of
     * value 5000 carrying the same bytecode.
     */
    static TransactionContext canonical(const Bytes& locking_script,
                                        const Bytes& signature_script = {});

    /**
     * @brief Digest a signature over this transaction commits to
     *
     * SHA-256 of the serialized transaction without signature scripts,
     * followed by the spent coin, the input index and the hash type.
     *
     * @throws ExecutionError for an unsupported hash type or a bad input index
     */
    Bytes signature_hash(Byte hash_type) const;
};

}  // namespace sil

#endif  // SILVERSCRIPT_SCRIPT_TX_CONTEXT_HPP
