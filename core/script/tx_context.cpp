// ==============================================================================
// Transaction Context - Implementation
// ==============================================================================

#include "tx_context.hpp"
#include "hash.hpp"
#include "error.hpp"

namespace sil {

namespace {

void write_le(Bytes& out, uint64_t value, size_t width) {
    for (size_t i = 0; i < width; i++) {
        out.push_back(static_cast<Byte>((value >> (8 * i)) & 0xFF));
    }
}

void write_var_bytes(Bytes& out, const Bytes& data) {
    write_le(out, data.size(), 8);
    out.insert(out.end(), data.begin(), data.end());
}

}  // namespace

TransactionContext TransactionContext::canonical(const Bytes& locking_script,
                                                 const Bytes& signature_script) {
    TransactionContext tx;

    TxInput input;
    input.previous_outpoint.txid.fill(0x09);
    input.previous_outpoint.index = 0;
    input.signature_script = signature_script;
    input.sequence = 0;
    input.sig_op_count = 8;
    tx.inputs.push_back(input);

    TxOutput output;
    output.value = CANONICAL_AMOUNT;
    output.script_public_key = locking_script;
    tx.outputs.push_back(output);

    tx.utxo.amount = CANONICAL_AMOUNT;
    tx.utxo.script_public_key = locking_script;
    tx.input_index = 0;
    return tx;
}

Bytes TransactionContext::signature_hash(Byte hash_type) const {
    if (hash_type != SIGHASH_ALL) {
        throw ExecutionError(build_error_message(
            "unsupported signature hash type 0x", to_hex(Bytes{hash_type})));
    }
    if (input_index >= inputs.size()) {
        throw ExecutionError(build_error_message(
            "input index ", input_index, " is out of range for ", inputs.size(), " inputs"));
    }

    Bytes preimage;
    write_le(preimage, version, 2);

    write_le(preimage, inputs.size(), 8);
    for (const auto& input : inputs) {
        preimage.insert(preimage.end(), input.previous_outpoint.txid.begin(),
                        input.previous_outpoint.txid.end());
        write_le(preimage, input.previous_outpoint.index, 4);
        write_le(preimage, input.sequence, 8);
        preimage.push_back(input.sig_op_count);
    }

    write_le(preimage, outputs.size(), 8);
    for (const auto& output : outputs) {
        write_le(preimage, output.value, 8);
        write_var_bytes(preimage, output.script_public_key);
    }

    write_le(preimage, lock_time, 8);

    write_le(preimage, utxo.amount, 8);
    write_var_bytes(preimage, utxo.script_public_key);
    write_le(preimage, input_index, 4);
    preimage.push_back(hash_type);

    return sha256(preimage);
}

}  // namespace sil
