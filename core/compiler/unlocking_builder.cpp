// ==============================================================================
// Unlocking Input Builder - Implementation
// ==============================================================================

#include "unlocking_builder.hpp"
#include "typed_args.hpp"
#include "script.hpp"
#include "tx_context.hpp"
#include "schnorr.hpp"
#include "error.hpp"

namespace sil {

namespace {

const FunctionSignature& require_function(const CompiledProgram& program,
                                          const std::string& function_name) {
    const FunctionSignature* signature = program.find_function(function_name);
    if (!signature) {
        throw InputError("function '" + function_name + "' not found");
    }
    return *signature;
}

bool is_signature_param(const AbiParam& param) {
    return param.type_name == "sig" || param.type_name == "datasig";
}

}  // namespace

Bytes build_unlocking_input(const CompiledProgram& program,
                            const std::string& function_name,
                            const std::vector<Expr>& args) {
    const FunctionSignature& signature = require_function(program, function_name);

    if (args.size() != signature.params.size()) {
        throw InputError(build_error_message(
            "function '", function_name, "' expects ", signature.params.size(),
            " arguments, got ", args.size()));
    }

    ScriptBuilder builder;
    if (!program.without_selector) {
        if (!signature.selector_index) {
            throw InternalError("entrypoint '" + function_name + "' has no selector index");
        }
        builder.add_int(static_cast<int64_t>(*signature.selector_index));
    }

    for (size_t i = 0; i < args.size(); i++) {
        const AbiParam& param = signature.params[i];
        auto type = parse_type_name(param.type_name);
        if (!type) {
            throw InputError("unknown type '" + param.type_name + "'");
        }
        try {
            builder.add_data(encode_typed_value(*type, args[i]));
        } catch (const InputError& e) {
            throw InputError("argument '" + param.name + "' of '" + function_name + "': " +
                             e.message());
        }
    }

    return builder.script();
}

Bytes build_unlocking_input_raw(const CompiledProgram& program,
                                const std::string& function_name,
                                const std::vector<std::string>& raw_args) {
    const FunctionSignature& signature = require_function(program, function_name);
    std::vector<Expr> args = parse_typed_args(signature.type_names(), raw_args,
                                              "function '" + function_name + "'");
    return build_unlocking_input(program, function_name, args);
}

std::vector<std::string> auto_sign_args(const std::vector<AbiParam>& params,
                                        const std::vector<std::string>& raw_args,
                                        const Bytes& locking_script) {
    std::vector<std::string> signed_args = raw_args;
    Bytes digest;

    for (size_t i = 0; i < params.size() && i < raw_args.size(); i++) {
        if (!is_signature_param(params[i])) {
            continue;
        }
        auto key = from_hex(trim(raw_args[i]));
        if (!key || key->size() != SECRET_KEY_SIZE || !is_valid_secret_key(*key)) {
            continue;
        }

        // The digest does not cover the unlocking input, so it can be taken
        // before that input exists
        if (digest.empty()) {
            digest = TransactionContext::canonical(locking_script).signature_hash(SIGHASH_ALL);
        }

        Bytes signature = schnorr_sign(digest, *key);
        signature.push_back(SIGHASH_ALL);
        signed_args[i] = "0x" + to_hex(signature);
    }

    return signed_args;
}

}  // namespace sil
