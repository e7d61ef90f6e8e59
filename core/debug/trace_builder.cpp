// ==============================================================================
// Trace Builder - Implementation
// ==============================================================================

#include "trace_builder.hpp"
#include "contract_parser.hpp"
#include "typed_args.hpp"
#include "unlocking_builder.hpp"
#include "schnorr.hpp"
#include "hash.hpp"
#include "error.hpp"
#include <chrono>

namespace sil {

namespace {

// ==============================================================================
// Call Resolution
// ==============================================================================

/**
 * @brief Everything needed to run one call, with arguments settled
 */
struct ResolvedCall {
    CompiledProgram program;
    std::string function_name;
    std::vector<std::string> ctor_args;
    std::vector<std::string> args;
    Bytes unlocking;
};

ContractOutline outline_from_ast(const ContractAst& contract) {
    ContractOutline outline;
    outline.contract_name = contract.name;
    for (const auto& param : contract.params) {
        outline.constructor_params.push_back({param.name, param.type_name});
    }
    outline.functions = entrypoint_signatures(contract);
    outline.without_selector = (outline.functions.size() == 1);
    return outline;
}

std::vector<std::string> type_names_of(const std::vector<AbiParam>& params) {
    std::vector<std::string> names;
    for (const auto& param : params) {
        names.push_back(param.type_name);
    }
    return names;
}

std::vector<Expr> parse_args(const std::vector<AbiParam>& params,
                             const std::vector<std::string>& raw,
                             const std::string& context) {
    std::vector<Expr> exprs;
    for (size_t i = 0; i < params.size(); i++) {
        const std::string& value = i < raw.size() ? raw[i] : std::string();
        try {
            exprs.push_back(parse_typed_arg(params[i].type_name, value));
        } catch (const InputError& e) {
            throw InputError(build_error_message(
                "invalid ", context, " arg #", i, " (", params[i].type_name, " ",
                params[i].name, "): ", e.message()));
        }
    }
    return exprs;
}

ResolvedCall resolve_call(const TraceRequest& request) {
    ContractAst contract = parse_contract(request.source);
    ContractOutline outline = outline_from_ast(contract);
    if (request.expect_no_selector && !outline.without_selector) {
        throw InputError("--no-selector requires exactly one entrypoint function");
    }

    ResolvedCall call;
    call.ctor_args = fill_raw_args(type_names_of(outline.constructor_params),
                                   request.ctor_args, "constructor");
    std::vector<Expr> ctor_exprs = parse_args(outline.constructor_params, call.ctor_args,
                                              "constructor");
    call.program = compile_contract(contract, ctor_exprs, request.compile_options);

    std::string name = trim(request.function_name);
    call.function_name = name.empty() ? call.program.abi.front().name : name;
    const FunctionSignature* signature = call.program.find_function(call.function_name);
    if (!signature) {
        throw InputError("function '" + call.function_name + "' not found");
    }

    std::vector<std::string> filled = fill_raw_args(signature->type_names(), request.args,
                                                    "function '" + call.function_name + "'");
    call.args = auto_sign_args(signature->params, filled, call.program.bytecode);

    std::vector<Expr> exprs = parse_args(signature->params, call.args, "function");
    call.unlocking = build_unlocking_input(call.program, call.function_name, exprs);
    return call;
}

std::optional<size_t> selector_of(const ResolvedCall& call) {
    const FunctionSignature* signature = call.program.find_function(call.function_name);
    if (!signature) {
        return std::nullopt;
    }
    return signature->selector_index;
}

uint64_t unix_time_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// Same position and scope as the previous snapshot
bool same_point(const StepSnapshot& a, const StepSnapshot& b) {
    return a.pc == b.pc && a.byte_offset == b.byte_offset &&
           a.is_executing == b.is_executing && a.sequence == b.sequence &&
           a.frame_id == b.frame_id;
}

// ==============================================================================
// Stepping Loops
// ==============================================================================

std::vector<StepSnapshot> record_opcode_steps(DebugSession& session) {
    std::vector<StepSnapshot> steps;
    steps.push_back(take_snapshot(session, std::nullopt, false));

    while (true) {
        try {
            if (!session.step_opcode()) {
                break;
            }
            steps.push_back(take_snapshot(session, std::nullopt, false));
        } catch (const ExecutionError& e) {
            steps.push_back(take_snapshot(session, e.message(), false));
            break;
        }
    }
    return steps;
}

std::vector<StepSnapshot> record_source_steps(DebugSession& session) {
    std::vector<StepSnapshot> steps;

    try {
        session.run_to_first_executed_statement();
    } catch (const ExecutionError& e) {
        steps.push_back(take_snapshot(session, e.message(), true));
        return steps;
    }
    steps.push_back(take_snapshot(session, std::nullopt, true));

    while (true) {
        try {
            if (session.step_into()) {
                steps.push_back(take_snapshot(session, std::nullopt, true));
                continue;
            }
        } catch (const ExecutionError& e) {
            steps.push_back(take_snapshot(session, e.message(), true));
            break;
        }

        StepSnapshot terminal = take_snapshot(session, std::nullopt, true);
        if (steps.empty() || !same_point(steps.back(), terminal)) {
            steps.push_back(std::move(terminal));
        }
        break;
    }
    return steps;
}

}  // namespace

// ==============================================================================
// Operations
// ==============================================================================

ContractOutline outline_contract(const std::string& source) {
    return outline_from_ast(parse_contract(source));
}

UnlockingResult build_unlocking_from_source(const TraceRequest& request) {
    ResolvedCall call = resolve_call(request);

    UnlockingResult result;
    result.contract_name = call.program.contract_name;
    result.function_name = call.function_name;
    result.selector_index = selector_of(call);
    result.input_hex = to_hex(call.unlocking);
    result.input_len = call.unlocking.size();
    result.without_selector = call.program.without_selector;
    return result;
}

Trace build_trace_from_source(const TraceRequest& request) {
    ResolvedCall call = resolve_call(request);
    const Bytes& bytecode = call.program.bytecode;

    Trace trace;
    trace.source = request.source;

    DebugSession opcode_session(call.unlocking, bytecode, call.program.debug_info,
                                request.source, request.session_options);
    trace.opcodes = opcode_session.opcode_metas();
    trace.opcode_steps = record_opcode_steps(opcode_session);

    DebugSession source_session(call.unlocking, bytecode, call.program.debug_info,
                                request.source, request.session_options);
    trace.source_steps = record_source_steps(source_session);

    TraceMeta& meta = trace.meta;
    meta.contract_name = call.program.contract_name;
    meta.function_name = call.function_name;
    meta.selector_index = selector_of(call);
    meta.ctor_args = call.ctor_args;
    meta.args = call.args;
    meta.without_selector = call.program.without_selector;
    meta.input_hex = to_hex(call.unlocking);
    meta.input_len = call.unlocking.size();
    meta.script_len = bytecode.size();
    meta.opcode_count = trace.opcodes.size();
    meta.opcode_step_count = trace.opcode_steps.size();
    meta.source_step_count = trace.source_steps.size();
    meta.generated_at_unix_ms = unix_time_ms();
    return trace;
}

StepSnapshot take_snapshot(const DebugSession& session,
                           const std::optional<std::string>& error,
                           bool include_call_stack) {
    DebugState state = session.state();

    StepSnapshot snapshot;
    snapshot.pc = state.pc;
    snapshot.byte_offset = session.current_byte_offset();
    snapshot.last_opcode = state.last_opcode;
    snapshot.mapping = state.mapping;

    std::vector<VariableBinding> bindings;
    if (state.mapping) {
        snapshot.sequence = state.mapping->sequence;
        snapshot.frame_id = state.mapping->frame_id;
        snapshot.call_depth = state.mapping->call_depth;
        bindings = session.list_variables_at_sequence(state.mapping->sequence,
                                                      state.mapping->frame_id);
    }
    for (const auto& binding : bindings) {
        snapshot.vars.push_back({binding.name, variable_origin_to_string(binding.origin),
                                 binding.type_name,
                                 DebugSession::format_value(binding.type_name, binding.value)});
    }

    if (include_call_stack) {
        snapshot.call_stack = session.call_stack();
    }
    snapshot.is_executing = session.is_executing();
    snapshot.stacks = session.stacks_snapshot();
    snapshot.error = error;
    return snapshot;
}

GeneratedKeys generate_keys() {
    KeyPair pair = generate_keypair();

    GeneratedKeys keys;
    keys.secret_key_hex = to_hex(pair.secret_key);
    keys.public_key_hex = to_hex(pair.public_key);
    keys.public_key_hash_hex = to_hex(sha256(pair.public_key));
    return keys;
}

}  // namespace sil
