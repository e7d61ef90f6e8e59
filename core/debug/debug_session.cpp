// ==============================================================================
// Debug Session - Implementation
// ==============================================================================

#include "debug_session.hpp"
#include "opcodes.hpp"
#include "error.hpp"
#include <sstream>

namespace sil {

const char* session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::RUNNING:   return "running";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::FAILED:    return "failed";
        default:                       return "unknown";
    }
}

DebugSession::DebugSession(const Bytes& unlocking_script, const Bytes& locking_script,
                           DebugTable debug_info, std::string source,
                           SessionOptions options)
    : DebugSession(unlocking_script, locking_script, std::move(debug_info), std::move(source),
                   TransactionContext::canonical(locking_script, unlocking_script), options)
{}

DebugSession::DebugSession(const Bytes& unlocking_script, const Bytes& locking_script,
                           DebugTable debug_info, std::string source,
                           const TransactionContext& tx, SessionOptions options)
    : debug_info_(std::move(debug_info))
    , source_(std::move(source))
    , options_(options)
    , locking_size_(locking_script.size())
{
    engine_.load(unlocking_script, locking_script, tx);
}

void DebugSession::reset() {
    engine_.reset();
    status_ = SessionStatus::RUNNING;
    error_message_.clear();
    steps_ = 0;
}

// ==============================================================================
// Execution Control
// ==============================================================================

std::optional<OpcodeMeta> DebugSession::step_opcode() {
    if (status_ != SessionStatus::RUNNING) {
        return std::nullopt;
    }
    if (steps_ >= options_.max_steps) {
        fail(build_error_message("step limit of ", options_.max_steps, " exceeded"));
    }

    // An empty program has no instruction to describe, only the final checks
    std::optional<OpcodeMeta> meta;
    if (engine_.get_current_instruction()) {
        meta = describe(engine_.get_pc());
    }
    EngineState result = engine_.step();
    steps_++;

    if (result == EngineState::ERROR) {
        fail(engine_.get_error_message());
    }
    if (result == EngineState::HALTED) {
        status_ = SessionStatus::COMPLETED;
    }
    return meta;
}

std::optional<DebugMapping> DebugSession::step_into() {
    if (status_ != SessionStatus::RUNNING) {
        return std::nullopt;
    }

    // Always make progress, then stop in front of the next live statement
    do {
        step_opcode();
        if (status_ != SessionStatus::RUNNING) {
            return std::nullopt;
        }
    } while (!at_executing_statement());

    return *current_mapping();
}

void DebugSession::run_to_first_executed_statement() {
    while (status_ == SessionStatus::RUNNING) {
        if (current_mapping() && engine_.is_branch_executing()) {
            return;
        }
        step_opcode();
    }

    if (status_ == SessionStatus::FAILED) {
        throw ExecutionError(error_message_);
    }
    throw ExecutionError("program finished before reaching a source statement");
}

bool DebugSession::at_executing_statement() const {
    const DebugMapping* mapping = current_mapping();
    return mapping && mapping->statement_boundary && engine_.is_branch_executing();
}

void DebugSession::fail(const std::string& message) {
    status_ = SessionStatus::FAILED;
    error_message_ = message;
    throw ExecutionError(message);
}

// ==============================================================================
// State Inspection
// ==============================================================================

DebugState DebugSession::state() const {
    DebugState state;
    state.pc = engine_.get_pc();
    if (auto op = engine_.last_opcode()) {
        state.last_opcode = opcode_to_string(*op);
    }
    if (const DebugMapping* mapping = current_mapping()) {
        state.mapping = *mapping;
    }
    state.is_executing = is_executing();
    return state;
}

const DebugMapping* DebugSession::current_mapping() const {
    const Instruction* ins = engine_.get_current_instruction();
    if (!ins || ins->segment != ScriptSegment::LOCKING) {
        return nullptr;
    }
    return debug_info_.get_mapping_for_offset(ins->offset);
}

size_t DebugSession::current_byte_offset() const {
    const Instruction* ins = engine_.get_current_instruction();
    return ins ? ins->offset : locking_size_;
}

StacksSnapshot DebugSession::stacks_snapshot() const {
    StacksSnapshot snapshot;
    snapshot.main = engine_.get_stack();
    snapshot.alt = engine_.get_alt_stack();
    return snapshot;
}

std::vector<std::string> DebugSession::call_stack() const {
    const DebugMapping* mapping = current_mapping();
    if (!mapping) {
        return {};
    }
    return debug_info_.frame_chain(mapping->frame_id, mapping->sequence);
}

std::vector<OpcodeMeta> DebugSession::opcode_metas() const {
    std::vector<OpcodeMeta> metas;
    metas.reserve(engine_.get_instruction_count());
    for (size_t i = 0; i < engine_.get_instruction_count(); i++) {
        metas.push_back(describe(i));
    }
    return metas;
}

OpcodeMeta DebugSession::describe(size_t index) const {
    const Instruction* ins = engine_.get_instruction(index);
    if (!ins) {
        throw InternalError(build_error_message("no instruction at index ", index));
    }

    OpcodeMeta meta;
    meta.index = index;
    meta.byte_offset = ins->offset;
    meta.segment = ins->segment;
    meta.display = instruction_to_string(*ins);
    if (ins->segment == ScriptSegment::LOCKING) {
        if (const DebugMapping* mapping = debug_info_.get_mapping_for_offset(ins->offset)) {
            meta.mapping = *mapping;
        }
    }
    return meta;
}

// ==============================================================================
// Variable Inspection
// ==============================================================================

std::vector<VariableBinding> DebugSession::list_variables_at_sequence(uint32_t sequence,
                                                                      uint32_t frame_id) const {
    const auto& stack = engine_.get_stack();
    std::vector<VariableBinding> bindings;

    // Inside a skipped branch the slots hold whatever the taken path left there
    bool live_slots = engine_.is_branch_executing();

    for (const DebugVariable* variable : debug_info_.visible_variables(sequence, frame_id)) {
        VariableBinding binding;
        binding.name = variable->name;
        binding.origin = variable->origin;
        binding.type_name = variable->type_name;

        if (variable->origin == VariableOrigin::CONSTANT) {
            binding.value = variable->constant_value;
        } else if (live_slots && variable->stack_slot && *variable->stack_slot < stack.size()) {
            binding.value = stack[*variable->stack_slot];
        } else {
            continue;
        }
        bindings.push_back(std::move(binding));
    }

    return bindings;
}

std::vector<VariableBinding> DebugSession::list_variables() const {
    const DebugMapping* mapping = current_mapping();
    if (!mapping) {
        return {};
    }
    return list_variables_at_sequence(mapping->sequence, mapping->frame_id);
}

// ==============================================================================
// Source Access
// ==============================================================================

std::string DebugSession::source_line(LineNumber line) const {
    if (line == 0) {
        return "";
    }
    std::istringstream stream(source_);
    std::string text;
    for (LineNumber current = 1; std::getline(stream, text); current++) {
        if (current == line) {
            return text;
        }
    }
    return "";
}

}  // namespace sil
