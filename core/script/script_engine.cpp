// ==============================================================================
// Script Execution Engine Implementation
// ==============================================================================
// Executes scripts one instruction at a time, dispatching opcodes to the
// stack, numeric and crypto handlers.
// ==============================================================================

#include "script_engine.hpp"
#include "script_num.hpp"
#include "hash.hpp"
#include "schnorr.hpp"
#include "error.hpp"
#include <algorithm>
#include <limits>

namespace sil {

namespace {

constexpr int64_t MAX_NUM = std::numeric_limits<int64_t>::max();

[[noreturn]] void throw_overflow(Opcode op) {
    throw ExecutionError(opcode_to_string(to_byte(op)) + " result does not fit in 8 bytes");
}

// Operands are always in [-MAX_NUM, MAX_NUM]; results must stay there too
int64_t checked_add(int64_t a, int64_t b, Opcode op) {
    if ((b > 0 && a > MAX_NUM - b) || (b < 0 && a < -MAX_NUM - b)) {
        throw_overflow(op);
    }
    return a + b;
}

int64_t checked_mul(int64_t a, int64_t b, Opcode op) {
    if (a == 0 || b == 0) {
        return 0;
    }
    int64_t abs_a = a < 0 ? -a : a;
    int64_t abs_b = b < 0 ? -b : b;
    if (abs_a > MAX_NUM / abs_b) {
        throw_overflow(op);
    }
    return a * b;
}

}  // namespace

const char* engine_state_to_string(EngineState state) {
    switch (state) {
        case EngineState::READY:  return "ready";
        case EngineState::PAUSED: return "paused";
        case EngineState::HALTED: return "halted";
        case EngineState::ERROR:  return "error";
        default:                  return "unknown";
    }
}

// ==============================================================================
// Constructor
// ==============================================================================

ScriptEngine::ScriptEngine() = default;

// ==============================================================================
// Program Loading
// ==============================================================================

void ScriptEngine::load(const Bytes& unlocking_script, const Bytes& locking_script,
                        const TransactionContext& tx) {
    std::vector<Instruction> unlocking = parse_script(unlocking_script, ScriptSegment::UNLOCKING);
    if (!is_push_only(unlocking)) {
        throw ExecutionError("signature script is not push only");
    }
    std::vector<Instruction> locking = parse_script(locking_script, ScriptSegment::LOCKING);

    instructions_ = std::move(unlocking);
    unlocking_count_ = instructions_.size();
    instructions_.insert(instructions_.end(),
                         std::make_move_iterator(locking.begin()),
                         std::make_move_iterator(locking.end()));
    tx_ = tx;
    reset();
}

void ScriptEngine::reset() {
    pc_ = 0;
    state_ = EngineState::READY;
    last_opcode_.reset();
    stats_.reset();
    stack_.clear();
    alt_stack_.clear();
    cond_stack_.clear();
    error_message_.clear();
    error_location_ = 0;
}

// ==============================================================================
// Execution Control
// ==============================================================================

EngineState ScriptEngine::run() {
    while (!is_finished()) {
        step();
    }
    return state_;
}

EngineState ScriptEngine::step() {
    if (is_finished()) {
        return state_;
    }

    try {
        if (pc_ < instructions_.size()) {
            const Instruction& ins = instructions_[pc_];
            last_opcode_ = ins.opcode;
            execute_instruction(ins);
            pc_++;

            if (pc_ == unlocking_count_ && pc_ < instructions_.size()) {
                finish_unlocking_script();
            }
        }

        if (pc_ >= instructions_.size()) {
            finish_execution();
            state_ = EngineState::HALTED;
        } else {
            state_ = EngineState::PAUSED;
        }

    } catch (const ExecutionError& e) {
        error_message_ = e.message();
        error_location_ = pc_;
        state_ = EngineState::ERROR;
    } catch (const SilError& e) {
        error_message_ = e.what();
        error_location_ = pc_;
        state_ = EngineState::ERROR;
    } catch (const std::exception& e) {
        error_message_ = std::string("Unexpected error: ") + e.what();
        error_location_ = pc_;
        state_ = EngineState::ERROR;
    }

    return state_;
}

// ==============================================================================
// State Inspection
// ==============================================================================

const Instruction* ScriptEngine::get_instruction(size_t index) const {
    if (index >= instructions_.size()) {
        return nullptr;
    }
    return &instructions_[index];
}

bool ScriptEngine::is_branch_executing() const {
    return std::all_of(cond_stack_.begin(), cond_stack_.end(),
                       [](Cond c) { return c == Cond::TRUE_BRANCH; });
}

// ==============================================================================
// Execution Helpers
// ==============================================================================

void ScriptEngine::execute_instruction(const Instruction& ins) {
    if (is_conditional_opcode(ins.opcode)) {
        execute_conditional(ins);
        stats_.instructions_executed++;
        return;
    }

    if (!is_branch_executing()) {
        stats_.instructions_skipped++;
        return;
    }

    if (is_push_opcode(ins.opcode)) {
        execute_push(ins);
        stats_.instructions_executed++;
        return;
    }

    Opcode op = static_cast<Opcode>(ins.opcode);
    switch (op) {
        case Opcode::OP_NOP:
            break;

        case Opcode::OP_VERIFY:
            require_depth(1, op);
            if (!pop_bool()) {
                throw ExecutionError("OP_VERIFY failed: top stack item is false");
            }
            break;

        case Opcode::OP_RETURN:
            throw ExecutionError("script returned early (OP_RETURN)");

        case Opcode::OP_TOALTSTACK:
        case Opcode::OP_FROMALTSTACK:
        case Opcode::OP_2DROP:
        case Opcode::OP_2DUP:
        case Opcode::OP_IFDUP:
        case Opcode::OP_DEPTH:
        case Opcode::OP_DROP:
        case Opcode::OP_DUP:
        case Opcode::OP_NIP:
        case Opcode::OP_OVER:
        case Opcode::OP_PICK:
        case Opcode::OP_ROLL:
        case Opcode::OP_ROT:
        case Opcode::OP_SWAP:
        case Opcode::OP_TUCK:
        case Opcode::OP_CAT:
        case Opcode::OP_SIZE:
        case Opcode::OP_EQUAL:
        case Opcode::OP_EQUALVERIFY:
            execute_stack_op(op);
            break;

        case Opcode::OP_1ADD:
        case Opcode::OP_1SUB:
        case Opcode::OP_NEGATE:
        case Opcode::OP_ABS:
        case Opcode::OP_NOT:
        case Opcode::OP_0NOTEQUAL:
        case Opcode::OP_ADD:
        case Opcode::OP_SUB:
        case Opcode::OP_MUL:
        case Opcode::OP_DIV:
        case Opcode::OP_MOD:
        case Opcode::OP_BOOLAND:
        case Opcode::OP_BOOLOR:
        case Opcode::OP_NUMEQUAL:
        case Opcode::OP_NUMEQUALVERIFY:
        case Opcode::OP_NUMNOTEQUAL:
        case Opcode::OP_LESSTHAN:
        case Opcode::OP_GREATERTHAN:
        case Opcode::OP_LESSTHANOREQUAL:
        case Opcode::OP_GREATERTHANOREQUAL:
        case Opcode::OP_MIN:
        case Opcode::OP_MAX:
        case Opcode::OP_WITHIN:
            execute_numeric_op(op);
            break;

        case Opcode::OP_SHA256:
        case Opcode::OP_CHECKSIG:
        case Opcode::OP_CHECKSIGVERIFY:
            execute_crypto_op(op);
            break;

        default:
            throw ExecutionError("attempt to execute invalid opcode " +
                                 opcode_to_string(ins.opcode));
    }

    stats_.instructions_executed++;
}

void ScriptEngine::execute_conditional(const Instruction& ins) {
    Opcode op = static_cast<Opcode>(ins.opcode);

    switch (op) {
        case Opcode::OP_IF:
        case Opcode::OP_NOTIF: {
            Cond cond = Cond::SKIP;
            if (is_branch_executing()) {
                require_depth(1, op);
                Bytes top = pop();
                // Condition must be exactly true (0x01) or false (empty)
                if (top.size() > 1 || (top.size() == 1 && top[0] != 0x01)) {
                    throw ExecutionError(opcode_to_string(ins.opcode) +
                                         " argument must be empty or 0x01, got 0x" + to_hex(top));
                }
                bool taken = !top.empty();
                if (op == Opcode::OP_NOTIF) {
                    taken = !taken;
                }
                cond = taken ? Cond::TRUE_BRANCH : Cond::FALSE_BRANCH;
            }
            cond_stack_.push_back(cond);
            break;
        }

        case Opcode::OP_ELSE:
            if (cond_stack_.empty()) {
                throw ExecutionError("encountered OP_ELSE with no matching OP_IF");
            }
            if (cond_stack_.back() == Cond::TRUE_BRANCH) {
                cond_stack_.back() = Cond::FALSE_BRANCH;
            } else if (cond_stack_.back() == Cond::FALSE_BRANCH) {
                cond_stack_.back() = Cond::TRUE_BRANCH;
            }
            break;

        case Opcode::OP_ENDIF:
            if (cond_stack_.empty()) {
                throw ExecutionError("encountered OP_ENDIF with no matching OP_IF");
            }
            cond_stack_.pop_back();
            break;

        default:
            throw InternalError("non-conditional opcode routed to execute_conditional");
    }
}

void ScriptEngine::execute_push(const Instruction& ins) {
    stats_.push_count++;

    if (!is_minimal_push(ins)) {
        throw ExecutionError("data push of " + std::to_string(ins.data.size()) +
                             " bytes does not use the smallest encoding");
    }

    if (ins.opcode == to_byte(Opcode::OP_1NEGATE)) {
        push_num(-1);
    } else if (ins.opcode >= to_byte(Opcode::OP_1) && ins.opcode <= to_byte(Opcode::OP_16)) {
        push_num(ins.opcode - to_byte(Opcode::OP_1) + 1);
    } else {
        push(ins.data);
    }
}

void ScriptEngine::execute_stack_op(Opcode op) {
    switch (op) {
        case Opcode::OP_TOALTSTACK:
            require_depth(1, op);
            alt_stack_.push_back(pop());
            break;

        case Opcode::OP_FROMALTSTACK:
            if (alt_stack_.empty()) {
                throw ExecutionError("OP_FROMALTSTACK requires an item on the alt stack");
            }
            push(alt_stack_.back());
            alt_stack_.pop_back();
            break;

        case Opcode::OP_2DROP:
            require_depth(2, op);
            pop();
            pop();
            break;

        case Opcode::OP_2DUP: {
            require_depth(2, op);
            Bytes a = peek(1);
            Bytes b = peek(0);
            push(a);
            push(b);
            break;
        }

        case Opcode::OP_IFDUP:
            require_depth(1, op);
            if (cast_to_bool(peek())) {
                push(peek());
            }
            break;

        case Opcode::OP_DEPTH:
            push_num(static_cast<int64_t>(stack_.size()));
            break;

        case Opcode::OP_DROP:
            require_depth(1, op);
            pop();
            break;

        case Opcode::OP_DUP:
            require_depth(1, op);
            push(peek());
            break;

        case Opcode::OP_NIP:
            require_depth(2, op);
            stack_.erase(stack_.end() - 2);
            break;

        case Opcode::OP_OVER:
            require_depth(2, op);
            push(peek(1));
            break;

        case Opcode::OP_PICK:
        case Opcode::OP_ROLL: {
            require_depth(1, op);
            int64_t n = pop_num();
            if (n < 0 || static_cast<size_t>(n) >= stack_.size()) {
                throw ExecutionError(build_error_message(
                    opcode_to_string(to_byte(op)), " index ", n,
                    " is invalid for stack size ", stack_.size()));
            }
            auto it = stack_.end() - 1 - n;
            Bytes item = *it;
            if (op == Opcode::OP_ROLL) {
                stack_.erase(it);
            }
            push(std::move(item));
            break;
        }

        case Opcode::OP_ROT: {
            // x1 x2 x3 -> x2 x3 x1
            require_depth(3, op);
            auto it = stack_.end() - 3;
            Bytes item = *it;
            stack_.erase(it);
            push(std::move(item));
            break;
        }

        case Opcode::OP_SWAP:
            require_depth(2, op);
            std::swap(stack_[stack_.size() - 1], stack_[stack_.size() - 2]);
            break;

        case Opcode::OP_TUCK: {
            // x1 x2 -> x2 x1 x2
            require_depth(2, op);
            Bytes top = peek();
            stack_.insert(stack_.end() - 2, top);
            break;
        }

        case Opcode::OP_CAT: {
            require_depth(2, op);
            Bytes b = pop();
            Bytes a = pop();
            if (a.size() + b.size() > MAX_SCRIPT_ELEMENT_SIZE) {
                throw ExecutionError(build_error_message(
                    "OP_CAT result of ", a.size() + b.size(),
                    " bytes exceeds the max element size of ", MAX_SCRIPT_ELEMENT_SIZE));
            }
            a.insert(a.end(), b.begin(), b.end());
            push(std::move(a));
            break;
        }

        case Opcode::OP_SIZE:
            require_depth(1, op);
            push_num(static_cast<int64_t>(peek().size()));
            break;

        case Opcode::OP_EQUAL:
        case Opcode::OP_EQUALVERIFY: {
            require_depth(2, op);
            Bytes b = pop();
            Bytes a = pop();
            bool equal = (a == b);
            if (op == Opcode::OP_EQUALVERIFY) {
                if (!equal) {
                    throw ExecutionError("OP_EQUALVERIFY failed: 0x" + to_hex(a) +
                                         " != 0x" + to_hex(b));
                }
            } else {
                push_bool(equal);
            }
            break;
        }

        default:
            throw InternalError("opcode routed to the wrong handler: " +
                                opcode_to_string(to_byte(op)));
    }
}

void ScriptEngine::execute_numeric_op(Opcode op) {
    switch (op) {
        case Opcode::OP_1ADD:
        case Opcode::OP_1SUB:
        case Opcode::OP_NEGATE:
        case Opcode::OP_ABS:
        case Opcode::OP_NOT:
        case Opcode::OP_0NOTEQUAL: {
            require_depth(1, op);
            int64_t x = pop_num();
            switch (op) {
                case Opcode::OP_1ADD:      push_num(checked_add(x, 1, op)); break;
                case Opcode::OP_1SUB:      push_num(checked_add(x, -1, op)); break;
                case Opcode::OP_NEGATE:    push_num(-x); break;
                case Opcode::OP_ABS:       push_num(x < 0 ? -x : x); break;
                case Opcode::OP_NOT:       push_bool(x == 0); break;
                case Opcode::OP_0NOTEQUAL: push_bool(x != 0); break;
                default: break;
            }
            break;
        }

        case Opcode::OP_WITHIN: {
            // x min max -> min <= x < max
            require_depth(3, op);
            int64_t max = pop_num();
            int64_t min = pop_num();
            int64_t x = pop_num();
            push_bool(min <= x && x < max);
            break;
        }

        default: {
            require_depth(2, op);
            int64_t b = pop_num();
            int64_t a = pop_num();
            switch (op) {
                case Opcode::OP_ADD: push_num(checked_add(a, b, op)); break;
                case Opcode::OP_SUB: push_num(checked_add(a, -b, op)); break;
                case Opcode::OP_MUL: push_num(checked_mul(a, b, op)); break;
                case Opcode::OP_DIV:
                    if (b == 0) {
                        throw ExecutionError("division by zero");
                    }
                    push_num(a / b);
                    break;
                case Opcode::OP_MOD:
                    if (b == 0) {
                        throw ExecutionError("modulo by zero");
                    }
                    push_num(a % b);
                    break;
                case Opcode::OP_BOOLAND:     push_bool(a != 0 && b != 0); break;
                case Opcode::OP_BOOLOR:      push_bool(a != 0 || b != 0); break;
                case Opcode::OP_NUMEQUAL:    push_bool(a == b); break;
                case Opcode::OP_NUMNOTEQUAL: push_bool(a != b); break;
                case Opcode::OP_LESSTHAN:    push_bool(a < b); break;
                case Opcode::OP_GREATERTHAN: push_bool(a > b); break;
                case Opcode::OP_LESSTHANOREQUAL:    push_bool(a <= b); break;
                case Opcode::OP_GREATERTHANOREQUAL: push_bool(a >= b); break;
                case Opcode::OP_MIN: push_num(std::min(a, b)); break;
                case Opcode::OP_MAX: push_num(std::max(a, b)); break;
                case Opcode::OP_NUMEQUALVERIFY:
                    if (a != b) {
                        throw ExecutionError(build_error_message(
                            "OP_NUMEQUALVERIFY failed: ", a, " != ", b));
                    }
                    break;
                default:
                    throw InternalError("opcode routed to the wrong handler: " +
                                        opcode_to_string(to_byte(op)));
            }
            break;
        }
    }
}

void ScriptEngine::execute_crypto_op(Opcode op) {
    if (op == Opcode::OP_SHA256) {
        require_depth(1, op);
        push(sha256(pop()));
        return;
    }

    // OP_CHECKSIG / OP_CHECKSIGVERIFY: <sig> <pubkey>
    require_depth(2, op);
    stats_.sig_checks++;
    Bytes pubkey = pop();
    Bytes sig = pop();

    if (pubkey.size() != XONLY_PUBKEY_SIZE) {
        throw ExecutionError(build_error_message(
            "unsupported public key length ", pubkey.size(), ", expected 32"));
    }

    bool valid = false;
    if (!sig.empty()) {
        Byte hash_type = SIGHASH_ALL;
        if (sig.size() == SCHNORR_SIGNATURE_SIZE + 1) {
            hash_type = sig.back();
            sig.pop_back();
        } else if (sig.size() != SCHNORR_SIGNATURE_SIZE) {
            throw ExecutionError(build_error_message(
                "invalid signature length ", sig.size()));
        }
        valid = schnorr_verify(sig, tx_.signature_hash(hash_type), pubkey);
    }

    if (op == Opcode::OP_CHECKSIGVERIFY) {
        if (!valid) {
            throw ExecutionError("OP_CHECKSIGVERIFY failed: signature is not valid");
        }
    } else {
        push_bool(valid);
    }
}

void ScriptEngine::finish_unlocking_script() {
    if (!cond_stack_.empty()) {
        throw ExecutionError("end of unlocking script reached in conditional execution");
    }
    alt_stack_.clear();
}

void ScriptEngine::finish_execution() {
    if (!cond_stack_.empty()) {
        throw ExecutionError("end of script reached in conditional execution");
    }
    if (stack_.empty()) {
        throw ExecutionError("stack empty at end of script execution");
    }
    if (stack_.size() > 1) {
        throw ExecutionError(build_error_message(
            "stack contains ", stack_.size() - 1, " unexpected items"));
    }
    if (!cast_to_bool(stack_.back())) {
        throw ExecutionError("false stack entry at end of script execution");
    }
}

// ==============================================================================
// Stack Primitives
// ==============================================================================

Bytes ScriptEngine::pop() {
    if (stack_.empty()) {
        throw ExecutionError("attempt to read from empty stack");
    }
    Bytes item = std::move(stack_.back());
    stack_.pop_back();
    return item;
}

int64_t ScriptEngine::pop_num() {
    return decode_script_num(pop());
}

bool ScriptEngine::pop_bool() {
    return cast_to_bool(pop());
}

void ScriptEngine::push(Bytes item) {
    if (item.size() > MAX_SCRIPT_ELEMENT_SIZE) {
        throw ExecutionError(build_error_message(
            "element size ", item.size(), " exceeds the max allowed of ",
            MAX_SCRIPT_ELEMENT_SIZE));
    }
    if (stack_.size() + alt_stack_.size() >= MAX_STACK_SIZE) {
        throw ExecutionError(build_error_message(
            "combined stack size exceeds the max allowed of ", MAX_STACK_SIZE));
    }
    stack_.push_back(std::move(item));
}

void ScriptEngine::push_num(int64_t value) {
    push(encode_script_num(value));
}

void ScriptEngine::push_bool(bool value) {
    push(encode_bool(value));
}

const Bytes& ScriptEngine::peek(size_t depth) const {
    if (depth >= stack_.size()) {
        throw ExecutionError("attempt to read from empty stack");
    }
    return stack_[stack_.size() - 1 - depth];
}

void ScriptEngine::require_depth(size_t depth, Opcode op) const {
    if (stack_.size() < depth) {
        throw ExecutionError(build_error_message(
            opcode_to_string(to_byte(op)), " requires ", depth,
            " stack items, have ", stack_.size()));
    }
}

}  // namespace sil
