// ==============================================================================
// Script Engine Tests
// ==============================================================================
// Tests the instruction decoder, script numbers and the step-by-step engine.
// ==============================================================================

#include "script_engine.hpp"
#include "script_num.hpp"
#include "schnorr.hpp"
#include "error.hpp"
#include <iostream>

using namespace sil;

static int test_count = 0;
static int pass_count = 0;

static bool had_failure = false;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << "\n";
    } else {
        std::cout << "FAIL: " << name << "\n";
        had_failure = true;
    }
}

// Load and run to completion against the canonical transaction
static EngineState run_scripts(ScriptEngine& engine, const Bytes& unlocking, const Bytes& locking) {
    engine.load(unlocking, locking, TransactionContext::canonical(locking, unlocking));
    return engine.run();
}

static std::vector<Bytes> nums(std::initializer_list<int64_t> values) {
    std::vector<Bytes> out;
    for (int64_t v : values) {
        out.push_back(encode_script_num(v));
    }
    return out;
}

// ==============================================================================
// Encoding
// ==============================================================================

static void test_script_numbers() {
    std::cout << "\n--- Script Numbers ---\n";

    check(encode_script_num(0).empty(), "0 encodes as empty");
    check(encode_script_num(1) == Bytes{0x01}, "1 encodes as 01");
    check(encode_script_num(-1) == Bytes{0x81}, "-1 encodes as 81");
    check(encode_script_num(128) == (Bytes{0x80, 0x00}), "128 needs a sign byte");
    check(encode_script_num(-255) == (Bytes{0xff, 0x80}), "-255 encodes as ff80");

    check(decode_script_num({0x80, 0x00}) == 128, "decode 128");
    check(decode_script_num({0xff, 0x80}) == -255, "decode -255");

    bool caught = false;
    try {
        decode_script_num({0x01, 0x00});
    } catch (const ExecutionError&) {
        caught = true;
    }
    check(caught, "non-minimal number rejected");
    check(!try_decode_script_num({0x01, 0x00}).has_value(), "try_decode reports non-minimal");
    check(!try_decode_script_num(Bytes(9, 0x01)).has_value(), "9-byte number rejected");

    check(!cast_to_bool({}), "empty is false");
    check(!cast_to_bool({0x00, 0x80}), "negative zero is false");
    check(cast_to_bool({0x00, 0x01}), "nonzero is true");
    check(encode_bool(true) == Bytes{0x01} && encode_bool(false).empty(), "bool encodings");
}

static void test_builder_and_decoder() {
    std::cout << "\n--- Builder and Decoder ---\n";

    check(ScriptBuilder().add_int(0).script() == Bytes{0x00}, "0 uses OP_0");
    check(ScriptBuilder().add_int(5).script() == Bytes{0x55}, "5 uses OP_5");
    check(ScriptBuilder().add_int(-1).script() == Bytes{0x4f}, "-1 uses OP_1NEGATE");
    check(ScriptBuilder().add_int(17).script() == (Bytes{0x01, 0x11}), "17 is a direct push");
    check(ScriptBuilder().add_int(-5).script() == (Bytes{0x01, 0x85}), "-5 is a direct push");

    Bytes big(100, 0xaa);
    Bytes pushdata = ScriptBuilder().add_data(big).script();
    check(pushdata[0] == 0x4c && pushdata[1] == 100, "100 bytes use OP_PUSHDATA1");

    ScriptBuilder builder;
    builder.add_data({0xab, 0xcd}).add_op(Opcode::OP_DUP).add_int(3);
    auto instructions = parse_script(builder.script());
    check(instructions.size() == 3, "3 instructions decoded");
    check(instructions[0].offset == 0 && instructions[0].size == 3, "push has offset 0, size 3");
    check(instructions[1].offset == 3 && instructions[2].offset == 4, "offsets advance");
    check(instruction_to_string(instructions[0]) == "OP_DATA_2 0xabcd", "push disassembly");
    check(instruction_to_string(instructions[1]) == "OP_DUP", "opcode disassembly");
    check(!is_push_only(instructions), "OP_DUP is not a push");

    bool caught = false;
    try {
        parse_script({0x02, 0xaa});
    } catch (const ExecutionError&) {
        caught = true;
    }
    check(caught, "truncated push rejected");
}

// ==============================================================================
// Execution
// ==============================================================================

static void test_arithmetic() {
    std::cout << "\n--- Arithmetic ---\n";

    ScriptEngine engine;
    Bytes unlocking = ScriptBuilder().add_int(2).add_int(3).script();
    Bytes locking = ScriptBuilder()
        .add_op(Opcode::OP_ADD).add_int(5).add_op(Opcode::OP_NUMEQUAL).script();

    engine.load(unlocking, locking, TransactionContext::canonical(locking, unlocking));
    check(engine.get_state() == EngineState::READY, "ready after load");
    check(engine.get_instruction_count() == 5, "unlocking and locking instructions combined");
    check(engine.get_instruction(0)->segment == ScriptSegment::UNLOCKING, "first is unlocking");
    check(engine.get_instruction(2)->segment == ScriptSegment::LOCKING, "third is locking");

    size_t steps = 0;
    while (!engine.is_finished()) {
        engine.step();
        steps++;
    }
    check(steps == 5, "one step per instruction");
    check(engine.get_state() == EngineState::HALTED, "halted");
    check(engine.get_stack() == nums({1}), "clean stack holds true");
    check(engine.get_pc() == 5, "pc at the end");
    check(engine.last_opcode() == to_byte(Opcode::OP_NUMEQUAL), "last opcode recorded");

    engine.reset();
    check(engine.get_pc() == 0 && engine.get_stack().empty(), "reset clears state");
    check(!engine.last_opcode().has_value(), "reset clears last opcode");
    check(engine.run() == EngineState::HALTED, "runs again after reset");
}

static void test_stack_ops() {
    std::cout << "\n--- PICK and ROLL ---\n";

    ScriptEngine engine;
    Bytes unlocking = ScriptBuilder().add_int(1).add_int(2).add_int(3).script();
    Bytes locking = ScriptBuilder()
        .add_int(2).add_op(Opcode::OP_PICK)
        .add_int(2).add_op(Opcode::OP_ROLL)
        .add_op(Opcode::OP_2DROP).add_op(Opcode::OP_2DROP)
        .add_int(1).script();
    engine.load(unlocking, locking, TransactionContext::canonical(locking, unlocking));

    for (int i = 0; i < 5; i++) engine.step();
    check(engine.get_stack() == nums({1, 2, 3, 1}), "2 PICK copies the third item");

    engine.step();
    engine.step();
    check(engine.get_stack() == nums({1, 3, 1, 2}), "2 ROLL moves the third item");

    check(engine.run() == EngineState::HALTED, "finishes cleanly");

    ScriptEngine bad;
    check(run_scripts(bad, {}, ScriptBuilder().add_int(1).add_int(5)
                                 .add_op(Opcode::OP_PICK).script()) == EngineState::ERROR,
          "PICK past the bottom fails");
}

static void test_conditionals() {
    std::cout << "\n--- Conditionals ---\n";

    ScriptEngine engine;
    Bytes locking = ScriptBuilder()
        .add_int(0).add_op(Opcode::OP_IF)
        .add_int(2)
        .add_op(Opcode::OP_ELSE)
        .add_int(3)
        .add_op(Opcode::OP_ENDIF)
        .add_int(3).add_op(Opcode::OP_NUMEQUAL).script();
    engine.load({}, locking, TransactionContext::canonical(locking));

    engine.step();
    engine.step();
    check(!engine.is_branch_executing(), "inside the branch not taken");
    engine.step();
    check(engine.get_stack().empty(), "skipped push leaves the stack alone");
    engine.step();
    check(engine.is_branch_executing(), "else branch runs");

    check(engine.run() == EngineState::HALTED, "else result checked");
    check(engine.get_stats().instructions_skipped == 1, "one instruction skipped");

    ScriptEngine unbalanced;
    run_scripts(unbalanced, {}, ScriptBuilder().add_int(1).add_op(Opcode::OP_IF).add_int(1).script());
    check(unbalanced.get_error_message() == "end of script reached in conditional execution",
          "unbalanced IF rejected");

    ScriptEngine not_bool;
    run_scripts(not_bool, {}, ScriptBuilder().add_int(2).add_op(Opcode::OP_IF)
                                  .add_op(Opcode::OP_ENDIF).add_int(1).script());
    check(not_bool.get_state() == EngineState::ERROR, "IF on 0x02 rejected");
}

static void test_failures() {
    std::cout << "\n--- Failures ---\n";

    ScriptEngine verify;
    run_scripts(verify, {}, ScriptBuilder().add_int(0).add_op(Opcode::OP_VERIFY).add_int(1).script());
    check(verify.get_state() == EngineState::ERROR, "OP_VERIFY on false fails");
    check(verify.get_error_message() == "OP_VERIFY failed: top stack item is false",
          "OP_VERIFY message");
    check(verify.get_pc() == 1, "pc stays on the failing instruction");
    check(verify.get_error_location() == 1, "error location is the OP_VERIFY");

    ScriptEngine div;
    run_scripts(div, {}, ScriptBuilder().add_int(1).add_int(0).add_op(Opcode::OP_DIV).script());
    check(div.get_error_message() == "division by zero", "division by zero");

    ScriptEngine extra;
    run_scripts(extra, {}, ScriptBuilder().add_int(1).add_int(1).script());
    check(extra.get_error_message() == "stack contains 1 unexpected items", "unclean stack");

    ScriptEngine empty;
    run_scripts(empty, {}, ScriptBuilder().add_int(1).add_op(Opcode::OP_DROP).script());
    check(empty.get_error_message() == "stack empty at end of script execution", "empty stack");

    ScriptEngine falsy;
    run_scripts(falsy, {}, ScriptBuilder().add_int(0).script());
    check(falsy.get_error_message() == "false stack entry at end of script execution",
          "false result");

    ScriptEngine early;
    run_scripts(early, {}, ScriptBuilder().add_op(Opcode::OP_RETURN).script());
    check(early.get_error_message() == "script returned early (OP_RETURN)", "OP_RETURN");

    ScriptEngine non_minimal;
    run_scripts(non_minimal, {}, Bytes{0x01, 0x05});
    check(non_minimal.get_state() == EngineState::ERROR, "non-minimal push rejected");

    ScriptEngine underflow;
    run_scripts(underflow, {}, ScriptBuilder().add_op(Opcode::OP_ADD).script());
    check(underflow.get_error_message() == "OP_ADD requires 2 stack items, have 0", "underflow");

    bool caught = false;
    try {
        ScriptEngine engine;
        Bytes unlocking = ScriptBuilder().add_op(Opcode::OP_DUP).script();
        engine.load(unlocking, {0x51}, TransactionContext::canonical({0x51}));
    } catch (const ExecutionError& e) {
        caught = (e.message() == "signature script is not push only");
    }
    check(caught, "non push-only unlocking input rejected at load");
}

static void test_checksig() {
    std::cout << "\n--- Signature Checks ---\n";

    Bytes secret(32, 0);
    secret[31] = 7;
    Bytes pubkey = schnorr_public_key(secret);
    Bytes locking = ScriptBuilder().add_data(pubkey).add_op(Opcode::OP_CHECKSIG).script();

    Bytes sighash = TransactionContext::canonical(locking).signature_hash(SIGHASH_ALL);
    Bytes sig = schnorr_sign(sighash, secret);
    sig.push_back(SIGHASH_ALL);

    ScriptEngine engine;
    check(run_scripts(engine, ScriptBuilder().add_data(sig).script(), locking) ==
          EngineState::HALTED, "valid signature accepted");
    check(engine.get_stats().sig_checks == 1, "one signature check counted");

    ScriptEngine empty_sig;
    run_scripts(empty_sig, ScriptBuilder().add_data({}).script(), locking);
    check(empty_sig.get_error_message() == "false stack entry at end of script execution",
          "empty signature yields false");

    Bytes wrong = sig;
    wrong[10] ^= 0x01;
    ScriptEngine bad_sig;
    run_scripts(bad_sig, ScriptBuilder().add_data(wrong).script(), locking);
    check(bad_sig.get_state() == EngineState::ERROR, "corrupted signature rejected");
}

int main() {
    std::cout << "=== Script Engine Tests ===\n";

    test_script_numbers();
    test_builder_and_decoder();
    test_arithmetic();
    test_stack_ops();
    test_conditionals();
    test_failures();
    test_checksig();

    std::cout << "\n=== " << pass_count << "/" << test_count
              << " tests passed! ===\n";
    if (had_failure) {
        std::cout << "SOME TESTS FAILED\n";
        return 1;
    }
    return 0;
}
