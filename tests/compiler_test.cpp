// ==============================================================================
// Compiler Tests
// ==============================================================================
// Tests the lowering of contracts to bytecode: selector dispatch, the debug
// table, semantic errors, and that the emitted bytecode actually runs.
// ==============================================================================

#include "compiler.hpp"
#include "contract_parser.hpp"
#include "script_engine.hpp"
#include "hash.hpp"
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

static const char* DEBUG_POC =
    "pragma silverscript ^0.1.0;\n"
    "\n"
    "contract DebugPoC(int const) {\n"
    "    function bump(int x) {\n"
    "        int y = x + 1;\n"
    "        require(y > 0);\n"
    "    }\n"
    "\n"
    "    function check_pair(int leftInput, int rightInput) {\n"
    "        int left = leftInput + rightInput;\n"
    "        int right = left * 2;\n"
    "        require(right >= left);\n"
    "    }\n"
    "\n"
    "    entrypoint function main(int a, int b) {\n"
    "        int seed = a + const;\n"
    "        check_pair(a, b);\n"
    "        bump(seed);\n"
    "        require(seed >= const);\n"
    "        require(b >= 0);\n"
    "    }\n"
    "}\n";

static const char* MULTI =
    "contract Multi(int base) {\n"
    "    entrypoint function first(int v) { require(v == base); }\n"
    "    entrypoint function second(int v, int w) { require(v + w == base); }\n"
    "    entrypoint function third() { require(base > 0); }\n"
    "}\n";

// Message of the CompileError thrown while compiling, or "" if none
static std::string compile_error_of(const std::string& source,
                                    const std::vector<Expr>& ctor_args = {},
                                    const CompileOptions& options = {}) {
    try {
        compile_source(source, ctor_args, options);
    } catch (const CompileError& e) {
        return e.message();
    }
    return "";
}

static bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

// Run a compiled program with integer arguments pushed in order
static EngineState run_with_ints(const CompiledProgram& program,
                                 const std::vector<int64_t>& pushes,
                                 ScriptEngine& engine) {
    ScriptBuilder unlocking;
    for (int64_t value : pushes) {
        unlocking.add_int(value);
    }
    engine.load(unlocking.script(), program.bytecode,
                TransactionContext::canonical(program.bytecode, unlocking.script()));
    return engine.run();
}

static EngineState run_with_ints(const CompiledProgram& program,
                                 const std::vector<int64_t>& pushes) {
    ScriptEngine engine;
    return run_with_ints(program, pushes, engine);
}

// ==============================================================================
// Program Shape
// ==============================================================================

static void test_single_entrypoint() {
    std::cout << "\n--- Single Entrypoint ---\n";

    CompiledProgram program = compile_source(DEBUG_POC, {Expr::int_literal(0)});

    check(program.contract_name == "DebugPoC", "contract name");
    check(program.without_selector, "single entrypoint needs no selector");
    check(program.abi.size() == 1, "ABI lists one function");
    check(program.abi[0].name == "main", "ABI names main");
    check(!program.abi[0].selector_index.has_value(), "no selector index");
    check(program.abi[0].type_names() == std::vector<std::string>({"int", "int"}),
          "main takes two ints");
    check(program.constructor_params.size() == 1 &&
          program.constructor_params[0].name == "const", "constructor params recorded");
    check(program.find_function("main") != nullptr, "find_function(main)");
    check(program.find_function("bump") == nullptr, "helpers are not in the ABI");
    check(!program.bytecode.empty(), "bytecode emitted");
    check(program.bytecode.back() == to_byte(Opcode::OP_1), "ends by pushing true");
}

static void test_selector_dispatch() {
    std::cout << "\n--- Selector Dispatch ---\n";

    CompiledProgram program = compile_source(MULTI, {Expr::int_literal(7)});

    check(!program.without_selector, "several entrypoints need a selector");
    check(program.abi.size() == 3, "three functions");
    bool ordered = true;
    for (size_t i = 0; i < program.abi.size(); i++) {
        ordered = ordered && program.abi[i].selector_index == i;
    }
    check(ordered, "selectors follow declaration order");
    check(program.bytecode.size() > 3 &&
          program.bytecode[0] == to_byte(Opcode::OP_DEPTH) &&
          program.bytecode[1] == to_byte(Opcode::OP_1SUB) &&
          program.bytecode[2] == to_byte(Opcode::OP_ROLL),
          "prologue moves the selector to the top");
    check(program.debug_info.get_mapping_for_offset(0) == nullptr, "prologue is unmapped");

    check(run_with_ints(program, {0, 7}) == EngineState::HALTED, "first(7) passes");
    check(run_with_ints(program, {1, 3, 4}) == EngineState::HALTED, "second(3, 4) passes");
    check(run_with_ints(program, {2}) == EngineState::HALTED, "third() passes");
    check(run_with_ints(program, {1, 3, 3}) == EngineState::ERROR, "second(3, 3) fails");

    ScriptEngine engine;
    run_with_ints(program, {5}, engine);
    check(engine.get_error_message() == "script returned early (OP_RETURN)",
          "unknown selector hits OP_RETURN");

    auto signatures = entrypoint_signatures(parse_contract(MULTI));
    check(signatures.size() == 3 && signatures[2].selector_index == size_t(2),
          "signatures without compiling");
}

// ==============================================================================
// Debug Table
// ==============================================================================

static void test_debug_table() {
    std::cout << "\n--- Debug Table ---\n";

    CompiledProgram program = compile_source(DEBUG_POC, {Expr::int_literal(0)});
    const DebugTable& table = program.debug_info;
    const auto& mappings = table.mappings();

    check(!table.empty(), "mappings recorded");
    check(mappings.front().sequence == 1, "sequences start at 1");

    bool increasing = true;
    for (size_t i = 1; i < mappings.size(); i++) {
        increasing = increasing && mappings[i].sequence > mappings[i - 1].sequence &&
                     mappings[i].byte_offset > mappings[i - 1].byte_offset;
    }
    check(increasing, "sequence and offset strictly increase together");

    const DebugMapping& first = mappings.front();
    check(first.kind == MappingKind::STATEMENT && first.statement_boundary,
          "first mapping starts a statement");
    check(first.span.line == 16, "first statement is line 16");
    check(first.frame_id == 0 && first.call_depth == 0, "first statement in frame 0");
    check(first.kind_label() == "stmt", "statement label");

    bool found_return = false;
    bool found_cleanup = false;
    bool deep_in_bump = false;
    bool lookup_ok = true;
    for (const auto& m : mappings) {
        if (m.kind == MappingKind::SYNTHETIC && m.synthetic_label == "return") found_return = true;
        if (m.kind_label() == "syn:cleanup") found_cleanup = true;
        if (m.span.line == 5 && m.call_depth == 1) deep_in_bump = true;
        if (table.get_mapping_for_offset(m.byte_offset) != &m) lookup_ok = false;
    }
    check(found_return, "parameter drops after a call are syn:return");
    check(found_cleanup, "local drops are syn:cleanup");
    check(deep_in_bump, "bump body mapped at call depth 1");
    check(lookup_ok, "offset lookup finds each mapping");

    const auto& frames = table.frames();
    check(frames.size() == 3, "entrypoint plus two inlined frames");
    check(frames[0].function_name == "main" && frames[0].frame_id == 0, "frame 0 is main");
    check(frames[1].function_name == "check_pair" && frames[1].frame_id == 1 &&
          frames[1].parent_frame_id == 0u && frames[1].call_depth == 1,
          "frame 1 is check_pair inside main");
    check(frames[2].function_name == "bump" && frames[2].frame_id == 2, "frame 2 is bump");
    check(frames[0].contains(frames[2].first_sequence), "main frame encloses bump");
    check(frames[1].last_sequence < frames[2].first_sequence, "calls do not overlap");

    auto chain = table.frame_chain(2, frames[2].first_sequence);
    check(chain == std::vector<std::string>({"main", "bump"}), "frame chain main > bump");

    auto constants = table.constants();
    check(constants.size() == 1 && constants[0]->name == "const" &&
          constants[0]->constant_value.empty(), "constant 0 folded as empty bytes");

    // The require(y > 0) in bump sees x, y and the constant
    uint32_t require_seq = 0;
    for (const auto& m : mappings) {
        if (m.span.line == 6 && m.statement_boundary) require_seq = m.sequence;
    }
    auto visible = table.visible_variables(require_seq, 2);
    std::vector<std::string> names;
    for (const auto* v : visible) names.push_back(v->name);
    check(names == std::vector<std::string>({"const", "x", "y"}), "bump scope at require");

    bool y_slot = false;
    for (const auto* v : visible) {
        if (v->name == "y") y_slot = v->origin == VariableOrigin::LOCAL && v->stack_slot == size_t(4);
    }
    check(y_slot, "y lives in slot 4 (a, b, seed, x below it)");
    check(table.visible_variables(require_seq, 0).size() == 4,
          "main arguments and locals stay live during the call");
    check(table.visible_variables(frames[0].last_sequence + 1, 0).empty(),
          "nothing visible outside every frame, constants included");
    check(table.visible_variables(require_seq, 9).empty(), "nothing visible in an unknown frame");
}

static void test_determinism() {
    std::cout << "\n--- Determinism ---\n";

    CompiledProgram a = compile_source(DEBUG_POC, {Expr::int_literal(3)});
    CompiledProgram b = compile_source(DEBUG_POC, {Expr::int_literal(3)});
    check(a.bytecode == b.bytecode, "same bytecode");
    check(a.debug_info.mappings().size() == b.debug_info.mappings().size(), "same mappings");
    check(a.debug_info.mappings().back().sequence == b.debug_info.mappings().back().sequence,
          "sequence counter is per compilation");

    CompiledProgram c = compile_source(DEBUG_POC, {Expr::int_literal(4)});
    check(c.bytecode != a.bytecode, "constructor value is folded into the bytecode");
}

// ==============================================================================
// Execution
// ==============================================================================

static void test_debug_poc_runs() {
    std::cout << "\n--- DebugPoC Execution ---\n";

    CompiledProgram program = compile_source(DEBUG_POC, {Expr::int_literal(0)});
    ScriptEngine engine;
    check(run_with_ints(program, {1, 2}, engine) == EngineState::HALTED, "main(1, 2) passes");
    check(engine.get_stack().size() == 1, "clean stack");
    check(run_with_ints(program, {1, -2}) == EngineState::ERROR, "main(1, -2) fails");
    check(run_with_ints(program, {-1, 5}) == EngineState::ERROR, "negative seed fails in bump");
}

static void test_locals_and_branches() {
    std::cout << "\n--- Locals and Branches ---\n";

    const char* source =
        "contract Calc() {\n"
        "    entrypoint function run(int a, int b) {\n"
        "        int x = a;\n"
        "        int y = 5;\n"
        "        int z = b;\n"
        "        x = x + y;\n"
        "        require(x == a + 5);\n"
        "        if (z > 0) {\n"
        "            int w = z * 2;\n"
        "            y = w;\n"
        "        } else {\n"
        "            y = 0;\n"
        "        }\n"
        "        require(y == z * 2 || z <= 0);\n"
        "        z = -1;\n"
        "        require(z == -1 && x != z);\n"
        "        string s = \"ab\" + \"cd\";\n"
        "        require(s == \"abcd\");\n"
        "    }\n"
        "}\n";

    CompiledProgram program = compile_source(source, {});
    check(run_with_ints(program, {1, 3}) == EngineState::HALTED, "then branch");
    check(run_with_ints(program, {1, -2}) == EngineState::HALTED, "else branch");
    check(run_with_ints(program, {1, 3, 4}) == EngineState::ERROR, "extra argument leaves junk");

    bool has_else = false;
    bool has_endif = false;
    for (const auto& m : program.debug_info.mappings()) {
        if (m.kind_label() == "syn:else") has_else = true;
        if (m.kind_label() == "syn:endif") has_endif = true;
    }
    check(has_else && has_endif, "else and endif are synthetic mappings");
}

static void test_builtins() {
    std::cout << "\n--- Builtins ---\n";

    const char* source =
        "contract Hashes(bytes32 digest) {\n"
        "    entrypoint function reveal(bytes preimage) {\n"
        "        require(sha256(preimage) == digest);\n"
        "        require(within(abs(-3), 0, 5) && min(2, 9) == 2 && max(2, 9) == 9);\n"
        "    }\n"
        "}\n";

    Bytes preimage = {'a', 'b', 'c'};
    CompiledProgram program = compile_source(source, {Expr::bytes_literal(sha256(preimage))});

    auto run_preimage = [&](const Bytes& data) {
        Bytes unlocking = ScriptBuilder().add_data(data).script();
        ScriptEngine engine;
        engine.load(unlocking, program.bytecode,
                    TransactionContext::canonical(program.bytecode, unlocking));
        return engine.run();
    };
    check(run_preimage(preimage) == EngineState::HALTED, "correct preimage");
    check(run_preimage({'a', 'b', 'd'}) == EngineState::ERROR, "wrong preimage");
}

// ==============================================================================
// Errors
// ==============================================================================

static void test_compile_errors() {
    std::cout << "\n--- Compile Errors ---\n";

    check(compile_error_of("contract C() { function f() { require(true); } }") ==
          "contract has no entrypoint functions", "no entrypoint");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f() {} function f() {} }"),
              "duplicate function name 'f'"), "duplicate function");

    check(contains(compile_error_of(
              "contract C() { function sha256() {} entrypoint function f() {} }"),
              "collides with a builtin"), "builtin name collision");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f(int a, int a) {} }"),
              "duplicate parameter"), "duplicate parameter");

    check(compile_error_of("contract C(int a) { entrypoint function f() {} }") ==
          "constructor expects 1 arguments, got 0", "constructor arity");

    check(contains(compile_error_of("contract C(bytes4 b) { entrypoint function f() {} }",
                                    {Expr::bytes_literal({1, 2})}),
                   "constructor argument 'b': "), "constructor value of wrong length");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f() { int x = 1; int x = 2; } }"),
              "variable 'x' is already declared"), "redeclaration");

    check(contains(compile_error_of(
              "contract C(int k) { entrypoint function f() { int k = 1; } }",
              {Expr::int_literal(1)}),
              "shadows a constructor parameter"), "local shadows constant");

    check(compile_error_of("contract C(int k) { entrypoint function f() { k = 1; } }",
                           {Expr::int_literal(1)}) ==
          "cannot assign to constructor parameter 'k'", "assign to constant");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f() { y = 1; } }"),
              "undefined variable"), "assign to undeclared");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f() { require(1); } }"),
              "require condition must be bool"), "require on int");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f() { if (1) { require(true); } } }"),
              "if condition must be bool"), "if on int");

    check(compile_error_of("contract C() { entrypoint function f() { g(); } }") ==
          "undefined function 'g'", "undefined function");

    check(compile_error_of(
              "contract C() { entrypoint function f() { g(); } entrypoint function g() {} }") ==
          "cannot call entrypoint function 'g'", "calling an entrypoint");

    check(compile_error_of(
              "contract C() { function h() { h(); } entrypoint function f() { h(); } }") ==
          "recursive call to 'h' cannot be inlined", "recursion");

    CompileOptions shallow;
    shallow.max_inline_depth = 1;
    const char* nested =
        "contract C() { function b() {} function a() { b(); } entrypoint function f() { a(); } }";
    check(compile_error_of(nested).empty(), "two-level inlining allowed by default");
    check(contains(compile_error_of(nested, {}, shallow), "exceeds the maximum inline depth"),
          "inline depth limit");

    check(compile_error_of(
              "contract C() { function h(int x) {} entrypoint function f() { h(); } }") ==
          "function 'h' expects 1 arguments, got 0", "helper arity");

    check(compile_error_of(
              "contract C() { entrypoint function f() { require(q > 0); } }") ==
          "undefined identifier 'q'", "undefined identifier");

    check(compile_error_of(
              "contract C() { function h() {} entrypoint function f() { int v = h; } }") ==
          "function 'h' used as a value", "function as value");

    check(contains(compile_error_of(
              "contract C() { function h(int x) {} entrypoint function f() { int v = h(1); } }"),
              "does not return a value and can only be called as a statement"),
          "helper in an expression");

    check(compile_error_of(
              "contract C() { entrypoint function f() { int v = 1 + true; } }") ==
          "operator '+' cannot be applied to int and bool", "operator type mismatch");

    check(compile_error_of(
              "contract C() { entrypoint function f() { uint v = 1; } }") ==
          "unknown type 'uint'", "unknown type");

    check(compile_error_of("contract C() { entrypoint function f(int[] xs) {} }") ==
          "array type 'int[]' is not supported", "array parameter");

    check(contains(compile_error_of(
              "contract C() { entrypoint function f() { bytes4 b = 0x0102; } }"),
              "cannot initialise 'b' of type bytes4"), "byte length mismatch");
}

static void test_error_spans() {
    std::cout << "\n--- Error Spans ---\n";

    bool located = false;
    try {
        compile_source("contract C() {\n"
                       "    entrypoint function f() {\n"
                       "        require(amout > 0);\n"
                       "    }\n"
                       "}\n", {});
    } catch (const CompileError& e) {
        located = e.span() && e.span()->line == 3 && e.span()->col == 17 &&
                  e.span()->end_col == 22;
    }
    check(located, "undefined identifier points at the name");

    bool parse_first = false;
    try {
        compile_source("contract C( {}", {});
    } catch (const ParseError&) {
        parse_first = true;
    }
    check(parse_first, "syntax errors surface as ParseError");
}

int main() {
    std::cout << "=== Compiler Tests ===\n";

    test_single_entrypoint();
    test_selector_dispatch();
    test_debug_table();
    test_determinism();
    test_debug_poc_runs();
    test_locals_and_branches();
    test_builtins();
    test_compile_errors();
    test_error_spans();

    std::cout << "\n=== " << pass_count << "/" << test_count
              << " tests passed! ===\n";
    if (had_failure) {
        std::cout << "SOME TESTS FAILED\n";
        return 1;
    }
    return 0;
}
