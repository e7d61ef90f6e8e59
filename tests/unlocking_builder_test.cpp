// ==============================================================================
// Unlocking Input Tests
// ==============================================================================
// Tests typed argument parsing, default values, unlocking input layout and
// automatic signing of signature arguments.
// ==============================================================================

#include "unlocking_builder.hpp"
#include "typed_args.hpp"
#include "script_engine.hpp"
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

static const char* PAIR =
    "contract Pair() {\n"
    "    entrypoint function main(int a, int b) { require(a < b); }\n"
    "}\n";

static const char* MULTI =
    "contract Multi() {\n"
    "    entrypoint function first(int v) { require(v == 7); }\n"
    "    entrypoint function second(int v, int w) { require(v < w); }\n"
    "}\n";

static const char* VAULT =
    "contract Vault(pubkey owner) {\n"
    "    entrypoint function spend(sig s, int amount) {\n"
    "        require(checkSig(s, owner));\n"
    "        require(amount > 0);\n"
    "    }\n"
    "}\n";

static const std::string SECRET_ONE =
    "0x0000000000000000000000000000000000000000000000000000000000000001";

// Message of the InputError thrown by fn, or "" if none
template<typename Fn>
static std::string input_error_of(Fn fn) {
    try {
        fn();
    } catch (const InputError& e) {
        return e.message();
    }
    return "";
}

// ==============================================================================
// Typed Arguments
// ==============================================================================

static void test_parse_typed_arg() {
    std::cout << "\n--- Typed Arguments ---\n";

    check(parse_typed_arg("int", "42").int_value == 42, "int 42");
    check(parse_typed_arg("int", "-7").int_value == -7, "int -7");
    check(parse_typed_arg("int", " 5 ").int_value == 5, "int with spaces");
    check(parse_typed_arg("bool", "true").bool_value, "bool true");
    check(parse_typed_arg("string", "hello world").text == "hello world", "string verbatim");

    Expr hex = parse_typed_arg("bytes4", "0xdeadbeef");
    check(hex.kind == ExprKind::BYTES_LITERAL && hex.bytes_value.size() == 4, "bytes4 hex");
    check(parse_typed_arg("bytes", "abcd").bytes_value.size() == 2, "hex without prefix");

    check(input_error_of([] { parse_typed_arg("int", "12a"); }) == "invalid int value '12a'",
          "bad int");
    check(!input_error_of([] { parse_typed_arg("int", "99999999999999999999"); }).empty(),
          "int overflow");
    check(!input_error_of([] { parse_typed_arg("bool", "yes"); }).empty(), "bad bool");
    check(!input_error_of([] { parse_typed_arg("bytes", "0xzz"); }).empty(), "bad hex");
    check(input_error_of([] { parse_typed_arg("uint", "1"); }) == "unknown type 'uint'",
          "unknown type");
    check(!input_error_of([] { parse_typed_arg("int[]", "[1]"); }).empty(), "arrays rejected");
}

static void test_encode_typed_value() {
    std::cout << "\n--- Encoding ---\n";

    TypeRef int_type = *parse_type_name("int");
    TypeRef bytes4 = *parse_type_name("bytes4");
    TypeRef sig = *parse_type_name("sig");

    check(encode_typed_value(int_type, Expr::int_literal(0)).empty(), "int 0 is empty");
    check(encode_typed_value(int_type, Expr::int_literal(-1)) == Bytes{0x81}, "int -1");
    check(encode_typed_value(bytes4, Expr::bytes_literal({1, 2, 3, 4})).size() == 4, "bytes4");

    check(input_error_of([&] { encode_typed_value(bytes4, Expr::bytes_literal({1, 2})); }) ==
          "bytes4 expects 4 bytes, got 2", "wrong fixed length");
    check(!input_error_of([&] { encode_typed_value(sig, Expr::bytes_literal(Bytes(10, 1))); })
               .empty(), "short signature");
    check(!input_error_of([&] { encode_typed_value(int_type, Expr::bool_literal(true)); })
               .empty(), "kind mismatch");
}

static void test_defaults() {
    std::cout << "\n--- Default Values ---\n";

    check(default_raw_value("int") == "0", "int default");
    check(default_raw_value("bool") == "false", "bool default");
    check(default_raw_value("string").empty(), "string default");
    check(default_raw_value("bytes") == "0x", "bytes default");
    check(default_raw_value("byte") == "0x00", "byte default");
    check(default_raw_value("bytes4") == "0x00000000", "bytes4 default");
    check(default_raw_value("pubkey") == "0x" + std::string(64, '0'), "pubkey default");
    check(default_raw_value("sig") == "0x" + std::string(128, '0'), "sig default");
    check(default_raw_value("int[]") == "[]", "array default");

    auto filled = fill_raw_args({"int", "bytes4"}, {}, "function 'f'");
    check(filled == std::vector<std::string>({"0", "0x00000000"}), "missing values filled");

    filled = fill_raw_args({"int", "bytes4"}, {"5", "  "}, "function 'f'");
    check(filled == std::vector<std::string>({"5", "0x00000000"}), "blank value filled");

    check(input_error_of([] { fill_raw_args({"int"}, {"1", "2"}, "function 'f'"); }) ==
          "function 'f' expects 1 arguments, got 2", "too many values");
}

// ==============================================================================
// Unlocking Input
// ==============================================================================

static void test_input_layout() {
    std::cout << "\n--- Input Layout ---\n";

    CompiledProgram pair = compile_source(PAIR, {});
    Bytes input = build_unlocking_input(pair, "main", {Expr::int_literal(1), Expr::int_literal(2)});
    check(input == (Bytes{0x51, 0x52}), "no selector for a single entrypoint");
    check(build_unlocking_input_raw(pair, "main", {"1", "2"}) == input, "raw strings agree");

    CompiledProgram multi = compile_source(MULTI, {});
    check(build_unlocking_input_raw(multi, "first", {"7"}) == (Bytes{0x00, 0x57}),
          "selector 0 precedes the argument");
    check(build_unlocking_input_raw(multi, "second", {"3", "4"}) == (Bytes{0x51, 0x53, 0x54}),
          "selector 1 precedes the arguments");

    Bytes big = build_unlocking_input_raw(multi, "second", {"1000", "-1000"});
    auto instructions = parse_script(big, ScriptSegment::UNLOCKING);
    check(instructions.size() == 3 && is_push_only(instructions), "minimal pushes only");

    Bytes unlocking = build_unlocking_input_raw(multi, "second", {"3", "4"});
    ScriptEngine engine;
    engine.load(unlocking, multi.bytecode, TransactionContext::canonical(multi.bytecode, unlocking));
    check(engine.run() == EngineState::HALTED, "input runs against the program");
}

static void test_input_errors() {
    std::cout << "\n--- Input Errors ---\n";

    CompiledProgram pair = compile_source(PAIR, {});

    check(input_error_of([&] { build_unlocking_input_raw(pair, "nope", {}); }) ==
          "function 'nope' not found", "unknown function");
    check(input_error_of([&] { build_unlocking_input(pair, "main", {Expr::int_literal(1)}); }) ==
          "function 'main' expects 2 arguments, got 1", "arity mismatch");

    std::string message = input_error_of([&] {
        build_unlocking_input(pair, "main", {Expr::int_literal(1), Expr::bool_literal(true)});
    });
    check(message.find("argument 'b' of 'main': ") == 0, "encoding error names the argument");
}

// ==============================================================================
// Automatic Signing
// ==============================================================================

static void test_auto_sign() {
    std::cout << "\n--- Auto Signing ---\n";

    Bytes owner = schnorr_public_key(*from_hex(SECRET_ONE));
    CompiledProgram vault = compile_source(VAULT, {Expr::bytes_literal(owner)});
    const FunctionSignature& spend = *vault.find_function("spend");

    auto signed_args = auto_sign_args(spend.params, {SECRET_ONE, "5"}, vault.bytecode);
    check(signed_args.size() == 2, "same argument count");
    check(signed_args[0] != SECRET_ONE, "secret key replaced");
    check(signed_args[0].size() == 2 + 130, "65-byte signature as hex");
    check(signed_args[0].compare(signed_args[0].size() - 2, 2, "01") == 0,
          "ends with SIGHASH_ALL");
    check(signed_args[1] == "5", "int argument untouched");
    check(auto_sign_args(spend.params, {SECRET_ONE, "5"}, vault.bytecode) == signed_args,
          "signing is deterministic");

    Bytes unlocking = build_unlocking_input_raw(vault, "spend", signed_args);
    ScriptEngine engine;
    engine.load(unlocking, vault.bytecode, TransactionContext::canonical(vault.bytecode, unlocking));
    check(engine.run() == EngineState::HALTED, "signed call passes checkSig");

    std::string other_key = "0x" + std::string(62, '0') + "02";
    auto wrong = auto_sign_args(spend.params, {other_key, "5"}, vault.bytecode);
    Bytes wrong_input = build_unlocking_input_raw(vault, "spend", wrong);
    ScriptEngine wrong_engine;
    wrong_engine.load(wrong_input, vault.bytecode,
                      TransactionContext::canonical(vault.bytecode, wrong_input));
    check(wrong_engine.run() == EngineState::ERROR, "signature by another key fails");

    std::string short_value = "0x" + std::string(40, 'a');
    check(auto_sign_args(spend.params, {short_value, "5"}, vault.bytecode)[0] == short_value,
          "20-byte value passes through");

    std::string zero_key = "0x" + std::string(64, '0');
    check(auto_sign_args(spend.params, {zero_key, "5"}, vault.bytecode)[0] == zero_key,
          "zero key is not a secret key");

    std::vector<AbiParam> plain = {{"data", "bytes32"}};
    check(auto_sign_args(plain, {SECRET_ONE}, vault.bytecode)[0] == SECRET_ONE,
          "non-signature parameters are never signed");
}

int main() {
    std::cout << "=== Unlocking Input Tests ===\n";

    test_parse_typed_arg();
    test_encode_typed_value();
    test_defaults();
    test_input_layout();
    test_input_errors();
    test_auto_sign();

    std::cout << "\n=== " << pass_count << "/" << test_count
              << " tests passed! ===\n";
    if (had_failure) {
        std::cout << "SOME TESTS FAILED\n";
        return 1;
    }
    return 0;
}
