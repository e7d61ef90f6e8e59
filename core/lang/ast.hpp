// ==============================================================================
// SilverScript Syntax Tree
// ==============================================================================
// The annotated syntax tree produced by the contract parser and consumed by
// the compiler. Every node carries the source span it came from so that
// compile errors and debug mappings can point back at the text.
// ==============================================================================

#ifndef SILVERSCRIPT_LANG_AST_HPP
#define SILVERSCRIPT_LANG_AST_HPP

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sil {

// ==============================================================================
// Type Names
// ==============================================================================

/**
 * @brief Built-in value types of the language
 *
 * - INT: script number (64-bit signed, minimally encoded)
 * - BOOL: true (0x01) / false (empty)
 * - STRING: UTF-8 bytes
 * - BYTES: byte string of any length
 * - BYTE: exactly 1 byte
 * - BYTES_N: exactly N bytes (bytes1 .. bytes520)
 * - PUBKEY: 32-byte x-only public key
 * - SIG: 64-byte Schnorr signature, optionally followed by a hash-type byte
 * - DATASIG: 64-byte Schnorr signature over arbitrary data (hash-type byte optional)
 */
enum class BaseType {
    INT,
    BOOL,
    STRING,
    BYTES,
    BYTE,
    BYTES_N,
    PUBKEY,
    SIG,
    DATASIG
};

/**
 * @brief A resolved type name such as "int", "bytes4" or "pubkey[]"
 */
struct TypeRef {
    BaseType base = BaseType::INT;
    size_t size = 0;        // Only meaningful for BYTES_N
    bool is_array = false;

    bool operator==(const TypeRef& other) const {
        return base == other.base && size == other.size && is_array == other.is_array;
    }
    bool operator!=(const TypeRef& other) const { return !(*this == other); }

    /**
     * @brief Render back to source syntax ("bytes32", "int[]", ...)
     */
    std::string to_string() const;
};

/**
 * @brief Resolve a type name from source text
 *
 * @return nullopt if the name is not a known type
 */
std::optional<TypeRef> parse_type_name(const std::string& name);

/**
 * @brief Exact byte length required by a fixed-size type
 *
 * byte -> 1, bytesN -> N, pubkey -> 32.
 * Returns nullopt for the other types; sig and datasig take 64 bytes plus an
 * optional hash-type byte.
 */
std::optional<size_t> fixed_byte_length(const TypeRef& type);

/**
 * @brief Check whether a type is stored as raw bytes (not int/bool)
 */
bool is_byte_like(const TypeRef& type);

// ==============================================================================
// Expressions
// ==============================================================================

enum class ExprKind {
    INT_LITERAL,
    BOOL_LITERAL,
    BYTES_LITERAL,
    STRING_LITERAL,
    IDENTIFIER,
    UNARY,
    BINARY,
    CALL
};

enum class UnaryOp {
    NOT,     // !x
    NEGATE   // -x
};

enum class BinaryOp {
    MUL, DIV, MOD,
    ADD, SUB,
    LT, LE, GT, GE,
    EQ, NE,
    AND,
    OR
};

const char* unary_op_to_string(UnaryOp op);
const char* binary_op_to_string(BinaryOp op);

/**
 * @brief One expression node
 *
 * Which fields are meaningful depends on `kind`:
 * - INT_LITERAL: int_value
 * - BOOL_LITERAL: bool_value
 * - BYTES_LITERAL: bytes_value
 * - STRING_LITERAL: text
 * - IDENTIFIER: text (the name)
 * - UNARY: unary_op, operands[0]
 * - BINARY: binary_op, operands[0] (left), operands[1] (right)
 * - CALL: text (callee name), operands (arguments)
 */
struct Expr {
    ExprKind kind = ExprKind::INT_LITERAL;
    SourceSpan span;

    int64_t int_value = 0;
    bool bool_value = false;
    Bytes bytes_value;
    std::string text;

    UnaryOp unary_op = UnaryOp::NOT;
    BinaryOp binary_op = BinaryOp::ADD;
    std::vector<Expr> operands;

    static Expr int_literal(int64_t value, SourceSpan span = {});
    static Expr bool_literal(bool value, SourceSpan span = {});
    static Expr bytes_literal(Bytes value, SourceSpan span = {});
    static Expr string_literal(std::string value, SourceSpan span = {});

    bool is_literal() const {
        return kind == ExprKind::INT_LITERAL || kind == ExprKind::BOOL_LITERAL ||
               kind == ExprKind::BYTES_LITERAL || kind == ExprKind::STRING_LITERAL;
    }
};

// ==============================================================================
// Statements
// ==============================================================================

enum class StmtKind {
    VAR_DECL,   // int y = x + 1;
    ASSIGN,     // y = y * 2;
    REQUIRE,    // require(y > 0, "message");
    IF,         // if (c) { ... } else { ... }
    CALL        // helper(a, b);
};

/**
 * @brief One statement node
 *
 * - VAR_DECL: type_name, name, exprs[0] (initializer)
 * - ASSIGN: name, exprs[0]
 * - REQUIRE: exprs[0] (condition), message (may be empty)
 * - IF: exprs[0] (condition), then_body, else_body
 * - CALL: name (callee), exprs (arguments)
 */
struct Statement {
    StmtKind kind = StmtKind::REQUIRE;
    SourceSpan span;

    std::string type_name;
    std::string name;
    std::vector<Expr> exprs;
    std::string message;

    std::vector<Statement> then_body;
    std::vector<Statement> else_body;
};

// ==============================================================================
// Declarations
// ==============================================================================

struct Param {
    std::string type_name;
    std::string name;
    SourceSpan span;
};

struct FunctionAst {
    std::string name;
    bool entrypoint = false;
    std::vector<Param> params;
    std::vector<Statement> body;
    SourceSpan span;
};

/**
 * @brief A whole contract
 *
 * Functions keep their declaration order, which defines selector indices.
 */
struct ContractAst {
    std::string name;
    std::vector<Param> params;          // Constructor parameters
    std::vector<FunctionAst> functions;
    SourceSpan span;

    /**
     * @brief Find a function by name (nullptr if absent)
     */
    const FunctionAst* find_function(const std::string& function_name) const;

    /**
     * @brief Entrypoint functions in declaration order
     */
    std::vector<const FunctionAst*> entrypoints() const;
};

}  // namespace sil

#endif  // SILVERSCRIPT_LANG_AST_HPP
