// ==============================================================================
// SilverScript Syntax Tree - Implementation
// ==============================================================================

#include "ast.hpp"
#include <cctype>

namespace sil {

// ==============================================================================
// Type Names
// ==============================================================================

namespace {

constexpr size_t MAX_FIXED_BYTES = 520;

const char* base_type_name(BaseType base) {
    switch (base) {
        case BaseType::INT:     return "int";
        case BaseType::BOOL:    return "bool";
        case BaseType::STRING:  return "string";
        case BaseType::BYTES:   return "bytes";
        case BaseType::BYTE:    return "byte";
        case BaseType::BYTES_N: return "bytes";
        case BaseType::PUBKEY:  return "pubkey";
        case BaseType::SIG:     return "sig";
        case BaseType::DATASIG: return "datasig";
        default:                return "unknown";
    }
}

}  // namespace

std::string TypeRef::to_string() const {
    std::string out = base_type_name(base);
    if (base == BaseType::BYTES_N) {
        out += std::to_string(size);
    }
    if (is_array) {
        out += "[]";
    }
    return out;
}

std::optional<TypeRef> parse_type_name(const std::string& name) {
    TypeRef type;
    std::string base = name;

    if (base.size() > 2 && base.compare(base.size() - 2, 2, "[]") == 0) {
        type.is_array = true;
        base = base.substr(0, base.size() - 2);
    }

    if (base == "int")          type.base = BaseType::INT;
    else if (base == "bool")    type.base = BaseType::BOOL;
    else if (base == "string")  type.base = BaseType::STRING;
    else if (base == "bytes")   type.base = BaseType::BYTES;
    else if (base == "byte")    type.base = BaseType::BYTE;
    else if (base == "pubkey")  type.base = BaseType::PUBKEY;
    else if (base == "sig")     type.base = BaseType::SIG;
    else if (base == "datasig") type.base = BaseType::DATASIG;
    else if (base.size() > 5 && base.compare(0, 5, "bytes") == 0) {
        std::string digits = base.substr(5);
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        if (digits.size() > 3 || digits[0] == '0') {
            return std::nullopt;
        }
        size_t size = std::stoul(digits);
        if (size == 0 || size > MAX_FIXED_BYTES) {
            return std::nullopt;
        }
        type.base = BaseType::BYTES_N;
        type.size = size;
    } else {
        return std::nullopt;
    }

    return type;
}

std::optional<size_t> fixed_byte_length(const TypeRef& type) {
    if (type.is_array) {
        return std::nullopt;
    }
    switch (type.base) {
        case BaseType::BYTE:    return 1;
        case BaseType::BYTES_N: return type.size;
        case BaseType::PUBKEY:  return 32;
        default:                return std::nullopt;
    }
}

bool is_byte_like(const TypeRef& type) {
    if (type.is_array) {
        return false;
    }
    return type.base != BaseType::INT && type.base != BaseType::BOOL;
}

// ==============================================================================
// Operators
// ==============================================================================

const char* unary_op_to_string(UnaryOp op) {
    switch (op) {
        case UnaryOp::NOT:    return "!";
        case UnaryOp::NEGATE: return "-";
        default:              return "?";
    }
}

const char* binary_op_to_string(BinaryOp op) {
    switch (op) {
        case BinaryOp::MUL: return "*";
        case BinaryOp::DIV: return "/";
        case BinaryOp::MOD: return "%";
        case BinaryOp::ADD: return "+";
        case BinaryOp::SUB: return "-";
        case BinaryOp::LT:  return "<";
        case BinaryOp::LE:  return "<=";
        case BinaryOp::GT:  return ">";
        case BinaryOp::GE:  return ">=";
        case BinaryOp::EQ:  return "==";
        case BinaryOp::NE:  return "!=";
        case BinaryOp::AND: return "&&";
        case BinaryOp::OR:  return "||";
        default:            return "?";
    }
}

// ==============================================================================
// Literal Constructors
// ==============================================================================

Expr Expr::int_literal(int64_t value, SourceSpan span) {
    Expr e;
    e.kind = ExprKind::INT_LITERAL;
    e.int_value = value;
    e.span = span;
    return e;
}

Expr Expr::bool_literal(bool value, SourceSpan span) {
    Expr e;
    e.kind = ExprKind::BOOL_LITERAL;
    e.bool_value = value;
    e.span = span;
    return e;
}

Expr Expr::bytes_literal(Bytes value, SourceSpan span) {
    Expr e;
    e.kind = ExprKind::BYTES_LITERAL;
    e.bytes_value = std::move(value);
    e.span = span;
    return e;
}

Expr Expr::string_literal(std::string value, SourceSpan span) {
    Expr e;
    e.kind = ExprKind::STRING_LITERAL;
    e.text = std::move(value);
    e.span = span;
    return e;
}

// ==============================================================================
// Contract Queries
// ==============================================================================

const FunctionAst* ContractAst::find_function(const std::string& function_name) const {
    for (const auto& function : functions) {
        if (function.name == function_name) {
            return &function;
        }
    }
    return nullptr;
}

std::vector<const FunctionAst*> ContractAst::entrypoints() const {
    std::vector<const FunctionAst*> result;
    for (const auto& function : functions) {
        if (function.entrypoint) {
            result.push_back(&function);
        }
    }
    return result;
}

}  // namespace sil
