// ==============================================================================
// Typed Argument Values - Implementation
// ==============================================================================

#include "typed_args.hpp"
#include "script_num.hpp"
#include "schnorr.hpp"
#include "error.hpp"
#include <limits>

namespace sil {

namespace {

TypeRef require_type(const std::string& type_name) {
    auto type = parse_type_name(type_name);
    if (!type) {
        throw InputError("unknown type '" + type_name + "'");
    }
    return *type;
}

int64_t parse_int(const std::string& text) {
    std::string s = trim(text);
    size_t pos = 0;
    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = (s[0] == '-');
        pos = 1;
    }
    if (pos == s.size()) {
        throw InputError("invalid int value '" + text + "'");
    }

    uint64_t magnitude = 0;
    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    for (; pos < s.size(); pos++) {
        char c = s[pos];
        if (c < '0' || c > '9') {
            throw InputError("invalid int value '" + text + "'");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            throw InputError("int value '" + text + "' is out of range");
        }
        magnitude = magnitude * 10 + digit;
    }

    int64_t value = static_cast<int64_t>(magnitude);
    return negative ? -value : value;
}

bool is_signature_type(const TypeRef& type) {
    return !type.is_array &&
           (type.base == BaseType::SIG || type.base == BaseType::DATASIG);
}

const char* expr_kind_name(ExprKind kind) {
    switch (kind) {
        case ExprKind::INT_LITERAL:    return "int literal";
        case ExprKind::BOOL_LITERAL:   return "bool literal";
        case ExprKind::BYTES_LITERAL:  return "hex literal";
        case ExprKind::STRING_LITERAL: return "string literal";
        default:                       return "non-literal expression";
    }
}

}  // namespace

// ==============================================================================
// Parsing
// ==============================================================================

Expr parse_typed_arg(const std::string& type_name, const std::string& raw) {
    TypeRef type = require_type(type_name);

    if (type.is_array) {
        throw InputError("array arguments are not supported (type '" + type_name + "')");
    }

    switch (type.base) {
        case BaseType::INT:
            return Expr::int_literal(parse_int(raw));

        case BaseType::BOOL: {
            std::string s = trim(raw);
            if (s == "true") return Expr::bool_literal(true);
            if (s == "false") return Expr::bool_literal(false);
            throw InputError("invalid bool value '" + raw + "', expected 'true' or 'false'");
        }

        case BaseType::STRING:
            return Expr::string_literal(raw);

        default: {
            auto bytes = from_hex(trim(raw));
            if (!bytes) {
                throw InputError("invalid hex value '" + raw + "' for type " + type.to_string());
            }
            return Expr::bytes_literal(*bytes);
        }
    }
}

std::vector<Expr> parse_typed_args(const std::vector<std::string>& type_names,
                                   const std::vector<std::string>& raw_values,
                                   const std::string& context) {
    if (type_names.size() != raw_values.size()) {
        throw InputError(build_error_message(
            context, " expects ", type_names.size(), " arguments, got ", raw_values.size()));
    }
    std::vector<Expr> result;
    result.reserve(raw_values.size());
    for (size_t i = 0; i < raw_values.size(); i++) {
        result.push_back(parse_typed_arg(type_names[i], raw_values[i]));
    }
    return result;
}

// ==============================================================================
// Encoding
// ==============================================================================

Bytes encode_typed_value(const TypeRef& type, const Expr& value) {
    if (type.is_array) {
        throw InputError("array values are not supported (type '" + type.to_string() + "')");
    }

    auto mismatch = [&]() {
        return InputError(std::string("cannot use ") + expr_kind_name(value.kind) +
                          " as a value of type " + type.to_string());
    };

    switch (type.base) {
        case BaseType::INT:
            if (value.kind != ExprKind::INT_LITERAL) throw mismatch();
            if (value.int_value == std::numeric_limits<int64_t>::min()) {
                throw InputError("int value does not fit in 8 bytes");
            }
            return encode_script_num(value.int_value);

        case BaseType::BOOL:
            if (value.kind != ExprKind::BOOL_LITERAL) throw mismatch();
            return encode_bool(value.bool_value);

        case BaseType::STRING:
            if (value.kind != ExprKind::STRING_LITERAL) throw mismatch();
            return Bytes(value.text.begin(), value.text.end());

        default:
            break;
    }

    if (value.kind != ExprKind::BYTES_LITERAL) throw mismatch();
    const Bytes& bytes = value.bytes_value;

    if (is_signature_type(type)) {
        if (bytes.size() != SCHNORR_SIGNATURE_SIZE && bytes.size() != SCHNORR_SIGNATURE_SIZE + 1) {
            throw InputError(build_error_message(
                type.to_string(), " expects 64 or 65 bytes, got ", bytes.size()));
        }
        return bytes;
    }

    auto fixed = fixed_byte_length(type);
    if (fixed && bytes.size() != *fixed) {
        throw InputError(build_error_message(
            type.to_string(), " expects ", *fixed, " bytes, got ", bytes.size()));
    }
    return bytes;
}

// ==============================================================================
// Defaults
// ==============================================================================

std::string default_raw_value(const std::string& type_name) {
    TypeRef type = require_type(type_name);

    if (type.is_array) {
        return "[]";
    }

    switch (type.base) {
        case BaseType::INT:     return "0";
        case BaseType::BOOL:    return "false";
        case BaseType::STRING:  return "";
        case BaseType::BYTES:   return "0x";
        case BaseType::SIG:
        case BaseType::DATASIG: return "0x" + to_hex(Bytes(SCHNORR_SIGNATURE_SIZE, 0));
        default: {
            auto fixed = fixed_byte_length(type);
            return "0x" + to_hex(Bytes(fixed ? *fixed : 0, 0));
        }
    }
}

std::vector<std::string> fill_raw_args(const std::vector<std::string>& type_names,
                                       const std::vector<std::string>& raw_values,
                                       const std::string& context) {
    if (raw_values.size() > type_names.size()) {
        throw InputError(build_error_message(
            context, " expects ", type_names.size(), " arguments, got ", raw_values.size()));
    }

    std::vector<std::string> filled;
    filled.reserve(type_names.size());
    for (size_t i = 0; i < type_names.size(); i++) {
        if (i < raw_values.size() && !trim(raw_values[i]).empty()) {
            filled.push_back(raw_values[i]);
        } else {
            filled.push_back(default_raw_value(type_names[i]));
        }
    }
    return filled;
}

}  // namespace sil
