// ==============================================================================
// Value Formatter - Implementation
// ==============================================================================

#include "value_formatter.hpp"
#include "script_num.hpp"
#include "ast.hpp"
#include <sstream>

namespace sil {

namespace {

std::string placeholder(const std::string& what, const Bytes& raw) {
    return "<invalid " + what + " 0x" + to_hex(raw) + ">";
}

bool is_printable(const Bytes& raw) {
    for (Byte b : raw) {
        if (b < 0x20 || b > 0x7e) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string format_value(const std::string& type_name, const Bytes& raw) {
    auto type = parse_type_name(type_name);
    if (!type || type->is_array) {
        return format_stack_item(raw);
    }

    switch (type->base) {
        case BaseType::INT: {
            auto value = try_decode_script_num(raw);
            if (!value) {
                return placeholder("int", raw);
            }
            return std::to_string(*value);
        }

        case BaseType::BOOL:
            return cast_to_bool(raw) ? "true" : "false";

        case BaseType::STRING: {
            if (!is_printable(raw)) {
                return placeholder("string", raw);
            }
            std::ostringstream oss;
            oss << '"';
            for (Byte b : raw) {
                char c = static_cast<char>(b);
                if (c == '"' || c == '\\') oss << '\\';
                oss << c;
            }
            oss << '"';
            return oss.str();
        }

        default:
            return format_stack_item(raw);
    }
}

std::string format_stack_item(const Bytes& item) {
    return "0x" + to_hex(item);
}

std::string format_binding(const VariableBinding& binding) {
    std::ostringstream oss;
    oss << variable_origin_to_string(binding.origin) << " " << binding.type_name << " "
        << binding.name << " = " << format_value(binding.type_name, binding.value);
    return oss.str();
}

std::string format_stack(const std::vector<Bytes>& stack) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < stack.size(); i++) {
        if (i > 0) oss << ", ";
        oss << format_stack_item(stack[i]);
    }
    oss << "]";
    return oss.str();
}

}  // namespace sil
