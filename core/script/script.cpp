// ==============================================================================
// Script Representation - Implementation
// ==============================================================================

#include "script.hpp"
#include "script_num.hpp"
#include "error.hpp"

namespace sil {

const char* segment_to_string(ScriptSegment segment) {
    switch (segment) {
        case ScriptSegment::UNLOCKING: return "unlocking";
        case ScriptSegment::LOCKING:   return "locking";
        default:                       return "unknown";
    }
}

// ==============================================================================
// Parsing
// ==============================================================================

std::vector<Instruction> parse_script(const Bytes& script, ScriptSegment segment) {
    std::vector<Instruction> result;
    size_t pos = 0;

    while (pos < script.size()) {
        Instruction ins;
        ins.offset = pos;
        ins.segment = segment;
        ins.opcode = script[pos++];

        // How many bytes of data follow, and how many length bytes precede them
        size_t data_len = 0;
        size_t len_bytes = 0;
        if (is_direct_push(ins.opcode)) {
            data_len = ins.opcode;
        } else if (ins.opcode == to_byte(Opcode::OP_PUSHDATA1)) {
            len_bytes = 1;
        } else if (ins.opcode == to_byte(Opcode::OP_PUSHDATA2)) {
            len_bytes = 2;
        } else if (ins.opcode == to_byte(Opcode::OP_PUSHDATA4)) {
            len_bytes = 4;
        }

        if (len_bytes > 0) {
            if (pos + len_bytes > script.size()) {
                throw ExecutionError(build_error_message(
                    opcode_to_string(ins.opcode), " at offset ", ins.offset,
                    " is missing its length bytes"));
            }
            for (size_t i = 0; i < len_bytes; i++) {
                data_len |= static_cast<size_t>(script[pos + i]) << (8 * i);
            }
            pos += len_bytes;
        }

        if (pos + data_len > script.size()) {
            throw ExecutionError(build_error_message(
                opcode_to_string(ins.opcode), " at offset ", ins.offset,
                " pushes ", data_len, " bytes but only ", script.size() - pos,
                " remain"));
        }
        ins.data.assign(script.begin() + static_cast<std::ptrdiff_t>(pos),
                        script.begin() + static_cast<std::ptrdiff_t>(pos + data_len));
        pos += data_len;
        ins.size = pos - ins.offset;

        result.push_back(std::move(ins));
    }

    return result;
}

bool is_push_only(const std::vector<Instruction>& instructions) {
    for (const auto& ins : instructions) {
        if (!is_push_opcode(ins.opcode)) {
            return false;
        }
    }
    return true;
}

bool is_minimal_push(const Instruction& instruction) {
    Byte op = instruction.opcode;
    const Bytes& data = instruction.data;

    if (!is_push_opcode(op) || op == to_byte(Opcode::OP_0) ||
        op == to_byte(Opcode::OP_1NEGATE) || op >= to_byte(Opcode::OP_1)) {
        return true;
    }

    if (data.empty()) {
        return false;  // Should have been OP_0
    }
    if (data.size() == 1 && data[0] >= 1 && data[0] <= 16) {
        return false;  // Should have been OP_1..OP_16
    }
    if (data.size() == 1 && data[0] == 0x81) {
        return false;  // Should have been OP_1NEGATE
    }
    if (data.size() <= MAX_DIRECT_PUSH) {
        return is_direct_push(op);
    }
    if (data.size() <= 0xFF) {
        return op == to_byte(Opcode::OP_PUSHDATA1);
    }
    if (data.size() <= 0xFFFF) {
        return op == to_byte(Opcode::OP_PUSHDATA2);
    }
    return true;
}

std::string instruction_to_string(const Instruction& instruction) {
    std::string out = opcode_to_string(instruction.opcode);
    bool carries_data = is_direct_push(instruction.opcode) ||
                        instruction.opcode == to_byte(Opcode::OP_PUSHDATA1) ||
                        instruction.opcode == to_byte(Opcode::OP_PUSHDATA2) ||
                        instruction.opcode == to_byte(Opcode::OP_PUSHDATA4);
    if (carries_data) {
        out += " 0x" + to_hex(instruction.data);
    }
    return out;
}

// ==============================================================================
// Builder
// ==============================================================================

ScriptBuilder& ScriptBuilder::add_op(Opcode op) {
    script_.push_back(to_byte(op));
    return *this;
}

ScriptBuilder& ScriptBuilder::add_data(const Bytes& data) {
    if (data.empty()) {
        return add_op(Opcode::OP_0);
    }
    if (data.size() == 1 && data[0] >= 1 && data[0] <= 16) {
        return add_op(small_int_opcode(data[0]));
    }
    if (data.size() == 1 && data[0] == 0x81) {
        return add_op(Opcode::OP_1NEGATE);
    }

    size_t len = data.size();
    if (len <= MAX_DIRECT_PUSH) {
        script_.push_back(static_cast<Byte>(len));
    } else if (len <= 0xFF) {
        script_.push_back(to_byte(Opcode::OP_PUSHDATA1));
        script_.push_back(static_cast<Byte>(len));
    } else if (len <= 0xFFFF) {
        script_.push_back(to_byte(Opcode::OP_PUSHDATA2));
        script_.push_back(static_cast<Byte>(len & 0xFF));
        script_.push_back(static_cast<Byte>(len >> 8));
    } else {
        script_.push_back(to_byte(Opcode::OP_PUSHDATA4));
        for (int i = 0; i < 4; i++) {
            script_.push_back(static_cast<Byte>((len >> (8 * i)) & 0xFF));
        }
    }
    script_.insert(script_.end(), data.begin(), data.end());
    return *this;
}

ScriptBuilder& ScriptBuilder::add_int(int64_t value) {
    if (value == 0) {
        return add_op(Opcode::OP_0);
    }
    if (value == -1) {
        return add_op(Opcode::OP_1NEGATE);
    }
    if (value >= 1 && value <= 16) {
        return add_op(small_int_opcode(static_cast<int>(value)));
    }
    return add_data(encode_script_num(value));
}

}  // namespace sil
