// ==============================================================================
// Script Opcodes - Implementation
// ==============================================================================

#include "opcodes.hpp"

namespace sil {

namespace {

const char* named_opcode(Byte op) {
    switch (static_cast<Opcode>(op)) {
        case Opcode::OP_0:            return "OP_0";
        case Opcode::OP_PUSHDATA1:    return "OP_PUSHDATA1";
        case Opcode::OP_PUSHDATA2:    return "OP_PUSHDATA2";
        case Opcode::OP_PUSHDATA4:    return "OP_PUSHDATA4";
        case Opcode::OP_1NEGATE:      return "OP_1NEGATE";
        case Opcode::OP_NOP:          return "OP_NOP";
        case Opcode::OP_IF:           return "OP_IF";
        case Opcode::OP_NOTIF:        return "OP_NOTIF";
        case Opcode::OP_ELSE:         return "OP_ELSE";
        case Opcode::OP_ENDIF:        return "OP_ENDIF";
        case Opcode::OP_VERIFY:       return "OP_VERIFY";
        case Opcode::OP_RETURN:       return "OP_RETURN";
        case Opcode::OP_TOALTSTACK:   return "OP_TOALTSTACK";
        case Opcode::OP_FROMALTSTACK: return "OP_FROMALTSTACK";
        case Opcode::OP_2DROP:        return "OP_2DROP";
        case Opcode::OP_2DUP:         return "OP_2DUP";
        case Opcode::OP_IFDUP:        return "OP_IFDUP";
        case Opcode::OP_DEPTH:        return "OP_DEPTH";
        case Opcode::OP_DROP:         return "OP_DROP";
        case Opcode::OP_DUP:          return "OP_DUP";
        case Opcode::OP_NIP:          return "OP_NIP";
        case Opcode::OP_OVER:         return "OP_OVER";
        case Opcode::OP_PICK:         return "OP_PICK";
        case Opcode::OP_ROLL:         return "OP_ROLL";
        case Opcode::OP_ROT:          return "OP_ROT";
        case Opcode::OP_SWAP:         return "OP_SWAP";
        case Opcode::OP_TUCK:         return "OP_TUCK";
        case Opcode::OP_CAT:          return "OP_CAT";
        case Opcode::OP_SIZE:         return "OP_SIZE";
        case Opcode::OP_EQUAL:        return "OP_EQUAL";
        case Opcode::OP_EQUALVERIFY:  return "OP_EQUALVERIFY";
        case Opcode::OP_1ADD:         return "OP_1ADD";
        case Opcode::OP_1SUB:         return "OP_1SUB";
        case Opcode::OP_NEGATE:       return "OP_NEGATE";
        case Opcode::OP_ABS:          return "OP_ABS";
        case Opcode::OP_NOT:          return "OP_NOT";
        case Opcode::OP_0NOTEQUAL:    return "OP_0NOTEQUAL";
        case Opcode::OP_ADD:          return "OP_ADD";
        case Opcode::OP_SUB:          return "OP_SUB";
        case Opcode::OP_MUL:          return "OP_MUL";
        case Opcode::OP_DIV:          return "OP_DIV";
        case Opcode::OP_MOD:          return "OP_MOD";
        case Opcode::OP_BOOLAND:      return "OP_BOOLAND";
        case Opcode::OP_BOOLOR:       return "OP_BOOLOR";
        case Opcode::OP_NUMEQUAL:     return "OP_NUMEQUAL";
        case Opcode::OP_NUMEQUALVERIFY:     return "OP_NUMEQUALVERIFY";
        case Opcode::OP_NUMNOTEQUAL:        return "OP_NUMNOTEQUAL";
        case Opcode::OP_LESSTHAN:           return "OP_LESSTHAN";
        case Opcode::OP_GREATERTHAN:        return "OP_GREATERTHAN";
        case Opcode::OP_LESSTHANOREQUAL:    return "OP_LESSTHANOREQUAL";
        case Opcode::OP_GREATERTHANOREQUAL: return "OP_GREATERTHANOREQUAL";
        case Opcode::OP_MIN:          return "OP_MIN";
        case Opcode::OP_MAX:          return "OP_MAX";
        case Opcode::OP_WITHIN:       return "OP_WITHIN";
        case Opcode::OP_SHA256:       return "OP_SHA256";
        case Opcode::OP_CHECKSIG:     return "OP_CHECKSIG";
        case Opcode::OP_CHECKSIGVERIFY: return "OP_CHECKSIGVERIFY";
        default:                      return nullptr;
    }
}

}  // namespace

bool is_known_opcode(Byte op) {
    if (is_direct_push(op)) {
        return true;
    }
    if (op >= to_byte(Opcode::OP_1) && op <= to_byte(Opcode::OP_16)) {
        return true;
    }
    return named_opcode(op) != nullptr;
}

std::string opcode_to_string(Byte op) {
    if (is_direct_push(op)) {
        return "OP_DATA_" + std::to_string(op);
    }
    if (op >= to_byte(Opcode::OP_1) && op <= to_byte(Opcode::OP_16)) {
        return "OP_" + std::to_string(op - to_byte(Opcode::OP_1) + 1);
    }
    const char* name = named_opcode(op);
    if (name != nullptr) {
        return name;
    }
    return "OP_UNKNOWN_0x" + to_hex(Bytes{op});
}

}  // namespace sil
