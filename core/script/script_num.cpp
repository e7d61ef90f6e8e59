// ==============================================================================
// Script Numbers - Implementation
// ==============================================================================

#include "script_num.hpp"
#include "error.hpp"

namespace sil {

Bytes encode_script_num(int64_t value) {
    Bytes out;
    if (value == 0) {
        return out;
    }

    bool negative = value < 0;
    // Work on the magnitude as unsigned so INT64_MIN does not overflow
    uint64_t magnitude = negative ? (~static_cast<uint64_t>(value) + 1)
                                  : static_cast<uint64_t>(value);
    while (magnitude > 0) {
        out.push_back(static_cast<Byte>(magnitude & 0xFF));
        magnitude >>= 8;
    }

    // If the top bit is taken, add a byte to carry the sign
    if (out.back() & 0x80) {
        out.push_back(negative ? 0x80 : 0x00);
    } else if (negative) {
        out.back() |= 0x80;
    }
    return out;
}

bool is_minimally_encoded(const Bytes& bytes) {
    if (bytes.empty()) {
        return true;
    }
    if ((bytes.back() & 0x7F) == 0) {
        if (bytes.size() == 1 || (bytes[bytes.size() - 2] & 0x80) == 0) {
            return false;
        }
    }
    return true;
}

namespace {

// Caller guarantees size <= 8 and minimal form
int64_t decode_unchecked(const Bytes& bytes) {
    if (bytes.empty()) {
        return 0;
    }
    uint64_t magnitude = 0;
    for (size_t i = 0; i < bytes.size(); i++) {
        Byte b = bytes[i];
        if (i == bytes.size() - 1) {
            b &= 0x7F;
        }
        magnitude |= static_cast<uint64_t>(b) << (8 * i);
    }
    bool negative = (bytes.back() & 0x80) != 0;
    // 8 bytes with the sign bit cleared hold at most 2^63 - 1
    int64_t value = static_cast<int64_t>(magnitude);
    return negative ? -value : value;
}

}  // namespace

int64_t decode_script_num(const Bytes& bytes, size_t max_length) {
    if (bytes.size() > max_length) {
        throw ExecutionError(build_error_message(
            "numeric value encoded as ", to_hex(bytes), " is ", bytes.size(),
            " bytes which exceeds the max allowed of ", max_length));
    }
    if (!is_minimally_encoded(bytes)) {
        throw ExecutionError("numeric value encoded as " + to_hex(bytes) +
                             " is not minimally encoded");
    }
    return decode_unchecked(bytes);
}

std::optional<int64_t> try_decode_script_num(const Bytes& bytes) {
    if (bytes.size() > MAX_SCRIPT_NUM_LENGTH || !is_minimally_encoded(bytes)) {
        return std::nullopt;
    }
    return decode_unchecked(bytes);
}

bool cast_to_bool(const Bytes& bytes) {
    for (size_t i = 0; i < bytes.size(); i++) {
        if (bytes[i] != 0) {
            // Negative zero is still false
            if (i == bytes.size() - 1 && bytes[i] == 0x80) {
                return false;
            }
            return true;
        }
    }
    return false;
}

Bytes encode_bool(bool value) {
    return value ? Bytes{0x01} : Bytes{};
}

}  // namespace sil
