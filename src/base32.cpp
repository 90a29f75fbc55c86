#include "finegeo/base32.hpp"

#include <algorithm>

namespace finegeo::base32 {

namespace {

// Shift that places symbol i (0 = most significant) in an aligned word
constexpr unsigned symbolShift(size_t i) {
    return MAX_HASH_BITS - BITS_PER_CHAR * static_cast<unsigned>(i + 1);
}

constexpr std::array<int8_t, 256> buildDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr std::array<int8_t, 256> DECODE_TABLE = buildDecodeTable();

}  // namespace

int symbolValue(char c) {
    return DECODE_TABLE[static_cast<unsigned char>(c)];
}

bool validByte(char c) {
    return symbolValue(c) >= 0;
}

Base32Chars encodeAsChars(uint64_t aligned) {
    Base32Chars out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = symbol(static_cast<unsigned>(aligned >> symbolShift(i)));
    }
    return out;
}

std::string encode(uint64_t aligned) {
    Base32Chars chars = encodeAsChars(aligned);
    return std::string(chars.begin(), chars.end());
}

uint64_t decode(std::string_view hash) {
    uint64_t result = 0;
    size_t count = std::min<size_t>(hash.size(), MAX_HASH_CHARS);
    for (size_t i = 0; i < count; ++i) {
        int value = symbolValue(hash[i]);
        if (value < 0) value = 0;
        result |= static_cast<uint64_t>(value) << symbolShift(i);
    }
    return result;
}

}  // namespace finegeo::base32
