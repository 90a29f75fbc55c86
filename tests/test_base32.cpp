#include <gtest/gtest.h>
#include "finegeo/base32.hpp"
#include <string>

using namespace finegeo;

TEST(Base32Test, AlphabetShape) {
    EXPECT_EQ(base32::ALPHABET.size(), 32u);
    EXPECT_EQ(base32::symbol(0), '0');
    EXPECT_EQ(base32::symbol(10), 'b');
    EXPECT_EQ(base32::symbol(31), 'z');
}

TEST(Base32Test, SymbolValues) {
    for (unsigned i = 0; i < 32; ++i) {
        EXPECT_EQ(base32::symbolValue(base32::symbol(i)), static_cast<int>(i));
    }
    EXPECT_EQ(base32::symbolValue('a'), -1);
    EXPECT_EQ(base32::symbolValue('B'), -1);
}

TEST(Base32Test, ValidByte) {
    for (char c : base32::ALPHABET) {
        EXPECT_TRUE(base32::validByte(c)) << c;
    }
    for (char c : std::string("ailoABCZ !-_\x7f")) {
        EXPECT_FALSE(base32::validByte(c)) << static_cast<int>(c);
    }
    EXPECT_FALSE(base32::validByte('\0'));
    EXPECT_FALSE(base32::validByte(static_cast<char>(0xE9)));
}

TEST(Base32Test, EncodeExtremes) {
    EXPECT_EQ(base32::encode(0), "000000000000");
    EXPECT_EQ(base32::encode(~0ULL), "zzzzzzzzzzzz");
}

TEST(Base32Test, EncodeIgnoresLowFourBits) {
    EXPECT_EQ(base32::encode(0xF), "000000000000");
    EXPECT_EQ(base32::encode(0x6ff0410000000000ULL), "ezs420000000");
}

TEST(Base32Test, EncodeAsCharsMatchesEncode) {
    const uint64_t hash = 0xd12b7d7996b6e28aULL;
    Base32Chars chars = base32::encodeAsChars(hash);
    EXPECT_EQ(std::string(chars.begin(), chars.end()), base32::encode(hash));
    EXPECT_EQ(std::string(chars.begin(), chars.end()), "u4pruydqqvj8");
}

TEST(Base32Test, DecodeIsLeftAligned) {
    EXPECT_EQ(base32::decode(""), 0ULL);
    EXPECT_EQ(base32::decode("b"), 0x5000000000000000ULL);
    EXPECT_EQ(base32::decode("ezs42"), 0x6ff0410000000000ULL);
    EXPECT_EQ(base32::decode("0123456789bc"), 0x00443214c74254b0ULL);
    EXPECT_EQ(base32::decode("zzzzzzzzzzzz"), 0xFFFFFFFFFFFFFFF0ULL);
}

TEST(Base32Test, DecodeThenEncodeFullLength) {
    const std::string hashes[] = {"c216nekg2kyz", "s00000000000", "gcpvj0duq533", "zzzzzzz60tw6"};
    for (const auto& hash : hashes) {
        EXPECT_EQ(base32::encode(base32::decode(hash)), hash);
    }
}

TEST(Base32Test, DecodeIgnoresSymbolsPastTwelve) {
    EXPECT_EQ(base32::decode("u4pruydqqvj8zzz"), base32::decode("u4pruydqqvj8"));
}

TEST(Base32Test, DecodeTreatsInvalidSymbolsAsZero) {
    EXPECT_EQ(base32::decode("ea"), base32::decode("e0"));
}
