#include <gtest/gtest.h>
#include "src/core/hashing/Fingerprint.hpp"

using card_identifier::hashing::Fingerprint;

TEST(FingerprintTest, HexDigitsMapToBitsMostSignificantFirst) {
    const auto fp = Fingerprint::fromHex("00FF");
    EXPECT_EQ(fp.bits(), 16);
    EXPECT_FALSE(fp.bit(0));
    EXPECT_FALSE(fp.bit(7));
    EXPECT_TRUE(fp.bit(8));
    EXPECT_TRUE(fp.bit(15));
    EXPECT_EQ(fp.toHex(), "00ff");
}

TEST(FingerprintTest, HexParsingIsCaseInsensitive) {
    EXPECT_EQ(Fingerprint::fromHex("aBcD"), Fingerprint::fromHex("ABCD"));
}

TEST(FingerprintTest, FromBitsMatchesHexLayout) {
    std::vector<bool> bits(16, false);
    bits[14] = true;
    bits[15] = true;
    EXPECT_EQ(Fingerprint::fromBits(bits), Fingerprint::fromHex("0003"));
}

TEST(FingerprintTest, HammingCountsDifferingBits) {
    const auto zero = Fingerprint::fromHex("0000");
    EXPECT_EQ(zero.hamming(Fingerprint::fromHex("0000")), 0);
    EXPECT_EQ(zero.hamming(Fingerprint::fromHex("0003")), 2);
    EXPECT_EQ(zero.hamming(Fingerprint::fromHex("00FF")), 8);
    EXPECT_EQ(zero.hamming(Fingerprint::fromHex("FFFF")), 16);
}

TEST(FingerprintTest, HammingOverWideFingerprints) {
    const std::string ones(64, 'f');
    const std::string zeros(64, '0');
    EXPECT_EQ(Fingerprint::fromHex(ones).hamming(Fingerprint::fromHex(zeros)), 256);
}

TEST(FingerprintTest, WidthMismatchThrows) {
    EXPECT_THROW(Fingerprint::fromHex("00").hamming(Fingerprint::fromHex("0000")), std::invalid_argument);
}

TEST(FingerprintTest, MalformedHexThrows) {
    EXPECT_THROW(Fingerprint::fromHex(""), std::invalid_argument);
    EXPECT_THROW(Fingerprint::fromHex("00G0"), std::invalid_argument);
}

TEST(FingerprintTest, BitIndexOutOfRangeThrows) {
    const auto fp = Fingerprint::fromHex("00");
    EXPECT_THROW(fp.bit(8), std::out_of_range);
    EXPECT_THROW(fp.bit(-1), std::out_of_range);
}
