#include <gtest/gtest.h>
#include "helpers/Encoding.hpp"

#include <string>

using namespace NEncoding;

static std::vector<uint8_t> bytesOf(const std::string& s) {
    return {s.begin(), s.end()};
}

TEST(EncodingTest, HexLowercaseOnly) {
    EXPECT_EQ(hexEncode({0x00, 0xab, 0xff}), "00abff");
    ASSERT_TRUE(hexDecode("00abff").has_value());
    EXPECT_EQ(*hexDecode("00abff"), (std::vector<uint8_t>{0x00, 0xab, 0xff}));
    EXPECT_FALSE(hexDecode("00ABFF").has_value());
    EXPECT_FALSE(hexDecode("abc").has_value());
    EXPECT_FALSE(hexDecode("zz").has_value());
}

TEST(EncodingTest, Base58KnownVectors) {
    EXPECT_EQ(base58Encode(bytesOf("hello world")), "StV1DL6CwTryKyV");
    EXPECT_EQ(base58Encode({0x00, 0x00, 0x01}), "112");
    EXPECT_EQ(base58Encode({}), "");

    const auto DECODED = base58Decode("StV1DL6CwTryKyV");
    ASSERT_TRUE(DECODED.has_value());
    EXPECT_EQ(*DECODED, bytesOf("hello world"));
}

TEST(EncodingTest, Base58RejectsAmbiguousCharacters) {
    EXPECT_FALSE(base58Decode("0OIl").has_value());
    EXPECT_FALSE(base58Decode("StV1DL6CwTryKyV=").has_value());
}

TEST(EncodingTest, Base64KnownVectors) {
    EXPECT_EQ(base64Encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytesOf("foobar")), "Zm9vYmFy");

    ASSERT_TRUE(base64Decode("Zm8=").has_value());
    EXPECT_EQ(*base64Decode("Zm8="), bytesOf("fo"));
    ASSERT_TRUE(base64Decode("Zg==").has_value());
    EXPECT_EQ(*base64Decode("Zg=="), bytesOf("f"));

    EXPECT_EQ(base64Encode({}), "");
    ASSERT_TRUE(base64Decode("").has_value());
    EXPECT_TRUE(base64Decode("")->empty());
}

TEST(EncodingTest, Base64SignatureLength) {
    const std::vector<uint8_t> SIGNATURE(64, 0xa5);
    const auto                 ENCODED = base64Encode(SIGNATURE);

    EXPECT_EQ(ENCODED.size(), 88u);
    EXPECT_TRUE(ENCODED.ends_with("=="));
    ASSERT_TRUE(base64Decode(ENCODED).has_value());
    EXPECT_EQ(*base64Decode(ENCODED), SIGNATURE);
}

TEST(EncodingTest, Base64IsStrict) {
    // unpadded, non-canonical trailing bits, foreign alphabet
    EXPECT_FALSE(base64Decode("Zg").has_value());
    EXPECT_FALSE(base64Decode("Zh==").has_value());
    EXPECT_FALSE(base64Decode("-_8=").has_value());

    // surrounding whitespace, padding in the middle, padding only
    EXPECT_FALSE(base64Decode("  Zm9vYmFy  ").has_value());
    EXPECT_FALSE(base64Decode("Zg=A").has_value());
    EXPECT_FALSE(base64Decode("====").has_value());
}

TEST(EncodingTest, Base64UrlNoPadding) {
    EXPECT_EQ(base64UrlEncode({0xfb, 0xff}), "-_8");
    ASSERT_TRUE(base64UrlDecode("-_8").has_value());
    EXPECT_EQ(*base64UrlDecode("-_8"), (std::vector<uint8_t>{0xfb, 0xff}));

    EXPECT_FALSE(base64UrlDecode("-_8=").has_value());
    EXPECT_FALSE(base64UrlDecode("+/8").has_value());
    EXPECT_FALSE(base64UrlDecode("-_9").has_value());
    EXPECT_FALSE(base64UrlDecode("A").has_value());
    EXPECT_FALSE(base64UrlDecode(" -_8").has_value());

    EXPECT_EQ(base64UrlEncode(bytesOf("foobar")), "Zm9vYmFy");
    ASSERT_TRUE(base64UrlDecode("Zm9vYmE").has_value());
    EXPECT_EQ(*base64UrlDecode("Zm9vYmE"), bytesOf("fooba"));
}

TEST(EncodingTest, Base32KnownVectors) {
    EXPECT_EQ(base32Encode(bytesOf("f")), "MY");
    EXPECT_EQ(base32Encode(bytesOf("foobar")), "MZXW6YTBOI");

    ASSERT_TRUE(base32Decode("MZXW6YTBOI").has_value());
    EXPECT_EQ(*base32Decode("MZXW6YTBOI"), bytesOf("foobar"));
}

TEST(EncodingTest, Base32IsStrict) {
    EXPECT_FALSE(base32Decode("MZ").has_value());
    EXPECT_FALSE(base32Decode("MYA").has_value());
    EXPECT_FALSE(base32Decode("my").has_value());
    EXPECT_FALSE(base32Decode("MY======").has_value());
}
