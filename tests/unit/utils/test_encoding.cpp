/**
 * @file test_encoding.cpp
 * @brief Unit tests for the hex codec
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/utils/encoding.h"

using namespace vaultfhe;

// ============================================================================
// Encoding
// ============================================================================

TEST(HexEncodeTest, EmptyInput) {
    EXPECT_EQ(hexEncode(ByteVec{}), "");
}

TEST(HexEncodeTest, LowercaseOutput) {
    ByteVec data = {0x00, 0x0f, 0xab, 0xff, 0x48};
    EXPECT_EQ(hexEncode(data), "000fabff48");
    EXPECT_EQ(encoding::hexEncodeUpper(data), "000FABFF48");
}

TEST(HexEncodeTest, RoundTripAssortedSequences) {
    std::vector<ByteVec> samples = {
        {},
        {0x00},
        {0xff},
        {0x00, 0x00, 0x00},
        {0xde, 0xad, 0xbe, 0xef},
    };
    ByteVec all_bytes(256);
    for (size_t i = 0; i < all_bytes.size(); ++i) {
        all_bytes[i] = static_cast<uint8_t>(i);
    }
    samples.push_back(all_bytes);
    samples.push_back(ByteVec(4096, 0x5a));

    for (const auto& sample : samples) {
        EXPECT_EQ(hexDecode(hexEncode(sample)), sample);
    }
}

// ============================================================================
// Decoding
// ============================================================================

TEST(HexDecodeTest, CaseInsensitive) {
    EXPECT_EQ(hexDecode("DeadBEEF"), (ByteVec{0xde, 0xad, 0xbe, 0xef}));
}

TEST(HexDecodeTest, TrimsSurroundingWhitespace) {
    ByteVec hello = hexDecode(" 48656c6c6f \n");
    EXPECT_EQ(std::string(hello.begin(), hello.end()), "Hello");

    EXPECT_EQ(hexDecode("\t\r\n0102\r\n"), (ByteVec{0x01, 0x02}));
}

TEST(HexDecodeTest, RejectsPrefix) {
    EXPECT_THROW(hexDecode("0x0102"), MalformedEncoding);
    EXPECT_THROW(hexDecode("0X48656c6c6f"), MalformedEncoding);
    EXPECT_THROW(hexDecode("0x"), MalformedEncoding);
    EXPECT_THROW(hexDecode(" 0xab\n"), MalformedEncoding);
}

TEST(HexDecodeTest, EmptyAndBlankDecodeToEmpty) {
    EXPECT_TRUE(hexDecode("").empty());
    EXPECT_TRUE(hexDecode("   \n").empty());
}

TEST(HexDecodeTest, RejectsNonHexCharacters) {
    EXPECT_THROW(hexDecode("zz11"), MalformedEncoding);
    EXPECT_THROW(hexDecode("12 34"), MalformedEncoding);
    EXPECT_THROW(hexDecode("0g"), MalformedEncoding);
}

TEST(HexDecodeTest, RejectsOddLength) {
    EXPECT_THROW(hexDecode("123"), MalformedEncoding);
    EXPECT_THROW(hexDecode(" a "), MalformedEncoding);
}

TEST(HexDecodeTest, ErrorCarriesCodeButNotContent) {
    try {
        hexDecode("00secret");
        FAIL() << "expected MalformedEncoding";
    } catch (const MalformedEncoding& e) {
        EXPECT_EQ(e.code(), VAULTFHE_ERROR_MALFORMED_ENCODING);
        EXPECT_EQ(std::string(e.what()).find("secret"), std::string::npos);
    }
}

TEST(HexDecodeTest, SafeAndValidityHelpers) {
    EXPECT_TRUE(encoding::hexDecodeSafe("zz").empty());
    EXPECT_EQ(encoding::hexDecodeSafe("ff"), ByteVec{0xff});

    EXPECT_TRUE(encoding::isValidHex(" ABcd\n"));
    EXPECT_FALSE(encoding::isValidHex("0xABcd"));
    EXPECT_FALSE(encoding::isValidHex("abc"));
    EXPECT_FALSE(encoding::isValidHex("zz"));
}

// ============================================================================
// C API
// ============================================================================

TEST(HexCApiTest, EncodeDecode) {
    const uint8_t data[] = {0x01, 0xab, 0xff};
    char hex[7];
    ASSERT_EQ(vaultfhe_hex_encode(data, sizeof(data), hex, sizeof(hex)), 6u);
    EXPECT_STREQ(hex, "01abff");

    uint8_t out[3] = {0};
    ASSERT_EQ(vaultfhe_hex_decode(hex, 0, out, sizeof(out)), 3u);
    EXPECT_EQ(std::memcmp(out, data, sizeof(data)), 0);
}

TEST(HexCApiTest, ErrorsReturnZero) {
    const uint8_t data[] = {0x01, 0x02};
    char small[4];
    EXPECT_EQ(vaultfhe_hex_encode(data, sizeof(data), small, sizeof(small)), 0u);

    uint8_t out[4];
    EXPECT_EQ(vaultfhe_hex_decode("abc", 3, out, sizeof(out)), 0u);
    EXPECT_EQ(vaultfhe_hex_decode("zz", 2, out, sizeof(out)), 0u);
    EXPECT_EQ(vaultfhe_hex_decode("0x0102", 6, out, sizeof(out)), 0u);
    EXPECT_EQ(vaultfhe_hex_decode("aabbccddee", 10, out, sizeof(out)), 0u);

    EXPECT_TRUE(vaultfhe_is_hex_char('F'));
    EXPECT_FALSE(vaultfhe_is_hex_char('x'));
}
