/**
 * @file test_encryption.cpp
 * @brief Unit tests for the encryption engine
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <utility>

#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/fhe/encryptor.hpp"
#include "vaultfhe/fhe/serialization.hpp"

using namespace vaultfhe;
using namespace vaultfhe::fhe;

class EncryptionTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        pair_ = std::make_unique<KeyPair>(generate_keys());
    }

    static void TearDownTestSuite() {
        pair_.reset();
    }

    static const ClientKey& key() { return pair_->client_key; }

    static inline std::unique_ptr<KeyPair> pair_;
};

// ============================================================================
// Width 8
// ============================================================================

TEST_F(EncryptionTest, AllByteValuesEncryptAndDecrypt) {
    for (int v = 0; v < 256; ++v) {
        uint8_t value = static_cast<uint8_t>(v);
        FheUint8 ct;
        ASSERT_NO_THROW(ct = encrypt_u8(key(), value)) << "value " << v;
        ASSERT_FALSE(ct.empty());
        ASSERT_EQ(decrypt_u8(key(), ct), value) << "value " << v;
    }
}

TEST_F(EncryptionTest, EncryptionIsProbabilistic) {
    FheUint8 a = encrypt_u8(key(), 5);
    FheUint8 b = encrypt_u8(key(), 5);
    EXPECT_NE(to_bytes(a), to_bytes(b));
    EXPECT_EQ(decrypt_u8(key(), a), 5);
    EXPECT_EQ(decrypt_u8(key(), b), 5);
}

// ============================================================================
// Wider Types
// ============================================================================

TEST_F(EncryptionTest, Width16) {
    for (uint16_t v : {uint16_t(0), uint16_t(255), uint16_t(256), uint16_t(0xbeef),
                       std::numeric_limits<uint16_t>::max()}) {
        EXPECT_EQ(decrypt_u16(key(), encrypt_u16(key(), v)), v);
    }
}

TEST_F(EncryptionTest, Width32) {
    for (uint32_t v : {0u, 1u, 200u, 70000u, 0xdeadbeefu, std::numeric_limits<uint32_t>::max()}) {
        EXPECT_EQ(decrypt_u32(key(), encrypt_u32(key(), v)), v);
    }
}

TEST_F(EncryptionTest, Width64) {
    for (uint64_t v : {uint64_t(0), uint64_t(0x0123456789abcdefULL),
                       std::numeric_limits<uint64_t>::max()}) {
        EXPECT_EQ(decrypt_u64(key(), encrypt_u64(key(), v)), v);
    }
}

// ============================================================================
// Failure Modes
// ============================================================================

TEST_F(EncryptionTest, ValueOutsideWidthIsRejected) {
    EXPECT_THROW(encrypt<8>(key(), 256), EncryptionError);
    EXPECT_THROW(encrypt<16>(key(), 0x10000), EncryptionError);
    EXPECT_THROW(encrypt<32>(key(), 0x100000000ULL), EncryptionError);

    EXPECT_EQ(decrypt<8>(key(), encrypt<8>(key(), 255)), 255);
    EXPECT_NO_THROW(encrypt<64>(key(), std::numeric_limits<uint64_t>::max()));
}

TEST_F(EncryptionTest, EmptyKeyIsRejected) {
    ClientKey empty;
    EXPECT_THROW(encrypt_u8(empty, 1), EncryptionError);
    EXPECT_THROW(encrypt_u32(empty, 1), EncryptionError);

    FheUint8 ct = encrypt_u8(key(), 1);
    EXPECT_THROW(decrypt_u8(empty, ct), EncryptionError);
    EXPECT_THROW(decrypt_u8(key(), FheUint8()), EncryptionError);
}

TEST_F(EncryptionTest, WrongKeyDoesNotRecoverPlaintext) {
    KeyPair other = generate_keys();
    int matches = 0;
    for (int i = 0; i < 16; ++i) {
        FheUint32 ct = encrypt_u32(key(), 0x12345678u);
        if (decrypt_u32(other.client_key, ct) == 0x12345678u) ++matches;
    }
    EXPECT_EQ(matches, 0);
}
