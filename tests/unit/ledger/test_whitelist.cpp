/**
 * @file test_whitelist.cpp
 * @brief Unit tests for whitelist address parsing and call encoding
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/ledger/whitelist.hpp"
#include "vaultfhe/utils/encoding.h"

using namespace vaultfhe;
using namespace vaultfhe::ledger;

namespace {

const char* kVault = "0x5FbDB2315678afecb367f032d93F642f64180aa3";

} // namespace

// ============================================================================
// Address Parsing
// ============================================================================

TEST(EthAddressTest, ParsesMixedCase) {
    EthAddress addr = EthAddress::parse(kVault);
    EXPECT_EQ(addr.to_string(), "0x5fbdb2315678afecb367f032d93f642f64180aa3");
    EXPECT_EQ(addr.bytes()[0], 0x5f);
    EXPECT_EQ(addr.bytes()[19], 0xa3);

    EXPECT_EQ(EthAddress::parse("0X5FBDB2315678AFECB367F032D93F642F64180AA3"), addr);
}

TEST(EthAddressTest, RejectsMalformedInput) {
    EXPECT_THROW(EthAddress::parse(""), InvalidAddress);
    EXPECT_THROW(EthAddress::parse("0x"), InvalidAddress);
    EXPECT_THROW(EthAddress::parse("0x1234"), InvalidAddress);
    EXPECT_THROW(EthAddress::parse("not-an-address"), InvalidAddress);
    // Missing prefix
    EXPECT_THROW(EthAddress::parse("5fbdb2315678afecb367f032d93f642f64180aa3"), InvalidAddress);
    // 41 digits
    EXPECT_THROW(EthAddress::parse("0x5fbdb2315678afecb367f032d93f642f64180aa3f"), InvalidAddress);
    // Second prefix in place of digits
    EXPECT_THROW(EthAddress::parse("0x0x5fbdb2315678afecb367f032d93f642f64180a"), InvalidAddress);
    // Non-hex digit
    EXPECT_THROW(EthAddress::parse("0x5fbdb2315678afecb367f032d93f642f64180aag"), InvalidAddress);
}

TEST(EthAddressTest, ErrorCode) {
    try {
        EthAddress::parse("0xzz");
        FAIL() << "expected InvalidAddress";
    } catch (const InvalidAddress& e) {
        EXPECT_EQ(e.code(), VAULTFHE_ERROR_INVALID_ADDRESS);
    }
}

// ============================================================================
// Call Encoding
// ============================================================================

TEST(CallEncodingTest, AddVaultCalldata) {
    ByteVec data = encode_add_vault_call(EthAddress::parse(kVault));
    ASSERT_EQ(data.size(), 36u);
    EXPECT_EQ(encoding::hexEncode(data),
              "256b5a02"
              "0000000000000000000000005fbdb2315678afecb367f032d93f642f64180aa3");
}

TEST(CallEncodingTest, SelectorsDiffer) {
    EthAddress addr = EthAddress::parse(kVault);
    EXPECT_EQ(encoding::hexEncode(encode_remove_vault_call(addr)).substr(0, 8), "ceb68c23");
    EXPECT_EQ(encoding::hexEncode(encode_is_whitelisted_call(addr)).substr(0, 8), "3af32abf");
    EXPECT_EQ(encode_address_call(kAddVaultSelector, addr), encode_add_vault_call(addr));
}

TEST(CallEncodingTest, DecodeBoolResult) {
    ByteVec word(32, 0);
    EXPECT_FALSE(decode_bool_result(word));

    word[31] = 1;
    EXPECT_TRUE(decode_bool_result(word));

    word[31] = 2;
    EXPECT_THROW(decode_bool_result(word), LedgerError);

    ByteVec high(32, 0);
    high[0] = 1;
    EXPECT_THROW(decode_bool_result(high), LedgerError);

    EXPECT_THROW(decode_bool_result(ByteVec(31, 0)), LedgerError);
    EXPECT_THROW(decode_bool_result(ByteVec()), LedgerError);
}

// ============================================================================
// Configuration
// ============================================================================

class LedgerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("RPC_URL");
        unsetenv("DEPLOYER_PRIVATE_KEY");
        unsetenv("WHITELIST_ADDRESS");
        unsetenv("CHAIN_ID");
    }

    static void set_required() {
        setenv("RPC_URL", "http://127.0.0.1:8545", 1);
        setenv("DEPLOYER_PRIVATE_KEY", "0x01", 1);
        setenv("WHITELIST_ADDRESS", kVault, 1);
    }
};

TEST_F(LedgerConfigTest, ReadsEnvironment) {
    set_required();
    LedgerConfig config = LedgerConfig::from_environment();
    EXPECT_EQ(config.rpc_url, "http://127.0.0.1:8545");
    EXPECT_EQ(config.contract_address, kVault);
    EXPECT_EQ(config.chain_id, kDefaultChainId);

    setenv("CHAIN_ID", "31337", 1);
    EXPECT_EQ(LedgerConfig::from_environment().chain_id, 31337u);
}

TEST_F(LedgerConfigTest, MissingVariablesThrow) {
    EXPECT_THROW(LedgerConfig::from_environment(), ConfigurationError);

    set_required();
    setenv("RPC_URL", "", 1);
    EXPECT_THROW(LedgerConfig::from_environment(), ConfigurationError);
}

TEST_F(LedgerConfigTest, BadChainIdThrows) {
    set_required();
    setenv("CHAIN_ID", "sepolia", 1);
    EXPECT_THROW(LedgerConfig::from_environment(), ConfigurationError);
    setenv("CHAIN_ID", "0", 1);
    EXPECT_THROW(LedgerConfig::from_environment(), ConfigurationError);
}

TEST_F(LedgerConfigTest, ClientFactory) {
    LedgerConfig config;
    EXPECT_THROW(make_whitelist_client(config), ConfigurationError);

    config.rpc_url = "http://127.0.0.1:8545";
    config.signer_key = "0x01";
    config.contract_address = "0x1234";
    EXPECT_THROW(make_whitelist_client(config), InvalidAddress);

    config.contract_address = kVault;
    try {
        make_whitelist_client(config);
        FAIL() << "expected LedgerError";
    } catch (const LedgerError& e) {
        EXPECT_EQ(e.code(), VAULTFHE_ERROR_LEDGER);
        EXPECT_NE(std::string(e.what()).find("calldata"), std::string::npos);
    }
}
