/**
 * @file whitelist.cpp
 * @brief Whitelist configuration, address parsing and call encoding
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/ledger/whitelist.hpp"
#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/utils/encoding.h"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace vaultfhe {
namespace ledger {

namespace {

constexpr size_t kWordSize = 32;

std::string require_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        throw ConfigurationError(std::string("environment variable ") + name + " is not set");
    }
    return value;
}

uint64_t parse_chain_id(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        throw ConfigurationError("CHAIN_ID must be a decimal integer");
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw ConfigurationError("CHAIN_ID must be a decimal integer");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value == 0) {
        throw ConfigurationError("CHAIN_ID must be non-zero");
    }
    return value;
}

} // namespace

// ============================================================================
// LedgerConfig
// ============================================================================

LedgerConfig LedgerConfig::from_environment() {
    LedgerConfig config;
    config.rpc_url = require_env("RPC_URL");
    config.signer_key = require_env("DEPLOYER_PRIVATE_KEY");
    config.contract_address = require_env("WHITELIST_ADDRESS");

    const char* chain_id = std::getenv("CHAIN_ID");
    if (chain_id != nullptr && *chain_id != '\0') {
        config.chain_id = parse_chain_id(chain_id);
    }
    return config;
}

// ============================================================================
// EthAddress
// ============================================================================

EthAddress EthAddress::parse(const std::string& text) {
    if (text.size() != 2 + 2 * kSize || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        throw InvalidAddress("address must be 0x followed by 40 hex digits");
    }

    EthAddress address;
    size_t written = vaultfhe_hex_decode(text.data() + 2, text.size() - 2,
                                         address.bytes_.data(), address.bytes_.size());
    if (written != kSize) {
        throw InvalidAddress("address contains non-hex characters");
    }
    return address;
}

std::string EthAddress::to_string() const {
    return "0x" + encoding::hexEncode(bytes_.data(), bytes_.size());
}

// ============================================================================
// ABI Encoding
// ============================================================================

ByteVec encode_address_call(uint32_t selector, const EthAddress& address) {
    ByteVec data(4 + kWordSize, 0);
    data[0] = static_cast<uint8_t>(selector >> 24);
    data[1] = static_cast<uint8_t>(selector >> 16);
    data[2] = static_cast<uint8_t>(selector >> 8);
    data[3] = static_cast<uint8_t>(selector);

    const auto& raw = address.bytes();
    std::copy(raw.begin(), raw.end(), data.begin() + 4 + (kWordSize - EthAddress::kSize));
    return data;
}

ByteVec encode_add_vault_call(const EthAddress& address) {
    return encode_address_call(kAddVaultSelector, address);
}

ByteVec encode_remove_vault_call(const EthAddress& address) {
    return encode_address_call(kRemoveVaultSelector, address);
}

ByteVec encode_is_whitelisted_call(const EthAddress& address) {
    return encode_address_call(kIsWhitelistedSelector, address);
}

bool decode_bool_result(const ByteVec& result) {
    if (result.size() != kWordSize) {
        throw LedgerError("expected a 32-byte bool, got " + std::to_string(result.size()) +
                          " bytes");
    }
    for (size_t i = 0; i + 1 < kWordSize; ++i) {
        if (result[i] != 0) {
            throw LedgerError("malformed bool result");
        }
    }
    uint8_t last = result[kWordSize - 1];
    if (last > 1) {
        throw LedgerError("malformed bool result");
    }
    return last == 1;
}

// ============================================================================
// Client Factory
// ============================================================================

std::unique_ptr<WhitelistClient> make_whitelist_client(const LedgerConfig& config) {
    if (config.rpc_url.empty() || config.signer_key.empty() || config.contract_address.empty()) {
        throw ConfigurationError("ledger configuration is incomplete");
    }
    // Validates the contract address before reporting the missing transport
    EthAddress::parse(config.contract_address);

    throw LedgerError("no ledger transport is available in this build; "
                      "use 'vaultfhe calldata' and submit with an external signer");
}

} // namespace ledger
} // namespace vaultfhe
