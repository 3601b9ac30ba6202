/**
 * @file whitelist.hpp
 * @brief Call boundary of the on-chain vault whitelist
 *
 * Covers configuration, address validation and ABI encoding of the
 * whitelist calls. Network transport (JSON-RPC, signing, gas) plugs in
 * behind WhitelistClient.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_LEDGER_WHITELIST_HPP
#define VAULTFHE_LEDGER_WHITELIST_HPP

#include "vaultfhe/core/types.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace vaultfhe {
namespace ledger {

// ============================================================================
// Configuration
// ============================================================================

constexpr uint64_t kDefaultChainId = 11155111;  // Sepolia

struct LedgerConfig {
    std::string rpc_url;
    std::string signer_key;         ///< hex private key of the submitting account
    std::string contract_address;
    uint64_t chain_id = kDefaultChainId;

    /**
     * @brief Read RPC_URL, DEPLOYER_PRIVATE_KEY, WHITELIST_ADDRESS and
     *        optionally CHAIN_ID from the process environment
     *
     * @throws ConfigurationError if a required variable is unset or empty,
     *         or CHAIN_ID is not a decimal integer
     */
    static LedgerConfig from_environment();
};

// ============================================================================
// Addresses
// ============================================================================

class EthAddress {
public:
    static constexpr size_t kSize = 20;

    /**
     * @brief Parse "0x" followed by exactly 40 hex digits (any case)
     * @throws InvalidAddress on any other input
     */
    static EthAddress parse(const std::string& text);

    const std::array<uint8_t, kSize>& bytes() const noexcept { return bytes_; }

    /// Lowercase "0x..." form
    std::string to_string() const;

    bool operator==(const EthAddress& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const EthAddress& other) const noexcept { return bytes_ != other.bytes_; }

private:
    EthAddress() : bytes_{} {}

    std::array<uint8_t, kSize> bytes_;
};

using TransactionId = std::string;

// ============================================================================
// ABI Encoding
// ============================================================================

constexpr uint32_t kAddVaultSelector = 0x256b5a02;       // addVault(address)
constexpr uint32_t kRemoveVaultSelector = 0xceb68c23;    // removeVault(address)
constexpr uint32_t kIsWhitelistedSelector = 0x3af32abf;  // isWhitelisted(address)

/**
 * @brief selector[4] || address left-padded to 32 bytes
 */
ByteVec encode_address_call(uint32_t selector, const EthAddress& address);

ByteVec encode_add_vault_call(const EthAddress& address);
ByteVec encode_remove_vault_call(const EthAddress& address);
ByteVec encode_is_whitelisted_call(const EthAddress& address);

/**
 * @brief Decode a 32-byte ABI-encoded bool
 * @throws LedgerError on any other length or a value other than 0 or 1
 */
bool decode_bool_result(const ByteVec& result);

// ============================================================================
// Client Interface
// ============================================================================

class WhitelistClient {
public:
    virtual ~WhitelistClient() = default;

    /**
     * @brief Submit addVault(address) and return the transaction hash
     * @throws LedgerError on network or transaction failure
     */
    virtual TransactionId submit_whitelist_add(const EthAddress& address) = 0;

    /**
     * @throws LedgerError on network failure
     */
    virtual bool is_whitelisted(const EthAddress& address) = 0;
};

/**
 * @brief Create the transport-backed client for config
 *
 * @throws ConfigurationError if config is incomplete
 * @throws LedgerError if no transport is available in this build
 */
std::unique_ptr<WhitelistClient> make_whitelist_client(const LedgerConfig& config);

} // namespace ledger
} // namespace vaultfhe

#endif // VAULTFHE_LEDGER_WHITELIST_HPP
