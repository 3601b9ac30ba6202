/**
 * @file keys.hpp
 * @brief Client/server key types and key pair generation
 *
 * The client key is the BFV secret s (NTT domain). The server key holds
 * relinearization keys for base 2^b decomposition:
 *   ksk0_i = -(a_i * s + e_i) + 2^(b*i) * s^2,  ksk1_i = a_i
 *
 * Both keys of a pair carry the same random key_id. It is bookkeeping
 * only and never enters any cryptographic computation.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_KEYS_HPP
#define VAULTFHE_FHE_KEYS_HPP

#include "vaultfhe/fhe/params.hpp"
#include "vaultfhe/fhe/poly.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vaultfhe {
namespace fhe {

// ============================================================================
// ClientKey
// ============================================================================

/**
 * @brief Secret encryption/decryption key
 *
 * Coefficients are wiped on destruction and before being overwritten by
 * assignment. A default-constructed or
 * moved-from key is empty and rejected by the encryption engine.
 */
class ClientKey {
public:
    ClientKey() noexcept : key_id_(0) {}
    ClientKey(SchemeContextPtr context, uint64_t key_id, Poly secret);
    ~ClientKey();

    ClientKey(const ClientKey&) = default;
    ClientKey& operator=(const ClientKey& other);
    ClientKey(ClientKey&& other) noexcept;
    ClientKey& operator=(ClientKey&& other) noexcept;

    bool empty() const noexcept { return !context_ || secret_.empty(); }
    uint64_t key_id() const noexcept { return key_id_; }
    const SchemeContextPtr& context() const noexcept { return context_; }

    /// Secret polynomial s in NTT form
    const Poly& secret() const noexcept { return secret_; }

private:
    SchemeContextPtr context_;
    uint64_t key_id_;
    Poly secret_;
};

// ============================================================================
// ServerKey
// ============================================================================

struct RelinKeyComponent {
    Poly k0;    ///< -(a_i * s + e_i) + 2^(b*i) * s^2 (NTT form)
    Poly k1;    ///< a_i (NTT form)
};

/**
 * @brief Public evaluation key, valid only with its paired client key
 */
class ServerKey {
public:
    ServerKey() noexcept : key_id_(0), base_bits_(0) {}
    ServerKey(SchemeContextPtr context, uint64_t key_id, uint32_t base_bits,
              std::vector<RelinKeyComponent> relin_keys);

    bool empty() const noexcept { return !context_ || relin_keys_.empty(); }
    uint64_t key_id() const noexcept { return key_id_; }
    const SchemeContextPtr& context() const noexcept { return context_; }

    uint32_t decomposition_bit_count() const noexcept { return base_bits_; }
    size_t relin_key_count() const noexcept { return relin_keys_.size(); }
    const RelinKeyComponent& relin_key(size_t i) const { return relin_keys_.at(i); }

private:
    SchemeContextPtr context_;
    uint64_t key_id_;
    uint32_t base_bits_;
    std::vector<RelinKeyComponent> relin_keys_;
};

// ============================================================================
// Key Pair
// ============================================================================

struct KeyPair {
    ClientKey client_key;
    ServerKey server_key;
};

/**
 * @brief Generate a fresh key pair under the default parameter set
 *
 * @throws ConfigurationError if the scheme context cannot be built or the
 *         platform CSPRNG is unavailable; no partial pair is returned
 */
KeyPair generate_keys();

/**
 * @brief Generate a key pair under an explicit context
 */
KeyPair generate_keys(const SchemeContextPtr& context);

/**
 * @brief True if both keys came from the same generate_keys() call
 */
bool is_paired(const ClientKey& client_key, const ServerKey& server_key) noexcept;

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_KEYS_HPP
