/**
 * @file params.hpp
 * @brief BFV parameter set and the shared scheme context
 *
 * One fixed configuration is used for every key and ciphertext:
 * ring degree n = 2048, 54-bit NTT prime q, plaintext modulus t = 256.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_PARAMS_HPP
#define VAULTFHE_FHE_PARAMS_HPP

#include "vaultfhe/fhe/modular_ops.hpp"
#include "vaultfhe/fhe/ntt.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace vaultfhe {
namespace fhe {

// ============================================================================
// Parameter Set
// ============================================================================

struct ParameterSet {
    int log_n;                      ///< log2 of the ring degree
    uint64_t coeff_modulus;         ///< q, prime with q = 1 (mod 2n)
    uint64_t plain_modulus;         ///< t
    double noise_standard_deviation;
    double noise_max_deviation;     ///< Gaussian samples are clipped to this bound
    uint32_t decomposition_bit_count; ///< log2 of the relinearization base

    size_t poly_degree() const noexcept { return static_cast<size_t>(1) << log_n; }
};

/**
 * @brief The single configuration used by key generation
 */
ParameterSet default_parameters() noexcept;

// ============================================================================
// Scheme Context
// ============================================================================

/**
 * @brief Validated parameters plus precomputed tables
 *
 * Immutable after construction. Shared through
 * std::shared_ptr<const SchemeContext>.
 */
class SchemeContext {
    struct PrivateTag {};

public:
    /// Use create(); the tag keeps construction behind validation
    SchemeContext(PrivateTag, const ParameterSet& params, const Modulus& q);

    /**
     * @brief Validate the parameter set and precompute NTT tables
     * @throws ConfigurationError if any parameter is unusable
     */
    static std::shared_ptr<const SchemeContext> create(const ParameterSet& params);

    /**
     * @brief Process-wide context for default_parameters()
     *
     * Built on first use. If construction fails the ConfigurationError
     * propagates and the next call retries.
     */
    static std::shared_ptr<const SchemeContext> default_context();

    const ParameterSet& parameters() const noexcept { return params_; }
    size_t n() const noexcept { return params_.poly_degree(); }
    const Modulus& coeff_modulus() const noexcept { return q_; }
    uint64_t plain_modulus() const noexcept { return params_.plain_modulus; }
    const NTTTables& ntt_tables() const noexcept { return ntt_tables_; }

    /// floor(q / t)
    uint64_t delta() const noexcept { return delta_; }

    /// Number of relinearization key components, ceil(bits(q) / base_bits)
    size_t decomposition_count() const noexcept { return base_powers_.size(); }

    /// 2^(base_bits * i) mod q
    uint64_t base_power(size_t i) const { return base_powers_.at(i); }

    /**
     * @brief Check whether another parameter fingerprint matches this context
     */
    bool matches(int log_n, uint64_t coeff_modulus, uint64_t plain_modulus) const noexcept {
        return log_n == params_.log_n && coeff_modulus == params_.coeff_modulus &&
               plain_modulus == params_.plain_modulus;
    }

private:
    ParameterSet params_;
    Modulus q_;
    NTTTables ntt_tables_;
    uint64_t delta_;
    std::vector<uint64_t> base_powers_;
};

using SchemeContextPtr = std::shared_ptr<const SchemeContext>;

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_PARAMS_HPP
