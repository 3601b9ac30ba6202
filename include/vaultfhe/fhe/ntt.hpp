/**
 * @file ntt.hpp
 * @brief Negacyclic Number Theoretic Transform over Z_q[x]/(x^n + 1)
 *
 * Harvey butterflies with lazy reduction:
 * - Forward: Cooley-Tukey decimation-in-time, bit-reversed root powers
 * - Inverse: Gentleman-Sande decimation-in-frequency, scrambled inverse
 *   root powers, scaling by n^{-1} folded into the last stage
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_NTT_HPP
#define VAULTFHE_FHE_NTT_HPP

#include "vaultfhe/fhe/modular_ops.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vaultfhe {
namespace fhe {

// ============================================================================
// NTTTables
// ============================================================================

/**
 * @brief Precomputed twiddle factors for one (n, q) pair
 *
 * Immutable after construction and safe to share between threads.
 */
class NTTTables {
public:
    /**
     * @param log_n log2 of the ring degree
     * @param modulus Prime with q = 1 (mod 2n)
     * @throws std::invalid_argument if q does not support a 2n-th root of unity
     */
    NTTTables(int log_n, const Modulus& modulus);

    size_t coeff_count() const noexcept { return coeff_count_; }
    int coeff_count_power() const noexcept { return coeff_count_power_; }
    const Modulus& modulus() const noexcept { return modulus_; }
    uint64_t root() const noexcept { return root_; }
    uint64_t two_times_modulus() const noexcept { return two_times_modulus_; }

    const MultiplyUIntModOperand* root_powers() const noexcept { return root_powers_.data(); }
    const MultiplyUIntModOperand* inv_root_powers() const noexcept { return inv_root_powers_.data(); }
    const MultiplyUIntModOperand& inv_degree_modulo() const noexcept { return inv_degree_modulo_; }

    static size_t bit_reverse(size_t x, int bits);

private:
    void initialize();
    uint64_t find_minimal_primitive_root() const;

    int coeff_count_power_;
    size_t coeff_count_;
    Modulus modulus_;
    uint64_t root_ = 0;
    uint64_t inv_root_ = 0;
    uint64_t two_times_modulus_;

    // root_powers_[bit_reverse(i)] = root^i
    std::vector<MultiplyUIntModOperand> root_powers_;
    // inv_root_powers_[bit_reverse(i - 1) + 1] = root^{-i}
    std::vector<MultiplyUIntModOperand> inv_root_powers_;
    MultiplyUIntModOperand inv_degree_modulo_;
};

// ============================================================================
// Transforms
// ============================================================================

/**
 * @brief Forward NTT in place, output in [0, 2q)
 */
void ntt_negacyclic_lazy(uint64_t* operand, const NTTTables& tables);

/**
 * @brief Forward NTT in place, output in [0, q)
 */
void ntt_negacyclic(uint64_t* operand, const NTTTables& tables);

/**
 * @brief Inverse NTT in place including n^{-1} scaling, output in [0, 2q)
 */
void inverse_ntt_negacyclic_lazy(uint64_t* operand, const NTTTables& tables);

/**
 * @brief Inverse NTT in place, output in [0, q)
 */
void inverse_ntt_negacyclic(uint64_t* operand, const NTTTables& tables);

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_NTT_HPP
