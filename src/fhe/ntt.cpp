/**
 * @file ntt.cpp
 * @brief Harvey negacyclic NTT with lazy reduction
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/ntt.hpp"

#include <algorithm>
#include <stdexcept>

namespace vaultfhe {
namespace fhe {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

/**
 * @brief Distinct prime factors by trial division
 *
 * q - 1 of an NTT prime is 2^k times a small cofactor, so this is fast.
 */
std::vector<uint64_t> prime_factors(uint64_t n) {
    std::vector<uint64_t> factors;

    if (n % 2 == 0) {
        factors.push_back(2);
        while (n % 2 == 0) n /= 2;
    }

    for (uint64_t i = 3; i * i <= n; i += 2) {
        if (n % i == 0) {
            factors.push_back(i);
            while (n % i == 0) n /= i;
        }
    }

    if (n > 1) factors.push_back(n);
    return factors;
}

} // namespace

// ============================================================================
// NTTTables
// ============================================================================

size_t NTTTables::bit_reverse(size_t x, int bits) {
    size_t result = 0;
    for (int i = 0; i < bits; ++i) {
        result = (result << 1) | (x & 1);
        x >>= 1;
    }
    return result;
}

uint64_t NTTTables::find_minimal_primitive_root() const {
    uint64_t q = modulus_.value();
    uint64_t order = q - 1;
    uint64_t two_n = 2 * coeff_count_;

    if (order % two_n != 0) {
        throw std::invalid_argument("Modulus does not support NTT for this n");
    }

    // Search for a generator g of Z_q^*; g^((q-1)/2n) is then a primitive 2n-th root
    auto factors = prime_factors(order);
    uint64_t max_search = std::min(q - 1, static_cast<uint64_t>(10000));

    for (uint64_t g = 2; g <= max_search; ++g) {
        bool is_generator = true;
        for (uint64_t p : factors) {
            if (pow_mod(g, order / p, modulus_) == 1) {
                is_generator = false;
                break;
            }
        }
        if (is_generator) {
            return pow_mod(g, order / two_n, modulus_);
        }
    }

    throw std::invalid_argument("Failed to find primitive root");
}

NTTTables::NTTTables(int log_n, const Modulus& modulus)
    : coeff_count_power_(log_n)
    , coeff_count_(static_cast<size_t>(1) << log_n)
    , modulus_(modulus)
    , two_times_modulus_(2 * modulus.value())
{
    if (log_n < 1 || log_n > 17) {
        throw std::invalid_argument("log_n out of range");
    }
    initialize();
}

void NTTTables::initialize() {
    size_t n = coeff_count_;

    root_ = find_minimal_primitive_root();
    inv_root_ = inv_mod(root_, modulus_);

    root_powers_.resize(n);
    inv_root_powers_.resize(n);

    root_powers_[0].set(1, modulus_);
    uint64_t power = root_;
    for (size_t i = 1; i < n; ++i) {
        root_powers_[bit_reverse(i, coeff_count_power_)].set(power, modulus_);
        power = multiply_uint_mod(power, root_, modulus_);
    }

    // Scrambled order matches the access pattern of the inverse butterflies
    inv_root_powers_[0].set(1, modulus_);
    power = inv_root_;
    for (size_t i = 1; i < n; ++i) {
        inv_root_powers_[bit_reverse(i - 1, coeff_count_power_) + 1].set(power, modulus_);
        power = multiply_uint_mod(power, inv_root_, modulus_);
    }

    inv_degree_modulo_.set(inv_mod(static_cast<uint64_t>(n), modulus_), modulus_);
}

// ============================================================================
// Forward NTT (Cooley-Tukey, Decimation-in-Time)
// ============================================================================

void ntt_negacyclic_lazy(uint64_t* operand, const NTTTables& tables) {
    size_t n = tables.coeff_count();
    uint64_t two_q = tables.two_times_modulus();
    const Modulus& modulus = tables.modulus();
    const MultiplyUIntModOperand* root_powers = tables.root_powers();

    size_t t = n;
    size_t root_index = 1;

    for (size_t m = 1; m < n; m <<= 1) {
        t >>= 1;
        for (size_t i = 0; i < m; ++i) {
            const MultiplyUIntModOperand& w = root_powers[root_index++];
            size_t j1 = 2 * i * t;
            size_t j2 = j1 + t;

            for (size_t j = j1; j < j2; ++j) {
                uint64_t x = guard(operand[j], two_q);
                uint64_t wt = multiply_uint_mod_lazy(operand[j + t], w, modulus);
                operand[j] = x + wt;
                operand[j + t] = x + two_q - wt;
            }
        }
    }

    for (size_t i = 0; i < n; ++i) {
        operand[i] = guard(operand[i], two_q);
    }
}

void ntt_negacyclic(uint64_t* operand, const NTTTables& tables) {
    ntt_negacyclic_lazy(operand, tables);

    size_t n = tables.coeff_count();
    uint64_t q = tables.modulus().value();
    for (size_t i = 0; i < n; ++i) {
        if (operand[i] >= q) {
            operand[i] -= q;
        }
    }
}

// ============================================================================
// Inverse NTT (Gentleman-Sande, Decimation-in-Frequency)
// ============================================================================

void inverse_ntt_negacyclic_lazy(uint64_t* operand, const NTTTables& tables) {
    size_t n = tables.coeff_count();
    uint64_t two_q = tables.two_times_modulus();
    const Modulus& modulus = tables.modulus();
    const MultiplyUIntModOperand* inv_root_powers = tables.inv_root_powers();

    size_t gap = 1;
    size_t root_index = 1;

    for (size_t m = n >> 1; m > 1; m >>= 1) {
        size_t offset = 0;
        for (size_t i = 0; i < m; ++i) {
            const MultiplyUIntModOperand& w = inv_root_powers[root_index++];
            uint64_t* x = operand + offset;
            uint64_t* y = x + gap;

            for (size_t j = 0; j < gap; ++j) {
                uint64_t u = *x;
                uint64_t v = *y;
                *x++ = guard(u + v, two_q);
                *y++ = multiply_uint_mod_lazy(u + two_q - v, w, modulus);
            }
            offset += gap << 1;
        }
        gap <<= 1;
    }

    // Last stage folds in the n^{-1} scaling
    const MultiplyUIntModOperand& inv_n = tables.inv_degree_modulo();
    MultiplyUIntModOperand scaled_w;
    scaled_w.set(multiply_uint_mod(inv_root_powers[root_index].operand, inv_n, modulus), modulus);

    uint64_t* x = operand;
    uint64_t* y = x + gap;
    for (size_t j = 0; j < gap; ++j) {
        uint64_t u = guard(*x, two_q);
        uint64_t v = *y;
        *x++ = multiply_uint_mod_lazy(guard(u + v, two_q), inv_n, modulus);
        *y++ = multiply_uint_mod_lazy(u + two_q - v, scaled_w, modulus);
    }
}

void inverse_ntt_negacyclic(uint64_t* operand, const NTTTables& tables) {
    inverse_ntt_negacyclic_lazy(operand, tables);

    size_t n = tables.coeff_count();
    uint64_t q = tables.modulus().value();
    for (size_t i = 0; i < n; ++i) {
        if (operand[i] >= q) {
            operand[i] -= q;
        }
    }
}

} // namespace fhe
} // namespace vaultfhe
