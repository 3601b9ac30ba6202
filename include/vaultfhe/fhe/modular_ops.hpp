/**
 * @file modular_ops.hpp
 * @brief Modular arithmetic over word-sized NTT primes
 *
 * - Modulus with precomputed Barrett constant floor(2^128 / q)
 * - MultiplyUIntModOperand for precomputed Shoup quotients (NTT twiddles)
 * - Lazy variants returning values in [0, 2q)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_MODULAR_OPS_HPP
#define VAULTFHE_FHE_MODULAR_OPS_HPP

#include <cstdint>
#include <stdexcept>

namespace vaultfhe {
namespace fhe {

using uint128_t = unsigned __int128;

// ============================================================================
// Modulus
// ============================================================================

/**
 * @brief Modulus with precomputed Barrett reduction constants
 */
class Modulus {
public:
    Modulus() : value_(0), ratio_hi_(0), ratio_lo_(0) {}

    /**
     * @throws std::invalid_argument if value is 0 or wider than 61 bits
     */
    explicit Modulus(uint64_t value) : value_(value) {
        if (value == 0) {
            throw std::invalid_argument("Modulus cannot be zero");
        }
        if (value >> 61) {
            throw std::invalid_argument("Modulus must be at most 61 bits");
        }
        // floor(2^128 / value) = ratio_hi_ * 2^64 + ratio_lo_
        uint128_t two_64 = static_cast<uint128_t>(1) << 64;
        ratio_hi_ = static_cast<uint64_t>(two_64 / value_);
        uint128_t rem = two_64 % value_;
        ratio_lo_ = static_cast<uint64_t>((rem << 64) / value_);
    }

    inline uint64_t value() const noexcept { return value_; }
    inline bool is_zero() const noexcept { return value_ == 0; }

    /**
     * @brief Barrett reduction of a 128-bit value
     */
    inline uint64_t reduce(uint128_t input) const noexcept {
        uint64_t in_lo = static_cast<uint64_t>(input);
        uint64_t in_hi = static_cast<uint64_t>(input >> 64);

        // High 128 bits of input * ratio, truncated to the quotient estimate
        uint64_t carry = static_cast<uint64_t>((static_cast<uint128_t>(in_lo) * ratio_lo_) >> 64);
        uint128_t mid = static_cast<uint128_t>(in_lo) * ratio_hi_ +
                        static_cast<uint128_t>(in_hi) * ratio_lo_ + carry;
        uint64_t quotient = static_cast<uint64_t>(mid >> 64) + in_hi * ratio_hi_;

        uint64_t result = in_lo - quotient * value_;
        return result >= value_ ? result - value_ : result;
    }

    inline bool operator==(const Modulus& other) const noexcept { return value_ == other.value_; }
    inline bool operator!=(const Modulus& other) const noexcept { return value_ != other.value_; }

private:
    uint64_t value_;
    uint64_t ratio_hi_;
    uint64_t ratio_lo_;
};

// ============================================================================
// MultiplyUIntModOperand
// ============================================================================

/**
 * @brief Operand with precomputed quotient floor((operand << 64) / q)
 *
 * Makes (x * operand) mod q a two-multiply operation; used for twiddles.
 */
struct MultiplyUIntModOperand {
    uint64_t operand;
    uint64_t quotient;

    MultiplyUIntModOperand() : operand(0), quotient(0) {}

    void set(uint64_t new_operand, const Modulus& modulus) {
        operand = new_operand;
        quotient = static_cast<uint64_t>((static_cast<uint128_t>(operand) << 64) / modulus.value());
    }
};

// ============================================================================
// Scalar Modular Arithmetic
// ============================================================================

inline uint64_t add_uint_mod(uint64_t a, uint64_t b, const Modulus& modulus) noexcept {
    uint64_t sum = a + b;
    return sum >= modulus.value() ? sum - modulus.value() : sum;
}

inline uint64_t sub_uint_mod(uint64_t a, uint64_t b, const Modulus& modulus) noexcept {
    return a >= b ? a - b : a + modulus.value() - b;
}

inline uint64_t negate_uint_mod(uint64_t a, const Modulus& modulus) noexcept {
    return a == 0 ? 0 : modulus.value() - a;
}

inline uint64_t multiply_uint_mod(uint64_t a, uint64_t b, const Modulus& modulus) noexcept {
    return modulus.reduce(static_cast<uint128_t>(a) * b);
}

/**
 * @brief (x * y.operand) mod q using the precomputed quotient
 */
inline uint64_t multiply_uint_mod(uint64_t x, const MultiplyUIntModOperand& y,
                                  const Modulus& modulus) noexcept {
    uint64_t q_approx = static_cast<uint64_t>((static_cast<uint128_t>(x) * y.quotient) >> 64);
    uint64_t result = x * y.operand - q_approx * modulus.value();
    return result >= modulus.value() ? result - modulus.value() : result;
}

/**
 * @brief Lazy variant, result in [0, 2q)
 */
inline uint64_t multiply_uint_mod_lazy(uint64_t x, const MultiplyUIntModOperand& y,
                                       const Modulus& modulus) noexcept {
    uint64_t q_approx = static_cast<uint64_t>((static_cast<uint128_t>(x) * y.quotient) >> 64);
    return x * y.operand - q_approx * modulus.value();
}

/**
 * @brief Bring a lazily reduced value back under 2q
 */
inline uint64_t guard(uint64_t value, uint64_t two_times_modulus) noexcept {
    return value >= two_times_modulus ? value - two_times_modulus : value;
}

/**
 * @brief Map a small signed value into [0, q)
 */
inline uint64_t from_signed(int64_t value, const Modulus& modulus) noexcept {
    if (value >= 0) {
        return static_cast<uint64_t>(value) % modulus.value();
    }
    uint64_t magnitude = static_cast<uint64_t>(-value) % modulus.value();
    return negate_uint_mod(magnitude, modulus);
}

// ============================================================================
// Exponentiation and Inversion
// ============================================================================

inline uint64_t pow_mod(uint64_t base, uint64_t exp, const Modulus& modulus) noexcept {
    if (modulus.value() == 1) return 0;

    uint64_t result = 1;
    base %= modulus.value();
    while (exp > 0) {
        if (exp & 1) {
            result = multiply_uint_mod(result, base, modulus);
        }
        exp >>= 1;
        base = multiply_uint_mod(base, base, modulus);
    }
    return result;
}

/**
 * @brief Modular inverse by the extended Euclidean algorithm
 * @throws std::invalid_argument if a is not invertible
 */
inline uint64_t inv_mod(uint64_t a, const Modulus& modulus) {
    a %= modulus.value();
    if (a == 0) {
        throw std::invalid_argument("Cannot compute inverse of zero");
    }

    int64_t t = 0, new_t = 1;
    uint64_t r = modulus.value(), new_r = a;
    while (new_r != 0) {
        uint64_t quotient = r / new_r;
        int64_t tmp_t = t - static_cast<int64_t>(quotient) * new_t;
        t = new_t;
        new_t = tmp_t;
        uint64_t tmp_r = r - quotient * new_r;
        r = new_r;
        new_r = tmp_r;
    }

    if (r != 1) {
        throw std::invalid_argument("Modular inverse does not exist");
    }
    return t < 0 ? static_cast<uint64_t>(t + static_cast<int64_t>(modulus.value()))
                 : static_cast<uint64_t>(t);
}

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_MODULAR_OPS_HPP
