/**
 * @file poly.hpp
 * @brief Polynomials in R_q = Z_q[x]/(x^n + 1)
 *
 * Memory Layout:
 * - n coefficients, each in [0, q)
 * - is_ntt_form_ tracks whether data is in the NTT domain
 *
 * Arithmetic is coefficient-wise, so products require both operands in
 * NTT form.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_POLY_HPP
#define VAULTFHE_FHE_POLY_HPP

#include "vaultfhe/fhe/params.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vaultfhe {

class SecureRandom;

namespace fhe {

class Poly {
public:
    /**
     * @brief Empty polynomial with no context
     */
    Poly() noexcept : context_(nullptr), is_ntt_form_(false) {}

    /**
     * @brief Zero polynomial in coefficient form
     * @param ctx Scheme context; must outlive the polynomial
     */
    explicit Poly(const SchemeContext* ctx)
        : context_(ctx)
        , data_(ctx ? ctx->n() : 0, 0)
        , is_ntt_form_(false)
    {}

    bool empty() const noexcept { return data_.empty(); }
    bool is_ntt_form() const noexcept { return is_ntt_form_; }
    void set_ntt_form(bool ntt_form) noexcept { is_ntt_form_ = ntt_form; }
    size_t n() const noexcept { return data_.size(); }
    const SchemeContext* context() const noexcept { return context_; }

    uint64_t* data() noexcept { return data_.data(); }
    const uint64_t* data() const noexcept { return data_.data(); }

    uint64_t& operator[](size_t i) { return data_[i]; }
    uint64_t operator[](size_t i) const { return data_[i]; }

    // ========================================================================
    // NTT Transforms
    // ========================================================================

    void ntt_transform();
    void intt_transform();

    // ========================================================================
    // Arithmetic
    // ========================================================================

    /**
     * @throws std::invalid_argument on NTT form mismatch
     */
    Poly& operator+=(const Poly& other);
    Poly& operator-=(const Poly& other);

    /**
     * @brief Coefficient-wise product
     * @throws std::invalid_argument unless both operands are in NTT form
     */
    Poly& operator*=(const Poly& other);

    Poly& negate();
    Poly& multiply_scalar(uint64_t scalar);

    bool operator==(const Poly& other) const noexcept {
        return is_ntt_form_ == other.is_ntt_form_ && data_ == other.data_;
    }
    bool operator!=(const Poly& other) const noexcept { return !(*this == other); }

    /**
     * @brief Overwrite coefficients with zeros (secure_zero)
     */
    void wipe() noexcept;

private:
    void check_compatible(const Poly& other, const char* op) const;

    const SchemeContext* context_;
    std::vector<uint64_t> data_;
    bool is_ntt_form_;
};

// ============================================================================
// Samplers (output in coefficient form)
// ============================================================================

/**
 * @brief Uniform coefficients in [0, q)
 */
void sample_uniform(Poly* out, SecureRandom& rng);

/**
 * @brief Uniform ternary coefficients in {-1, 0, 1}
 */
void sample_ternary(Poly* out, SecureRandom& rng);

/**
 * @brief Rounded Gaussian with the context's sigma, rejected beyond max deviation
 */
void sample_gaussian(Poly* out, SecureRandom& rng);

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_POLY_HPP
