/**
 * @file poly.cpp
 * @brief Polynomial arithmetic and samplers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/poly.hpp"
#include "vaultfhe/core/security.h"
#include "vaultfhe/utils/random.h"

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace vaultfhe {
namespace fhe {

// ============================================================================
// Poly
// ============================================================================

void Poly::check_compatible(const Poly& other, const char* op) const {
    if (context_ == nullptr || other.context_ == nullptr || data_.size() != other.data_.size()) {
        throw std::invalid_argument(std::string("operand shape mismatch in ") + op);
    }
    if (is_ntt_form_ != other.is_ntt_form_) {
        throw std::invalid_argument(std::string("NTT form mismatch in ") + op);
    }
}

void Poly::ntt_transform() {
    if (is_ntt_form_ || empty()) return;
    ntt_negacyclic(data_.data(), context_->ntt_tables());
    is_ntt_form_ = true;
}

void Poly::intt_transform() {
    if (!is_ntt_form_ || empty()) return;
    inverse_ntt_negacyclic(data_.data(), context_->ntt_tables());
    is_ntt_form_ = false;
}

Poly& Poly::operator+=(const Poly& other) {
    check_compatible(other, "addition");
    const Modulus& mod = context_->coeff_modulus();
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] = add_uint_mod(data_[i], other.data_[i], mod);
    }
    return *this;
}

Poly& Poly::operator-=(const Poly& other) {
    check_compatible(other, "subtraction");
    const Modulus& mod = context_->coeff_modulus();
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] = sub_uint_mod(data_[i], other.data_[i], mod);
    }
    return *this;
}

Poly& Poly::operator*=(const Poly& other) {
    check_compatible(other, "multiplication");
    if (!is_ntt_form_) {
        throw std::invalid_argument("Both polynomials must be in NTT form for multiplication");
    }
    const Modulus& mod = context_->coeff_modulus();
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] = multiply_uint_mod(data_[i], other.data_[i], mod);
    }
    return *this;
}

Poly& Poly::negate() {
    if (empty()) return *this;
    const Modulus& mod = context_->coeff_modulus();
    for (auto& c : data_) {
        c = negate_uint_mod(c, mod);
    }
    return *this;
}

Poly& Poly::multiply_scalar(uint64_t scalar) {
    if (empty()) return *this;
    const Modulus& mod = context_->coeff_modulus();
    MultiplyUIntModOperand s;
    s.set(scalar % mod.value(), mod);
    for (auto& c : data_) {
        c = multiply_uint_mod(c, s, mod);
    }
    return *this;
}

void Poly::wipe() noexcept {
    if (!data_.empty()) {
        vaultfhe_secure_zero(data_.data(), data_.size() * sizeof(uint64_t));
    }
}

// ============================================================================
// Samplers
// ============================================================================

namespace {

void require_allocated(const Poly* out) {
    if (!out || out->empty() || out->context() == nullptr) {
        throw std::invalid_argument("Output polynomial must be allocated with context");
    }
}

} // namespace

void sample_uniform(Poly* out, SecureRandom& rng) {
    require_allocated(out);
    uint64_t q = out->context()->coeff_modulus().value();
    for (size_t i = 0; i < out->n(); ++i) {
        (*out)[i] = rng.uniform(q);
    }
    out->set_ntt_form(false);
}

void sample_ternary(Poly* out, SecureRandom& rng) {
    require_allocated(out);
    const Modulus& mod = out->context()->coeff_modulus();
    for (size_t i = 0; i < out->n(); ++i) {
        int64_t v = static_cast<int64_t>(rng.uniform(3)) - 1;
        (*out)[i] = from_signed(v, mod);
    }
    out->set_ntt_form(false);
}

void sample_gaussian(Poly* out, SecureRandom& rng) {
    require_allocated(out);
    const ParameterSet& params = out->context()->parameters();
    const Modulus& mod = out->context()->coeff_modulus();

    std::normal_distribution<double> gaussian(0.0, params.noise_standard_deviation);
    for (size_t i = 0; i < out->n(); ++i) {
        double sample;
        do {
            sample = std::round(gaussian(rng));
        } while (std::fabs(sample) > params.noise_max_deviation);
        (*out)[i] = from_signed(static_cast<int64_t>(sample), mod);
    }
    out->set_ntt_form(false);
}

} // namespace fhe
} // namespace vaultfhe
