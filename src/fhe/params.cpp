/**
 * @file params.cpp
 * @brief Parameter validation and scheme context construction
 *
 * Primality of q and t is confirmed with GMP before any table is built.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/params.hpp"
#include "vaultfhe/core/errors.hpp"

#include <gmp.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace vaultfhe {
namespace fhe {

namespace {

// 0x3fffffff000001 = 2^54 - 2^24 + 1
constexpr uint64_t kDefaultCoeffModulus = 0x3fffffff000001ULL;
constexpr int kDefaultLogN = 11;
constexpr uint64_t kDefaultPlainModulus = 256;
constexpr double kNoiseStandardDeviation = 3.2;
constexpr uint32_t kDecompositionBitCount = 16;

constexpr int kPrimalityReps = 40;

bool is_probable_prime(uint64_t value) {
    mpz_t z;
    mpz_init(z);
    mpz_import(z, 1, -1, sizeof(value), 0, 0, &value);
    int result = mpz_probab_prime_p(z, kPrimalityReps);
    mpz_clear(z);
    return result != 0;
}

int bit_length(uint64_t value) {
    int bits = 0;
    while (value) {
        ++bits;
        value >>= 1;
    }
    return bits;
}

void validate(const ParameterSet& params) {
    if (params.log_n < 1 || params.log_n > 17) {
        throw ConfigurationError("log_n must be in [1, 17], got " + std::to_string(params.log_n));
    }

    uint64_t q = params.coeff_modulus;
    uint64_t two_n = 2 * static_cast<uint64_t>(params.poly_degree());
    if (bit_length(q) < 2 || bit_length(q) > 61) {
        throw ConfigurationError("coefficient modulus must be 2..61 bits");
    }
    if (!is_probable_prime(q)) {
        throw ConfigurationError("coefficient modulus " + std::to_string(q) + " is not prime");
    }
    if (q % two_n != 1) {
        throw ConfigurationError("coefficient modulus is not 1 mod 2n");
    }

    uint64_t t = params.plain_modulus;
    if (t < 2 || t >= q) {
        throw ConfigurationError("plain modulus must satisfy 2 <= t < q");
    }
    // Power-of-two t keeps byte digits exact; anything else must be prime
    if ((t & (t - 1)) != 0 && !is_probable_prime(t)) {
        throw ConfigurationError("plain modulus " + std::to_string(t) +
                                 " is neither a power of two nor prime");
    }

    if (!(params.noise_standard_deviation > 0.0) ||
        params.noise_max_deviation < params.noise_standard_deviation) {
        throw ConfigurationError("invalid noise distribution parameters");
    }
    if (params.decomposition_bit_count < 1 || params.decomposition_bit_count > 60) {
        throw ConfigurationError("decomposition bit count must be in [1, 60]");
    }
}

} // namespace

ParameterSet default_parameters() noexcept {
    ParameterSet params;
    params.log_n = kDefaultLogN;
    params.coeff_modulus = kDefaultCoeffModulus;
    params.plain_modulus = kDefaultPlainModulus;
    params.noise_standard_deviation = kNoiseStandardDeviation;
    params.noise_max_deviation = 6 * kNoiseStandardDeviation;
    params.decomposition_bit_count = kDecompositionBitCount;
    return params;
}

SchemeContext::SchemeContext(PrivateTag, const ParameterSet& params, const Modulus& q)
    : params_(params)
    , q_(q)
    , ntt_tables_(params.log_n, q)
    , delta_(params.coeff_modulus / params.plain_modulus)
{
    uint32_t base_bits = params.decomposition_bit_count;
    size_t count = (bit_length(params.coeff_modulus) + base_bits - 1) / base_bits;

    uint64_t base = pow_mod(2, base_bits, q_);
    uint64_t power = 1;
    base_powers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        base_powers_.push_back(power);
        power = multiply_uint_mod(power, base, q_);
    }
}

std::shared_ptr<const SchemeContext> SchemeContext::create(const ParameterSet& params) {
    validate(params);
    try {
        Modulus q(params.coeff_modulus);
        return std::make_shared<const SchemeContext>(PrivateTag{}, params, q);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("cannot build NTT tables: ") + e.what());
    }
}

std::shared_ptr<const SchemeContext> SchemeContext::default_context() {
    static const std::shared_ptr<const SchemeContext> context = create(default_parameters());
    return context;
}

} // namespace fhe
} // namespace vaultfhe
