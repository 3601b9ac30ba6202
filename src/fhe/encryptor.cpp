/**
 * @file encryptor.cpp
 * @brief Symmetric BFV encryption of radix-256 digit vectors
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/encryptor.hpp"
#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/utils/random.h"

#include <string>
#include <utility>

namespace vaultfhe {
namespace fhe {

namespace {

constexpr uint32_t kDigitBits = 8;

void require_key(const ClientKey& key) {
    if (key.empty()) {
        throw EncryptionError("client key is empty");
    }
}

bool same_parameters(const SchemeContext& a, const SchemeContext& b) {
    const ParameterSet& p = b.parameters();
    return a.matches(p.log_n, p.coeff_modulus, p.plain_modulus);
}

/**
 * @brief Encrypt digit_count radix-2^8 digits of value
 */
void encrypt_digits(const ClientKey& key, uint64_t value, size_t digit_count,
                    Poly& c0, Poly& c1) {
    const SchemeContext* ctx = key.context().get();
    if (ctx->plain_modulus() < (1u << kDigitBits)) {
        throw EncryptionError("plain modulus too small for byte digits");
    }

    SecureRandom rng;

    // c1 = a; uniform in coefficient form is uniform in NTT form too
    c1 = Poly(ctx);
    sample_uniform(&c1, rng);
    c1.set_ntt_form(true);

    // e + delta * m, built in coefficient form
    Poly noisy_message(ctx);
    sample_gaussian(&noisy_message, rng);
    const Modulus& q = ctx->coeff_modulus();
    for (size_t i = 0; i < digit_count; ++i) {
        uint64_t digit = (value >> (kDigitBits * i)) & 0xFF;
        uint64_t scaled = multiply_uint_mod(digit, ctx->delta(), q);
        noisy_message[i] = add_uint_mod(noisy_message[i], scaled, q);
    }
    noisy_message.ntt_transform();

    // c0 = -(a * s) + e + delta * m
    c0 = c1;
    c0 *= key.secret();
    c0.negate();
    c0 += noisy_message;

    noisy_message.wipe();
}

/**
 * @brief Recover digit_count digits: round(t * (c0 + c1 * s) / q) mod t
 */
uint64_t decrypt_digits(const ClientKey& key, const Poly& c0, const Poly& c1,
                        size_t digit_count) {
    const SchemeContext* ctx = key.context().get();

    Poly phase = c1;
    phase *= key.secret();
    phase += c0;
    phase.intt_transform();

    uint64_t q = ctx->coeff_modulus().value();
    uint64_t t = ctx->plain_modulus();
    uint64_t value = 0;
    for (size_t i = 0; i < digit_count; ++i) {
        uint128_t scaled = static_cast<uint128_t>(phase[i]) * t + (q >> 1);
        uint64_t digit = static_cast<uint64_t>(scaled / q) % t;
        value |= (digit & 0xFF) << (kDigitBits * i);
    }

    phase.wipe();
    return value;
}

} // namespace

template <uint32_t W>
FheUint<W> encrypt(const ClientKey& key, uint64_t value) {
    require_key(key);
    if (W < 64 && (value >> (W % 64)) != 0) {
        throw EncryptionError("value " + std::to_string(value) + " does not fit in " +
                              std::to_string(W) + " bits");
    }

    Poly c0, c1;
    encrypt_digits(key, value, FheUint<W>::digit_count, c0, c1);
    return FheUint<W>(key.context(), std::move(c0), std::move(c1));
}

template <uint32_t W>
typename FheUint<W>::value_type decrypt(const ClientKey& key, const FheUint<W>& ciphertext) {
    require_key(key);
    if (ciphertext.empty()) {
        throw EncryptionError(std::string(FheUint<W>::type_name()) + " ciphertext is empty");
    }
    if (!same_parameters(*key.context(), *ciphertext.context())) {
        throw EncryptionError("ciphertext parameters do not match the client key");
    }

    uint64_t value = decrypt_digits(key, ciphertext.c0(), ciphertext.c1(),
                                    FheUint<W>::digit_count);
    return static_cast<typename FheUint<W>::value_type>(value);
}

template FheUint<8> encrypt<8>(const ClientKey&, uint64_t);
template FheUint<16> encrypt<16>(const ClientKey&, uint64_t);
template FheUint<32> encrypt<32>(const ClientKey&, uint64_t);
template FheUint<64> encrypt<64>(const ClientKey&, uint64_t);

template uint8_t decrypt<8>(const ClientKey&, const FheUint<8>&);
template uint16_t decrypt<16>(const ClientKey&, const FheUint<16>&);
template uint32_t decrypt<32>(const ClientKey&, const FheUint<32>&);
template uint64_t decrypt<64>(const ClientKey&, const FheUint<64>&);

} // namespace fhe
} // namespace vaultfhe
