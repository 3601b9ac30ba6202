/**
 * @file ciphertext.hpp
 * @brief Fixed-width encrypted unsigned integers
 *
 * A W-bit value is encoded as W/8 radix-256 digits, least significant
 * first, in the low coefficients of one plaintext polynomial and
 * encrypted as a single BFV ciphertext (c0, c1) in NTT form.
 *
 * A ciphertext carries no reference to the key that produced it.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_CIPHERTEXT_HPP
#define VAULTFHE_FHE_CIPHERTEXT_HPP

#include "vaultfhe/fhe/params.hpp"
#include "vaultfhe/fhe/poly.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace vaultfhe {
namespace fhe {

template <uint32_t W>
struct PlainType;

template <> struct PlainType<8>  { using type = uint8_t;  static constexpr const char* name = "FheUint8"; };
template <> struct PlainType<16> { using type = uint16_t; static constexpr const char* name = "FheUint16"; };
template <> struct PlainType<32> { using type = uint32_t; static constexpr const char* name = "FheUint32"; };
template <> struct PlainType<64> { using type = uint64_t; static constexpr const char* name = "FheUint64"; };

template <uint32_t W>
class FheUint {
    static_assert(W == 8 || W == 16 || W == 32 || W == 64,
                  "FheUint width must be 8, 16, 32 or 64");

public:
    using value_type = typename PlainType<W>::type;
    static constexpr uint32_t bit_width = W;
    static constexpr size_t digit_count = W / 8;

    FheUint() = default;

    FheUint(SchemeContextPtr context, Poly c0, Poly c1)
        : context_(std::move(context))
        , c0_(std::move(c0))
        , c1_(std::move(c1))
    {}

    static const char* type_name() noexcept { return PlainType<W>::name; }

    bool empty() const noexcept { return !context_ || c0_.empty() || c1_.empty(); }
    const SchemeContextPtr& context() const noexcept { return context_; }

    const Poly& c0() const noexcept { return c0_; }
    const Poly& c1() const noexcept { return c1_; }

private:
    SchemeContextPtr context_;
    Poly c0_;
    Poly c1_;
};

using FheUint8 = FheUint<8>;
using FheUint16 = FheUint<16>;
using FheUint32 = FheUint<32>;
using FheUint64 = FheUint<64>;

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_CIPHERTEXT_HPP
