/**
 * @file serialization.cpp
 * @brief Binary encode/decode of keys and ciphertexts
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/serialization.hpp"
#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/utils/byte_order.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vaultfhe {
namespace fhe {

namespace {

using byte_order::ByteWriter;
using Reader = byte_order::ByteReader<DeserializationError>;

constexpr char kClientKeyTag[5] = "VFCK";
constexpr char kServerKeyTag[5] = "VFSK";

template <uint32_t W> struct CiphertextTag;
template <> struct CiphertextTag<8>  { static constexpr char value[5] = "VF08"; };
template <> struct CiphertextTag<16> { static constexpr char value[5] = "VF16"; };
template <> struct CiphertextTag<32> { static constexpr char value[5] = "VF32"; };
template <> struct CiphertextTag<64> { static constexpr char value[5] = "VF64"; };

constexpr size_t kHeaderSize = 4 + 4 + 8 + 8;

// ============================================================================
// Writers
// ============================================================================

void write_header(ByteWriter& out, const char (&tag)[5], const SchemeContext& ctx) {
    const ParameterSet& params = ctx.parameters();
    out.put_tag(tag);
    out.put_u32(static_cast<uint32_t>(params.log_n));
    out.put_u64(params.coeff_modulus);
    out.put_u64(params.plain_modulus);
}

void write_poly(ByteWriter& out, const Poly& poly) {
    out.put_u64_array(poly.data(), poly.n());
}

// ============================================================================
// Readers
// ============================================================================

SchemeContextPtr context_for(const char* type_name) {
    // Configuration failures surface as ConfigurationError, not as a bad blob
    SchemeContextPtr ctx = SchemeContext::default_context();
    if (!ctx) {
        throw DeserializationError(type_name, "no scheme context available");
    }
    return ctx;
}

void read_header(Reader& in, const char (&tag)[5], const SchemeContext& ctx) {
    if (in.remaining() < kHeaderSize) {
        in.fail("truncated data");
    }
    if (!in.take_tag(tag)) {
        in.fail("object tag mismatch");
    }
    uint32_t log_n = in.get_u32();
    uint64_t q = in.get_u64();
    uint64_t t = in.get_u64();
    if (!ctx.matches(static_cast<int>(log_n), q, t)) {
        in.fail("parameter set mismatch (log_n=" + std::to_string(log_n) +
                ", q=" + std::to_string(q) + ", t=" + std::to_string(t) + ")");
    }
}

/**
 * @brief Read n coefficients, all required to lie in [0, q)
 */
Poly read_poly(Reader& in, const SchemeContext& ctx) {
    Poly poly(&ctx);
    in.get_u64_array(poly.data(), poly.n());

    uint64_t q = ctx.coeff_modulus().value();
    for (size_t i = 0; i < poly.n(); ++i) {
        if (poly[i] >= q) {
            poly.wipe();
            in.fail("coefficient out of range at index " + std::to_string(i));
        }
    }
    poly.set_ntt_form(true);
    return poly;
}

/**
 * @brief A secret polynomial must be ternary in coefficient form
 */
bool is_ternary(const Poly& secret_ntt) {
    Poly coeffs = secret_ntt;
    coeffs.intt_transform();

    uint64_t q_minus_one = coeffs.context()->coeff_modulus().value() - 1;
    bool ok = true;
    for (size_t i = 0; i < coeffs.n(); ++i) {
        uint64_t c = coeffs[i];
        if (c != 0 && c != 1 && c != q_minus_one) {
            ok = false;
            break;
        }
    }
    coeffs.wipe();
    return ok;
}

template <uint32_t W>
FheUint<W> read_ciphertext(const ByteVec& bytes) {
    const char* name = FheUint<W>::type_name();
    SchemeContextPtr ctx = context_for(name);
    Reader in(bytes, name);

    read_header(in, CiphertextTag<W>::value, *ctx);
    Poly c0 = read_poly(in, *ctx);
    Poly c1 = read_poly(in, *ctx);
    in.expect_end();

    return FheUint<W>(ctx, std::move(c0), std::move(c1));
}

} // namespace

// ============================================================================
// Serialization
// ============================================================================

ByteVec to_bytes(const ClientKey& key) {
    if (key.empty()) {
        throw std::invalid_argument("cannot serialize an empty ClientKey");
    }
    const SchemeContext& ctx = *key.context();

    ByteWriter out(kHeaderSize + 8 + ctx.n() * 8);
    write_header(out, kClientKeyTag, ctx);
    out.put_u64(key.key_id());
    write_poly(out, key.secret());
    return out.take();
}

ByteVec to_bytes(const ServerKey& key) {
    if (key.empty()) {
        throw std::invalid_argument("cannot serialize an empty ServerKey");
    }
    const SchemeContext& ctx = *key.context();
    size_t count = key.relin_key_count();

    ByteWriter out(kHeaderSize + 16 + count * 2 * ctx.n() * 8);
    write_header(out, kServerKeyTag, ctx);
    out.put_u64(key.key_id());
    out.put_u32(key.decomposition_bit_count());
    out.put_u32(static_cast<uint32_t>(count));
    for (size_t i = 0; i < count; ++i) {
        write_poly(out, key.relin_key(i).k0);
        write_poly(out, key.relin_key(i).k1);
    }
    return out.take();
}

template <uint32_t W>
ByteVec to_bytes(const FheUint<W>& ciphertext) {
    if (ciphertext.empty()) {
        throw std::invalid_argument(std::string("cannot serialize an empty ") +
                                    FheUint<W>::type_name());
    }
    const SchemeContext& ctx = *ciphertext.context();

    ByteWriter out(kHeaderSize + 2 * ctx.n() * 8);
    write_header(out, CiphertextTag<W>::value, ctx);
    write_poly(out, ciphertext.c0());
    write_poly(out, ciphertext.c1());
    return out.take();
}

template ByteVec to_bytes<8>(const FheUint<8>&);
template ByteVec to_bytes<16>(const FheUint<16>&);
template ByteVec to_bytes<32>(const FheUint<32>&);
template ByteVec to_bytes<64>(const FheUint<64>&);

// ============================================================================
// Deserialization
// ============================================================================

template <>
ClientKey from_bytes<ClientKey>(const ByteVec& bytes) {
    SchemeContextPtr ctx = context_for("ClientKey");
    Reader in(bytes, "ClientKey");

    read_header(in, kClientKeyTag, *ctx);
    uint64_t key_id = in.get_u64();
    Poly secret = read_poly(in, *ctx);
    in.expect_end();

    if (!is_ternary(secret)) {
        secret.wipe();
        in.fail("secret polynomial is not ternary");
    }
    return ClientKey(ctx, key_id, std::move(secret));
}

template <>
ServerKey from_bytes<ServerKey>(const ByteVec& bytes) {
    SchemeContextPtr ctx = context_for("ServerKey");
    Reader in(bytes, "ServerKey");

    read_header(in, kServerKeyTag, *ctx);
    uint64_t key_id = in.get_u64();
    uint32_t base_bits = in.get_u32();
    uint32_t count = in.get_u32();

    if (base_bits != ctx->parameters().decomposition_bit_count) {
        in.fail("unexpected decomposition base 2^" + std::to_string(base_bits));
    }
    if (count != ctx->decomposition_count()) {
        in.fail("unexpected relinearization key count " + std::to_string(count));
    }

    std::vector<RelinKeyComponent> relin_keys;
    relin_keys.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        RelinKeyComponent component;
        component.k0 = read_poly(in, *ctx);
        component.k1 = read_poly(in, *ctx);
        relin_keys.push_back(std::move(component));
    }
    in.expect_end();

    return ServerKey(ctx, key_id, base_bits, std::move(relin_keys));
}

template <>
FheUint8 from_bytes<FheUint8>(const ByteVec& bytes) { return read_ciphertext<8>(bytes); }

template <>
FheUint16 from_bytes<FheUint16>(const ByteVec& bytes) { return read_ciphertext<16>(bytes); }

template <>
FheUint32 from_bytes<FheUint32>(const ByteVec& bytes) { return read_ciphertext<32>(bytes); }

template <>
FheUint64 from_bytes<FheUint64>(const ByteVec& bytes) { return read_ciphertext<64>(bytes); }

} // namespace fhe
} // namespace vaultfhe
