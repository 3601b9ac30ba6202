/**
 * @file serialization.hpp
 * @brief Canonical binary form of keys and ciphertexts
 *
 * Layout (all integers little-endian):
 *
 *   tag[4]      "VFCK" | "VFSK" | "VF08" | "VF16" | "VF32" | "VF64"
 *   log_n u32, q u64, t u64                       parameter fingerprint
 *   ClientKey : key_id u64, s[n]
 *   ServerKey : key_id u64, base_bits u32, count u32, count x (k0[n], k1[n])
 *   FheUint<W>: c0[n], c1[n]
 *
 * Polynomials are written as held in memory: n u64 words in NTT form.
 * The format has no version field.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_SERIALIZATION_HPP
#define VAULTFHE_FHE_SERIALIZATION_HPP

#include "vaultfhe/core/types.h"
#include "vaultfhe/fhe/ciphertext.hpp"
#include "vaultfhe/fhe/keys.hpp"

namespace vaultfhe {
namespace fhe {

// ============================================================================
// Serialization
// ============================================================================

ByteVec to_bytes(const ClientKey& key);
ByteVec to_bytes(const ServerKey& key);

template <uint32_t W>
ByteVec to_bytes(const FheUint<W>& ciphertext);

extern template ByteVec to_bytes<8>(const FheUint<8>&);
extern template ByteVec to_bytes<16>(const FheUint<16>&);
extern template ByteVec to_bytes<32>(const FheUint<32>&);
extern template ByteVec to_bytes<64>(const FheUint<64>&);

// ============================================================================
// Deserialization
// ============================================================================

/**
 * @brief Rebuild an object of type T from to_bytes() output
 *
 * T is one of ClientKey, ServerKey, FheUint8/16/32/64. The result is bound
 * to SchemeContext::default_context().
 *
 * @throws DeserializationError naming T on a wrong tag, a parameter
 *         mismatch, truncation, trailing bytes or out-of-range data
 */
template <typename T>
T from_bytes(const ByteVec& bytes);

template <> ClientKey from_bytes<ClientKey>(const ByteVec& bytes);
template <> ServerKey from_bytes<ServerKey>(const ByteVec& bytes);
template <> FheUint8 from_bytes<FheUint8>(const ByteVec& bytes);
template <> FheUint16 from_bytes<FheUint16>(const ByteVec& bytes);
template <> FheUint32 from_bytes<FheUint32>(const ByteVec& bytes);
template <> FheUint64 from_bytes<FheUint64>(const ByteVec& bytes);

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_SERIALIZATION_HPP
