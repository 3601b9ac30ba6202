/**
 * @file encryptor.hpp
 * @brief Encryption and decryption of fixed-width integers
 *
 * Symmetric BFV under the client key:
 *   c1 = a (uniform),  c0 = -(a * s) + e + delta * m
 *
 * Encryption is probabilistic: the same value under the same key yields
 * different ciphertext bytes on every call.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_ENCRYPTOR_HPP
#define VAULTFHE_FHE_ENCRYPTOR_HPP

#include "vaultfhe/fhe/ciphertext.hpp"
#include "vaultfhe/fhe/keys.hpp"

#include <cstdint>

namespace vaultfhe {
namespace fhe {

/**
 * @brief Encrypt a value of declared width W
 *
 * @throws EncryptionError if value does not fit in W bits (never clamped)
 *         or the key is empty
 */
template <uint32_t W>
FheUint<W> encrypt(const ClientKey& key, uint64_t value);

/**
 * @brief Decrypt a ciphertext produced under key
 * @throws EncryptionError if the key or ciphertext is empty or their
 *         parameters differ
 */
template <uint32_t W>
typename FheUint<W>::value_type decrypt(const ClientKey& key, const FheUint<W>& ciphertext);

extern template FheUint<8> encrypt<8>(const ClientKey&, uint64_t);
extern template FheUint<16> encrypt<16>(const ClientKey&, uint64_t);
extern template FheUint<32> encrypt<32>(const ClientKey&, uint64_t);
extern template FheUint<64> encrypt<64>(const ClientKey&, uint64_t);

extern template uint8_t decrypt<8>(const ClientKey&, const FheUint<8>&);
extern template uint16_t decrypt<16>(const ClientKey&, const FheUint<16>&);
extern template uint32_t decrypt<32>(const ClientKey&, const FheUint<32>&);
extern template uint64_t decrypt<64>(const ClientKey&, const FheUint<64>&);

// ============================================================================
// Width-specific Entry Points
// ============================================================================

inline FheUint8 encrypt_u8(const ClientKey& key, uint8_t value) { return encrypt<8>(key, value); }
inline FheUint16 encrypt_u16(const ClientKey& key, uint16_t value) { return encrypt<16>(key, value); }
inline FheUint32 encrypt_u32(const ClientKey& key, uint32_t value) { return encrypt<32>(key, value); }
inline FheUint64 encrypt_u64(const ClientKey& key, uint64_t value) { return encrypt<64>(key, value); }

inline uint8_t decrypt_u8(const ClientKey& key, const FheUint8& ct) { return decrypt<8>(key, ct); }
inline uint16_t decrypt_u16(const ClientKey& key, const FheUint16& ct) { return decrypt<16>(key, ct); }
inline uint32_t decrypt_u32(const ClientKey& key, const FheUint32& ct) { return decrypt<32>(key, ct); }
inline uint64_t decrypt_u64(const ClientKey& key, const FheUint64& ct) { return decrypt<64>(key, ct); }

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_ENCRYPTOR_HPP
