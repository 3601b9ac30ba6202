/**
 * @file encoding.h
 * @brief Hexadecimal encoding utilities
 *
 * The hex codec is the on-disk text form of serialized key material.
 * Decoding trims surrounding whitespace and is case-insensitive. Any
 * character outside [0-9a-fA-F], including an "0x" prefix, is rejected.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_UTILS_ENCODING_H
#define VAULTFHE_UTILS_ENCODING_H

#include "vaultfhe/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// C API: Hex Encoding/Decoding
// ============================================================================

/**
 * @brief Encode bytes to lowercase hex
 * @param data Input bytes
 * @param len Input length
 * @param hex Output buffer (needs len * 2 + 1 bytes)
 * @param hex_size Output buffer size
 * @return Number of characters written (excluding NUL), 0 on error
 */
VAULTFHE_API size_t vaultfhe_hex_encode(const uint8_t* data, size_t len,
                                        char* hex, size_t hex_size);

/**
 * @brief Decode hex to bytes (no whitespace trimming)
 * @param hex Input text, digits only
 * @param hex_len Input length (0 = strlen)
 * @param data Output buffer
 * @param data_size Output buffer size
 * @return Number of bytes written, 0 on error
 */
VAULTFHE_API size_t vaultfhe_hex_decode(const char* hex, size_t hex_len,
                                        uint8_t* data, size_t data_size);

VAULTFHE_API int vaultfhe_is_hex_char(char c);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "vaultfhe/core/types.h"
#include <string>

namespace vaultfhe {
namespace encoding {

/**
 * @brief Encode bytes to lowercase hex string (total)
 */
std::string hexEncode(const ByteVec& data);
std::string hexEncode(const uint8_t* data, size_t len);

std::string hexEncodeUpper(const ByteVec& data);

/**
 * @brief Decode hex string to bytes
 *
 * Surrounding whitespace is trimmed first. An empty (or all-whitespace)
 * input decodes to an empty vector.
 *
 * @throws MalformedEncoding on odd length or a non-hex character
 */
ByteVec hexDecode(const std::string& hex);

/**
 * @brief Decode hex string, returning empty vector on error
 */
ByteVec hexDecodeSafe(const std::string& hex) noexcept;

/**
 * @brief Check whether the (trimmed) text decodes cleanly
 */
bool isValidHex(const std::string& str) noexcept;

} // namespace encoding

// Convenience aliases at vaultfhe namespace level
using encoding::hexEncode;
using encoding::hexDecode;

} // namespace vaultfhe

#endif // __cplusplus

#endif // VAULTFHE_UTILS_ENCODING_H
