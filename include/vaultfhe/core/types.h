/**
 * @file types.h
 * @brief Type definitions for vaultfhe
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef VAULTFHE_CORE_TYPES_H
#define VAULTFHE_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus

#include <vector>
#include <array>

namespace vaultfhe {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

} // namespace vaultfhe

#endif // __cplusplus

#endif // VAULTFHE_CORE_TYPES_H
