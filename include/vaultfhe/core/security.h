/**
 * @file security.h
 * @brief Security primitives for vaultfhe
 *
 * Secure memory wiping, constant-time comparison and the platform CSPRNG.
 * Secret key material is wiped with vaultfhe_secure_zero before release.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_CORE_SECURITY_H
#define VAULTFHE_CORE_SECURITY_H

#include "vaultfhe/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Secure memory zeroing
 *
 * Guaranteed not to be optimized away by the compiler.
 *
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
VAULTFHE_API void vaultfhe_secure_zero(void* ptr, size_t len);

/**
 * @brief Constant-time memory comparison
 * @return 0 if equal, non-zero if different (but NOT the position of difference)
 */
VAULTFHE_API int vaultfhe_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Fill buffer from the platform CSPRNG
 *
 * Linux: getrandom() syscall with /dev/urandom fallback.
 *
 * @param buf Output buffer
 * @param len Number of bytes
 * @return VAULTFHE_SUCCESS or VAULTFHE_ERROR_RANDOM_FAILED
 */
VAULTFHE_API vaultfhe_error_t vaultfhe_random_bytes(uint8_t* buf, size_t len);

#ifdef __cplusplus
}
#endif

#endif // VAULTFHE_CORE_SECURITY_H
