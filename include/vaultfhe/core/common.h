/**
 * @file common.h
 * @brief Common definitions and utility macros for vaultfhe
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef VAULTFHE_CORE_COMMON_H
#define VAULTFHE_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define VAULTFHE_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef VAULTFHE_PLATFORM_WINDOWS
    #ifdef VAULTFHE_SHARED_LIBRARY
        #ifdef VAULTFHE_BUILDING
            #define VAULTFHE_API __declspec(dllexport)
        #else
            #define VAULTFHE_API __declspec(dllimport)
        #endif
    #else
        #define VAULTFHE_API
    #endif
#else
    #ifdef VAULTFHE_SHARED_LIBRARY
        #define VAULTFHE_API __attribute__((visibility("default")))
    #else
        #define VAULTFHE_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    VAULTFHE_SUCCESS = 0,
    VAULTFHE_ERROR_INVALID_PARAM = -1,
    VAULTFHE_ERROR_BUFFER_TOO_SMALL = -2,
    VAULTFHE_ERROR_RANDOM_FAILED = -3,      // CSPRNG failure
    VAULTFHE_ERROR_CONFIGURATION = -4,      // Scheme parameters or config unusable
    VAULTFHE_ERROR_STORAGE_WRITE = -5,
    VAULTFHE_ERROR_STORAGE_READ = -6,
    VAULTFHE_ERROR_MALFORMED_ENCODING = -7, // Bad hex text
    VAULTFHE_ERROR_DESERIALIZATION = -8,    // Binary layout mismatch
    VAULTFHE_ERROR_ENCRYPTION = -9,         // Value outside declared width
    VAULTFHE_ERROR_INVALID_ADDRESS = -10,
    VAULTFHE_ERROR_LEDGER = -11,            // Ledger transaction/network failure
    VAULTFHE_ERROR_INTERNAL = -12
} vaultfhe_error_t;

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
VAULTFHE_API const char* vaultfhe_error_string(vaultfhe_error_t error);

#ifdef __cplusplus
}
#endif

#endif // VAULTFHE_CORE_COMMON_H
