/**
 * @file error.cpp
 * @brief Error code descriptions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/core/common.h"

const char* vaultfhe_error_string(vaultfhe_error_t error) {
    switch (error) {
        case VAULTFHE_SUCCESS:
            return "Success";
        case VAULTFHE_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case VAULTFHE_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case VAULTFHE_ERROR_RANDOM_FAILED:
            return "Random generation failed";
        case VAULTFHE_ERROR_CONFIGURATION:
            return "Configuration error";
        case VAULTFHE_ERROR_STORAGE_WRITE:
            return "Storage write error";
        case VAULTFHE_ERROR_STORAGE_READ:
            return "Storage read error";
        case VAULTFHE_ERROR_MALFORMED_ENCODING:
            return "Malformed encoding";
        case VAULTFHE_ERROR_DESERIALIZATION:
            return "Deserialization error";
        case VAULTFHE_ERROR_ENCRYPTION:
            return "Encryption error";
        case VAULTFHE_ERROR_INVALID_ADDRESS:
            return "Invalid address";
        case VAULTFHE_ERROR_LEDGER:
            return "Ledger error";
        case VAULTFHE_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}
