/**
 * @file cli_utils.h
 * @brief Common utility functions for vaultfhe CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_CLI_UTILS_H
#define VAULTFHE_CLI_UTILS_H

#include "vaultfhe/core/errors.hpp"

#include <cstdint>
#include <iostream>
#include <string>

namespace vaultfhe {
namespace cli {

// ============================================================================
// Exit Codes
// ============================================================================

enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitConfiguration = 2,
    kExitStorage = 3,
    kExitMalformedEncoding = 4,
    kExitDeserialization = 5,
    kExitEncryption = 6,
    kExitInvalidAddress = 7,
    kExitLedger = 8,
    kExitInternal = 9
};

inline int exit_code_for(vaultfhe_error_t code) {
    switch (code) {
        case VAULTFHE_ERROR_CONFIGURATION:      return kExitConfiguration;
        case VAULTFHE_ERROR_STORAGE_WRITE:
        case VAULTFHE_ERROR_STORAGE_READ:       return kExitStorage;
        case VAULTFHE_ERROR_MALFORMED_ENCODING: return kExitMalformedEncoding;
        case VAULTFHE_ERROR_DESERIALIZATION:    return kExitDeserialization;
        case VAULTFHE_ERROR_ENCRYPTION:         return kExitEncryption;
        case VAULTFHE_ERROR_INVALID_ADDRESS:    return kExitInvalidAddress;
        case VAULTFHE_ERROR_LEDGER:             return kExitLedger;
        default:                                return kExitInternal;
    }
}

/**
 * @brief Print "Error: <kind>: <message>" and return the matching exit code
 */
inline int report_error(const Error& e) {
    std::cerr << "Error: " << vaultfhe_error_string(e.code()) << ": " << e.what() << "\n";
    return exit_code_for(e.code());
}

// ============================================================================
// Argument Parsing
// ============================================================================

/**
 * @brief Parse a non-negative decimal integer without wrap-around
 */
inline bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 20) return false;
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

inline bool parse_width(const std::string& text, uint32_t& width) {
    uint64_t value = 0;
    if (!parse_u64(text, value)) return false;
    if (value != 8 && value != 16 && value != 32 && value != 64) return false;
    width = static_cast<uint32_t>(value);
    return true;
}

inline bool is_help_flag(const std::string& arg) {
    return arg == "--help" || arg == "-h";
}

} // namespace cli
} // namespace vaultfhe

#endif // VAULTFHE_CLI_UTILS_H
