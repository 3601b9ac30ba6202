/**
 * @file vaultfhe_main.cpp
 * @brief vaultfhe Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   vaultfhe <command> [options]
 *
 * Commands:
 *   keygen            Generate and persist an FHE key pair
 *   encrypt           Encrypt an integer under a stored client key
 *   decrypt           Decrypt a stored ciphertext
 *   add-to-whitelist  Submit addVault(address) to the whitelist contract
 *   is-whitelisted    Query isWhitelisted(address)
 *   calldata          Print whitelist ABI calldata for an external signer
 *   version           Display version information
 *   help              Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "vaultfhe/version.h"
#include "cli_utils.h"

// Subcommand handlers (forward declarations)
int cmd_keygen(int argc, char* argv[]);
int cmd_encrypt(int argc, char* argv[]);
int cmd_decrypt(int argc, char* argv[]);
int cmd_add_to_whitelist(int argc, char* argv[]);
int cmd_is_whitelisted(int argc, char* argv[]);
int cmd_calldata(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: vaultfhe <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  keygen            Generate and persist an FHE client/server key pair\n";
    std::cout << "  encrypt           Encrypt an unsigned integer under a client key\n";
    std::cout << "  decrypt           Decrypt a ciphertext file with a client key\n";
    std::cout << "  add-to-whitelist  Add a vault address to the on-chain whitelist\n";
    std::cout << "  is-whitelisted    Check whether an address is whitelisted\n";
    std::cout << "  calldata          Print whitelist call data (add, remove, is-whitelisted)\n";
    std::cout << "  version           Display version and build information\n";
    std::cout << "  help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  vaultfhe keygen -dir fhe-keys\n";
    std::cout << "  vaultfhe encrypt -key fhe-keys/fheClientKey.hex -width 8 -value 200\n";
    std::cout << "  vaultfhe add-to-whitelist 0x5FbDB2315678afecb367f032d93F642f64180aa3\n\n";
    std::cout << "For command-specific help, use: vaultfhe <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << VAULTFHE_LIBRARY_NAME << " - " << VAULTFHE_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << VAULTFHE_VERSION_STRING << "\n";
    std::cout << "Release Date: " << VAULTFHE_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << VAULTFHE_BUILD_TYPE << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Scheme:\n";
    std::cout << "  - BFV, n = 2048, 54-bit NTT prime, t = 256\n";
    std::cout << "  - FheUint8/16/32/64 as radix-256 digit ciphertexts\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP (parameter validation)\n";
    std::cout << "\n";
}

void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return vaultfhe::cli::kExitOk;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "keygen") {
        return cmd_keygen(argc - 1, argv + 1);
    }
    else if (command == "encrypt") {
        return cmd_encrypt(argc - 1, argv + 1);
    }
    else if (command == "decrypt") {
        return cmd_decrypt(argc - 1, argv + 1);
    }
    else if (command == "add-to-whitelist") {
        return cmd_add_to_whitelist(argc - 1, argv + 1);
    }
    else if (command == "is-whitelisted") {
        return cmd_is_whitelisted(argc - 1, argv + 1);
    }
    else if (command == "calldata") {
        return cmd_calldata(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return vaultfhe::cli::kExitOk;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return vaultfhe::cli::kExitOk;
    }

    std::cerr << "\nError: Unknown command '" << command << "'\n";
    print_usage();
    return vaultfhe::cli::kExitUsage;
}
