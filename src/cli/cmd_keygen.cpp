/**
 * @file cmd_keygen.cpp
 * @brief keygen subcommand: generate and persist an FHE key pair
 *
 * Usage:
 *   vaultfhe keygen [-dir fhe-keys] [-client fheClientKey.hex] [-server fheServerKey.hex]
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <iomanip>
#include <iostream>
#include <string>

#include "vaultfhe/fhe/key_loader.hpp"
#include "vaultfhe/fhe/keys.hpp"
#include "cli_utils.h"

using namespace vaultfhe;

/**
 * @brief Print keygen subcommand help
 */
void print_keygen_help() {
    std::cout << "\nUsage: vaultfhe keygen [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -dir <path>       Output directory, created if absent (default: fhe-keys)\n";
    std::cout << "  -client <name>    Client key file name (default: "
              << fhe::kDefaultClientKeyFileName << ")\n";
    std::cout << "  -server <name>    Server key file name (default: "
              << fhe::kDefaultServerKeyFileName << ")\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Both files hold hex-encoded serialized keys. Keep the client key secret.\n\n";
}

/**
 * @brief keygen subcommand handler
 */
int cmd_keygen(int argc, char* argv[]) {
    std::string dir = "fhe-keys";
    std::string client_name = fhe::kDefaultClientKeyFileName;
    std::string server_name = fhe::kDefaultServerKeyFileName;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-dir" && i + 1 < argc) {
            dir = argv[++i];
        } else if (arg == "-client" && i + 1 < argc) {
            client_name = argv[++i];
        } else if (arg == "-server" && i + 1 < argc) {
            server_name = argv[++i];
        } else if (cli::is_help_flag(arg)) {
            print_keygen_help();
            return cli::kExitOk;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_keygen_help();
            return cli::kExitUsage;
        }
    }

    if (dir.empty() || client_name.empty() || server_name.empty()) {
        std::cerr << "Error: Directory and file names must not be empty\n";
        return cli::kExitUsage;
    }

    try {
        fhe::KeyPaths paths = fhe::KeyPaths::in_directory(dir, client_name, server_name);

        std::cout << "Generating FHE key pair...\n";
        fhe::KeyPair pair = fhe::generate_keys();
        fhe::persist_key_pair(pair, paths);

        std::cout << "Key id:      " << std::hex << std::setw(16) << std::setfill('0')
                  << pair.client_key.key_id() << std::dec << "\n";
        std::cout << "Client key:  " << paths.client_key.string() << "\n";
        std::cout << "Server key:  " << paths.server_key.string() << "\n";
        return cli::kExitOk;

    } catch (const Error& e) {
        return cli::report_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitInternal;
    }
}
