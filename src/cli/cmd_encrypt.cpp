/**
 * @file cmd_encrypt.cpp
 * @brief encrypt / decrypt subcommands
 *
 * Usage:
 *   vaultfhe encrypt -key fheClientKey.hex -width 8 -value 200 [-out ct.hex]
 *   vaultfhe decrypt -key fheClientKey.hex -width 8 -in ct.hex
 *
 * Ciphertext files use the same hex text form as key files.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <iostream>
#include <string>

#include "vaultfhe/fhe/encryptor.hpp"
#include "vaultfhe/fhe/key_loader.hpp"
#include "vaultfhe/fhe/serialization.hpp"
#include "vaultfhe/storage/key_store.hpp"
#include "vaultfhe/utils/encoding.h"
#include "cli_utils.h"

using namespace vaultfhe;

namespace {

template <uint32_t W>
ByteVec encrypt_to_bytes(const fhe::ClientKey& key, uint64_t value) {
    return fhe::to_bytes(fhe::encrypt<W>(key, value));
}

template <uint32_t W>
uint64_t decrypt_from_bytes(const fhe::ClientKey& key, const ByteVec& bytes) {
    return fhe::decrypt<W>(key, fhe::from_bytes<fhe::FheUint<W>>(bytes));
}

ByteVec encrypt_width(const fhe::ClientKey& key, uint32_t width, uint64_t value) {
    switch (width) {
        case 8:  return encrypt_to_bytes<8>(key, value);
        case 16: return encrypt_to_bytes<16>(key, value);
        case 32: return encrypt_to_bytes<32>(key, value);
        default: return encrypt_to_bytes<64>(key, value);
    }
}

uint64_t decrypt_width(const fhe::ClientKey& key, uint32_t width, const ByteVec& bytes) {
    switch (width) {
        case 8:  return decrypt_from_bytes<8>(key, bytes);
        case 16: return decrypt_from_bytes<16>(key, bytes);
        case 32: return decrypt_from_bytes<32>(key, bytes);
        default: return decrypt_from_bytes<64>(key, bytes);
    }
}

} // namespace

// ============================================================================
// encrypt
// ============================================================================

void print_encrypt_help() {
    std::cout << "\nUsage: vaultfhe encrypt [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -key <file>       Client key file (required)\n";
    std::cout << "  -width <bits>     Plaintext width: 8, 16, 32 or 64 (required)\n";
    std::cout << "  -value <n>        Unsigned decimal value, must fit the width (required)\n";
    std::cout << "  -out <file>       Write hex ciphertext to file (default: stdout)\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  vaultfhe encrypt -key fhe-keys/fheClientKey.hex -width 8 -value 200\n";
    std::cout << "  vaultfhe encrypt -key fhe-keys/fheClientKey.hex -width 32 -value 70000 -out ct.hex\n\n";
}

int cmd_encrypt(int argc, char* argv[]) {
    std::string key_file, width_text, value_text, output_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-key" && i + 1 < argc) {
            key_file = argv[++i];
        } else if (arg == "-width" && i + 1 < argc) {
            width_text = argv[++i];
        } else if (arg == "-value" && i + 1 < argc) {
            value_text = argv[++i];
        } else if (arg == "-out" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (cli::is_help_flag(arg)) {
            print_encrypt_help();
            return cli::kExitOk;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_encrypt_help();
            return cli::kExitUsage;
        }
    }

    if (key_file.empty() || width_text.empty() || value_text.empty()) {
        std::cerr << "Error: Missing required arguments (-key, -width, -value)\n";
        print_encrypt_help();
        return cli::kExitUsage;
    }

    uint32_t width = 0;
    if (!cli::parse_width(width_text, width)) {
        std::cerr << "Error: Width must be 8, 16, 32 or 64\n";
        return cli::kExitUsage;
    }
    uint64_t value = 0;
    if (!cli::parse_u64(value_text, value)) {
        std::cerr << "Error: Value must be an unsigned decimal integer\n";
        return cli::kExitUsage;
    }

    try {
        fhe::ClientKey key = fhe::load_client_key_file(key_file);
        ByteVec ciphertext = encrypt_width(key, width, value);

        if (output_file.empty()) {
            std::cout << encoding::hexEncode(ciphertext) << "\n";
        } else {
            storage::KeyMaterialStore::save(output_file, ciphertext);
            std::cerr << "Wrote FheUint" << width << " ciphertext (" << ciphertext.size()
                      << " bytes) to " << output_file << "\n";
        }
        return cli::kExitOk;

    } catch (const Error& e) {
        return cli::report_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitInternal;
    }
}

// ============================================================================
// decrypt
// ============================================================================

void print_decrypt_help() {
    std::cout << "\nUsage: vaultfhe decrypt [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -key <file>       Client key file (required)\n";
    std::cout << "  -width <bits>     Ciphertext width: 8, 16, 32 or 64 (required)\n";
    std::cout << "  -in <file>        Hex ciphertext file (required)\n";
    std::cout << "  --help            Show this help message\n\n";
}

int cmd_decrypt(int argc, char* argv[]) {
    std::string key_file, width_text, input_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-key" && i + 1 < argc) {
            key_file = argv[++i];
        } else if (arg == "-width" && i + 1 < argc) {
            width_text = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (cli::is_help_flag(arg)) {
            print_decrypt_help();
            return cli::kExitOk;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_decrypt_help();
            return cli::kExitUsage;
        }
    }

    if (key_file.empty() || width_text.empty() || input_file.empty()) {
        std::cerr << "Error: Missing required arguments (-key, -width, -in)\n";
        print_decrypt_help();
        return cli::kExitUsage;
    }

    uint32_t width = 0;
    if (!cli::parse_width(width_text, width)) {
        std::cerr << "Error: Width must be 8, 16, 32 or 64\n";
        return cli::kExitUsage;
    }

    try {
        fhe::ClientKey key = fhe::load_client_key_file(key_file);
        ByteVec ciphertext = storage::KeyMaterialStore::load(input_file);
        std::cout << decrypt_width(key, width, ciphertext) << "\n";
        return cli::kExitOk;

    } catch (const Error& e) {
        return cli::report_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitInternal;
    }
}
