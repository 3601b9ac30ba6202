/**
 * @file cmd_whitelist.cpp
 * @brief Whitelist subcommands: add-to-whitelist, is-whitelisted, calldata
 *
 * Ledger settings come from the environment:
 *   RPC_URL, DEPLOYER_PRIVATE_KEY, WHITELIST_ADDRESS, CHAIN_ID (optional)
 *
 * Usage:
 *   vaultfhe add-to-whitelist <address>
 *   vaultfhe is-whitelisted <address>
 *   vaultfhe calldata add|remove|is-whitelisted <address>
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>

#include "vaultfhe/ledger/whitelist.hpp"
#include "vaultfhe/utils/encoding.h"
#include "cli_utils.h"

using namespace vaultfhe;

namespace {

void print_ledger_environment() {
    std::cout << "Environment:\n";
    std::cout << "  RPC_URL               JSON-RPC endpoint (required)\n";
    std::cout << "  DEPLOYER_PRIVATE_KEY  Signer private key (required)\n";
    std::cout << "  WHITELIST_ADDRESS     Whitelist contract address (required)\n";
    std::cout << "  CHAIN_ID              Chain id (default: " << ledger::kDefaultChainId << ")\n\n";
}

void print_transport_note() {
    std::cout << "Note: this build links no ledger transport. After validating the\n";
    std::cout << "address and environment the command exits with code "
              << cli::kExitLedger << ". Use\n";
    std::cout << "'vaultfhe calldata add|is-whitelisted <address>' and submit the\n";
    std::cout << "printed call data with an external signer.\n\n";
}

/**
 * @brief Take exactly one positional address argument
 * @return kExitOk when address was filled in, -1 after printing help,
 *         otherwise the usage exit code
 */
int single_address_argument(int argc, char* argv[], void (*help)(), std::string& address) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (cli::is_help_flag(arg)) {
            help();
            return -1;
        }
        if (!address.empty()) {
            std::cerr << "Error: Unexpected argument '" << arg << "'\n";
            help();
            return cli::kExitUsage;
        }
        address = arg;
    }
    if (address.empty()) {
        std::cerr << "Error: Missing required <address> argument\n";
        help();
        return cli::kExitUsage;
    }
    return cli::kExitOk;
}

} // namespace

// ============================================================================
// add-to-whitelist
// ============================================================================

void print_add_to_whitelist_help() {
    std::cout << "\nUsage: vaultfhe add-to-whitelist <address>\n\n";
    std::cout << "Submits addVault(<address>) to the whitelist contract.\n\n";
    print_ledger_environment();
    print_transport_note();
}

int cmd_add_to_whitelist(int argc, char* argv[]) {
    std::string address_text;
    int rc = single_address_argument(argc, argv, print_add_to_whitelist_help, address_text);
    if (rc != cli::kExitOk) {
        return rc < 0 ? cli::kExitOk : rc;
    }

    try {
        ledger::EthAddress address = ledger::EthAddress::parse(address_text);
        ledger::LedgerConfig config = ledger::LedgerConfig::from_environment();

        std::cout << "Adding " << address.to_string() << " to whitelist "
                  << config.contract_address << " (chain " << config.chain_id << ")\n";

        std::unique_ptr<ledger::WhitelistClient> client = ledger::make_whitelist_client(config);
        ledger::TransactionId tx = client->submit_whitelist_add(address);
        std::cout << "Transaction: " << tx << "\n";
        return cli::kExitOk;

    } catch (const Error& e) {
        return cli::report_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitInternal;
    }
}

// ============================================================================
// is-whitelisted
// ============================================================================

void print_is_whitelisted_help() {
    std::cout << "\nUsage: vaultfhe is-whitelisted <address>\n\n";
    std::cout << "Calls isWhitelisted(<address>) on the whitelist contract.\n\n";
    print_ledger_environment();
    print_transport_note();
}

int cmd_is_whitelisted(int argc, char* argv[]) {
    std::string address_text;
    int rc = single_address_argument(argc, argv, print_is_whitelisted_help, address_text);
    if (rc != cli::kExitOk) {
        return rc < 0 ? cli::kExitOk : rc;
    }

    try {
        ledger::EthAddress address = ledger::EthAddress::parse(address_text);
        ledger::LedgerConfig config = ledger::LedgerConfig::from_environment();

        std::unique_ptr<ledger::WhitelistClient> client = ledger::make_whitelist_client(config);
        std::cout << (client->is_whitelisted(address) ? "true" : "false") << "\n";
        return cli::kExitOk;

    } catch (const Error& e) {
        return cli::report_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitInternal;
    }
}

// ============================================================================
// calldata
// ============================================================================

void print_calldata_help() {
    std::cout << "\nUsage: vaultfhe calldata <call> <address>\n\n";
    std::cout << "Calls:\n";
    std::cout << "  add             addVault(address)\n";
    std::cout << "  remove          removeVault(address)\n";
    std::cout << "  is-whitelisted  isWhitelisted(address)\n\n";
    std::cout << "Prints 0x-prefixed ABI call data for submission by an external signer.\n\n";
}

int cmd_calldata(int argc, char* argv[]) {
    if (argc >= 2 && cli::is_help_flag(argv[1])) {
        print_calldata_help();
        return cli::kExitOk;
    }
    if (argc != 3) {
        std::cerr << "Error: Expected <call> <address>\n";
        print_calldata_help();
        return cli::kExitUsage;
    }

    std::string call(argv[1]);
    std::transform(call.begin(), call.end(), call.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    try {
        ledger::EthAddress address = ledger::EthAddress::parse(argv[2]);

        ByteVec data;
        if (call == "add") {
            data = ledger::encode_add_vault_call(address);
        } else if (call == "remove") {
            data = ledger::encode_remove_vault_call(address);
        } else if (call == "is-whitelisted") {
            data = ledger::encode_is_whitelisted_call(address);
        } else {
            std::cerr << "Error: Unknown call '" << call << "'\n";
            print_calldata_help();
            return cli::kExitUsage;
        }

        std::cout << "0x" << encoding::hexEncode(data) << "\n";
        return cli::kExitOk;

    } catch (const Error& e) {
        return cli::report_error(e);
    }
}
