/**
 * @file key_loader.hpp
 * @brief Rebuilding keys from bytes and the persist/load file pipeline
 *
 * Persist: generate_keys -> to_bytes -> KeyMaterialStore::save
 * Load:    KeyMaterialStore::load -> load_client_key -> encrypt
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_FHE_KEY_LOADER_HPP
#define VAULTFHE_FHE_KEY_LOADER_HPP

#include "vaultfhe/core/types.h"
#include "vaultfhe/fhe/keys.hpp"

#include <filesystem>
#include <string>

namespace vaultfhe {
namespace fhe {

constexpr const char* kDefaultClientKeyFileName = "fheClientKey.hex";
constexpr const char* kDefaultServerKeyFileName = "fheServerKey.hex";

/**
 * @brief Inverse of to_bytes(ClientKey)
 * @throws DeserializationError as from_bytes<ClientKey>
 */
ClientKey load_client_key(const ByteVec& bytes);

/**
 * @brief Inverse of to_bytes(ServerKey)
 * @throws DeserializationError as from_bytes<ServerKey>
 */
ServerKey load_server_key(const ByteVec& bytes);

/**
 * @brief Destination files of a key pair
 */
struct KeyPaths {
    std::filesystem::path client_key;
    std::filesystem::path server_key;

    static KeyPaths in_directory(const std::filesystem::path& dir,
                                 const std::string& client_name = kDefaultClientKeyFileName,
                                 const std::string& server_name = kDefaultServerKeyFileName);
};

/**
 * @brief Serialize both keys and write them as hex files
 *
 * The client key is written first, owner-only (0600) through
 * KeyMaterialStore::save_private. A failure on the server key leaves the
 * client key file in place.
 *
 * @throws StorageWriteError
 */
void persist_key_pair(const KeyPair& pair, const KeyPaths& paths);

/**
 * @throws StorageReadError, MalformedEncoding, DeserializationError
 */
ClientKey load_client_key_file(const std::filesystem::path& path);
ServerKey load_server_key_file(const std::filesystem::path& path);

} // namespace fhe
} // namespace vaultfhe

#endif // VAULTFHE_FHE_KEY_LOADER_HPP
