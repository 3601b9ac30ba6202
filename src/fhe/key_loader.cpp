/**
 * @file key_loader.cpp
 * @brief Key loading and the key file pipeline
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/key_loader.hpp"
#include "vaultfhe/core/security.h"
#include "vaultfhe/fhe/serialization.hpp"
#include "vaultfhe/storage/key_store.hpp"

namespace vaultfhe {
namespace fhe {

using storage::KeyMaterialStore;

namespace {

// Secret bytes leave no copy behind once consumed
struct WipedBytes {
    ByteVec bytes;
    ~WipedBytes() {
        if (!bytes.empty()) {
            vaultfhe_secure_zero(bytes.data(), bytes.size());
        }
    }
};

} // namespace

ClientKey load_client_key(const ByteVec& bytes) {
    return from_bytes<ClientKey>(bytes);
}

ServerKey load_server_key(const ByteVec& bytes) {
    return from_bytes<ServerKey>(bytes);
}

KeyPaths KeyPaths::in_directory(const std::filesystem::path& dir,
                                const std::string& client_name,
                                const std::string& server_name) {
    KeyPaths paths;
    paths.client_key = dir / client_name;
    paths.server_key = dir / server_name;
    return paths;
}

void persist_key_pair(const KeyPair& pair, const KeyPaths& paths) {
    {
        WipedBytes client;
        client.bytes = to_bytes(pair.client_key);
        KeyMaterialStore::save_private(paths.client_key, client.bytes);
    }
    KeyMaterialStore::save(paths.server_key, to_bytes(pair.server_key));
}

ClientKey load_client_key_file(const std::filesystem::path& path) {
    WipedBytes client;
    client.bytes = KeyMaterialStore::load(path);
    return load_client_key(client.bytes);
}

ServerKey load_server_key_file(const std::filesystem::path& path) {
    return load_server_key(KeyMaterialStore::load(path));
}

} // namespace fhe
} // namespace vaultfhe
