/**
 * @file key_store.hpp
 * @brief File-backed storage of serialized key material as hex text
 *
 * The store owns no cryptographic logic: it moves opaque byte blobs
 * between memory and named files through the hex codec.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_STORAGE_KEY_STORE_HPP
#define VAULTFHE_STORAGE_KEY_STORE_HPP

#include "vaultfhe/core/types.h"

#include <filesystem>

namespace vaultfhe {
namespace storage {

class KeyMaterialStore {
public:
    /**
     * @brief Write hexEncode(blob) to path, creating missing parent directories
     *
     * Overwrites an existing file. Concurrent writers to one path give
     * last-writer-wins.
     *
     * @throws StorageWriteError with the path and the underlying error code
     */
    static void save(const std::filesystem::path& path, const ByteVec& blob);

    /**
     * @brief Like save(), but writes "<path>.tmp" and renames it over path
     *
     * Readers observe either the old content or the new, never a partial file.
     */
    static void save_atomic(const std::filesystem::path& path, const ByteVec& blob);

    /**
     * @brief Like save_atomic(), for secret material
     *
     * The file is readable and writable by its owner only (0600). The mode
     * is set on the temporary file before the content is written, so the
     * secret is never visible through a wider mode. The hex text buffer is
     * wiped afterwards.
     */
    static void save_private(const std::filesystem::path& path, const ByteVec& blob);

    /**
     * @brief Read and hex-decode the content of path
     *
     * @throws StorageReadError if path is missing, not a regular file or unreadable
     * @throws MalformedEncoding if the content is not valid hex
     */
    static ByteVec load(const std::filesystem::path& path);
};

} // namespace storage
} // namespace vaultfhe

#endif // VAULTFHE_STORAGE_KEY_STORE_HPP
