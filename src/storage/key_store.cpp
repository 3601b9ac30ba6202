/**
 * @file key_store.cpp
 * @brief KeyMaterialStore implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/storage/key_store.hpp"
#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/core/security.h"
#include "vaultfhe/utils/encoding.h"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>

namespace vaultfhe {
namespace storage {

namespace fs = std::filesystem;

namespace {

// errno is the only cause iostreams expose; fall back to EIO when unset
std::error_code last_io_error() {
    int err = errno;
    return std::error_code(err != 0 ? err : EIO, std::generic_category());
}

void ensure_parent(const fs::path& path) {
    fs::path parent = path.parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw StorageWriteError(path, ec);
    }
}

void restrict_to_owner(const fs::path& path) {
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw StorageWriteError(path, ec);
    }
}

// owner_only narrows permissions before any content is written
void write_text(const fs::path& path, const std::string& text, bool owner_only) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StorageWriteError(path, last_io_error());
    }
    if (owner_only) {
        restrict_to_owner(path);
    }

    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.flush();
    if (!file) {
        throw StorageWriteError(path, last_io_error());
    }
}

void replace_atomically(const fs::path& path, const std::string& text, bool owner_only) {
    ensure_parent(path);

    fs::path tmp = path;
    tmp += ".tmp";
    try {
        write_text(tmp, text, owner_only);
    } catch (const StorageWriteError&) {
        std::error_code cleanup;
        fs::remove(tmp, cleanup);
        throw;
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tmp, cleanup);
        throw StorageWriteError(path, ec);
    }
}

} // namespace

void KeyMaterialStore::save(const fs::path& path, const ByteVec& blob) {
    ensure_parent(path);
    write_text(path, encoding::hexEncode(blob), false);
}

void KeyMaterialStore::save_atomic(const fs::path& path, const ByteVec& blob) {
    replace_atomically(path, encoding::hexEncode(blob), false);
}

void KeyMaterialStore::save_private(const fs::path& path, const ByteVec& blob) {
    std::string text = encoding::hexEncode(blob);
    try {
        replace_atomically(path, text, true);
    } catch (const StorageWriteError&) {
        vaultfhe_secure_zero(&text[0], text.size());
        throw;
    }
    vaultfhe_secure_zero(&text[0], text.size());
}

ByteVec KeyMaterialStore::load(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec) {
        throw StorageReadError(path, ec);
    }
    if (!fs::is_regular_file(status)) {
        throw StorageReadError(path, std::make_error_code(
            fs::exists(status) ? std::errc::invalid_argument
                               : std::errc::no_such_file_or_directory));
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageReadError(path, last_io_error());
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageReadError(path, last_io_error());
    }

    return encoding::hexDecode(text);
}

} // namespace storage
} // namespace vaultfhe
