/**
 * @file test_key_store.cpp
 * @brief Unit tests for hex-encoded key file persistence
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/storage/key_store.hpp"

using namespace vaultfhe;
using vaultfhe::storage::KeyMaterialStore;

namespace fs = std::filesystem;

namespace {

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

class KeyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() /
                ("vaultfhe_store_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
};

TEST_F(KeyStoreTest, SaveWritesLowercaseHex) {
    fs::path file = root_ / "key.hex";
    KeyMaterialStore::save(file, ByteVec{0x00, 0xAB, 0xff});
    EXPECT_EQ(read_text(file), "00abff");
}

TEST_F(KeyStoreTest, SaveCreatesMissingParents) {
    fs::path file = root_ / "a" / "b" / "c" / "key.hex";
    ASSERT_FALSE(fs::exists(file.parent_path()));
    KeyMaterialStore::save(file, ByteVec{1, 2, 3});
    EXPECT_TRUE(fs::is_regular_file(file));
    EXPECT_EQ(KeyMaterialStore::load(file), (ByteVec{1, 2, 3}));
}

TEST_F(KeyStoreTest, SaveOverwrites) {
    fs::path file = root_ / "key.hex";
    KeyMaterialStore::save(file, ByteVec(100, 0x11));
    KeyMaterialStore::save(file, ByteVec{0x22});
    EXPECT_EQ(KeyMaterialStore::load(file), ByteVec{0x22});
}

TEST_F(KeyStoreTest, RoundTripLargeBlob) {
    ByteVec blob(70000);
    for (size_t i = 0; i < blob.size(); ++i) {
        blob[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    fs::path file = root_ / "large.hex";
    KeyMaterialStore::save(file, blob);
    EXPECT_EQ(fs::file_size(file), blob.size() * 2);
    EXPECT_EQ(KeyMaterialStore::load(file), blob);
}

TEST_F(KeyStoreTest, SaveAtomicLeavesNoTemporary) {
    fs::path file = root_ / "nested" / "atomic.hex";
    KeyMaterialStore::save_atomic(file, ByteVec{9, 8, 7});
    EXPECT_EQ(KeyMaterialStore::load(file), (ByteVec{9, 8, 7}));

    fs::path tmp = file;
    tmp += ".tmp";
    EXPECT_FALSE(fs::exists(tmp));

    KeyMaterialStore::save_atomic(file, ByteVec{6});
    EXPECT_EQ(KeyMaterialStore::load(file), ByteVec{6});
}

TEST_F(KeyStoreTest, SavePrivateIsOwnerOnly) {
    fs::path file = root_ / "private" / "secret.hex";
    KeyMaterialStore::save_private(file, ByteVec{0xde, 0xad});
    EXPECT_EQ(KeyMaterialStore::load(file), (ByteVec{0xde, 0xad}));

    const fs::perms group_other = fs::perms::group_all | fs::perms::others_all;
    fs::perms mode = fs::status(file).permissions();
    EXPECT_EQ(mode & group_other, fs::perms::none);
    EXPECT_NE(mode & fs::perms::owner_read, fs::perms::none);
    EXPECT_NE(mode & fs::perms::owner_write, fs::perms::none);

    fs::path tmp = file;
    tmp += ".tmp";
    EXPECT_FALSE(fs::exists(tmp));
}

TEST_F(KeyStoreTest, SavePrivateNarrowsExistingFile) {
    fs::path file = root_ / "secret.hex";
    KeyMaterialStore::save(file, ByteVec{1});
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write |
                          fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    KeyMaterialStore::save_private(file, ByteVec{2});
    fs::perms mode = fs::status(file).permissions();
    EXPECT_EQ(mode & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_EQ(KeyMaterialStore::load(file), ByteVec{2});
}

TEST_F(KeyStoreTest, LoadAcceptsSurroundingWhitespace) {
    fs::path file = root_ / "spaced.hex";
    {
        std::ofstream out(file);
        out << "  0a0B\n";
    }
    EXPECT_EQ(KeyMaterialStore::load(file), (ByteVec{0x0a, 0x0b}));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(KeyStoreTest, LoadMissingFileThrowsReadError) {
    fs::path missing = root_ / "nonexistent" / "path.hex";
    try {
        KeyMaterialStore::load(missing);
        FAIL() << "expected StorageReadError";
    } catch (const StorageReadError& e) {
        EXPECT_EQ(e.path(), missing);
        EXPECT_EQ(e.code(), VAULTFHE_ERROR_STORAGE_READ);
    }
}

TEST_F(KeyStoreTest, LoadDirectoryThrowsReadError) {
    EXPECT_THROW(KeyMaterialStore::load(root_), StorageReadError);
}

TEST_F(KeyStoreTest, SaveBelowRegularFileThrowsWriteError) {
    fs::path blocker = root_ / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    fs::path file = blocker / "key.hex";
    try {
        KeyMaterialStore::save(file, ByteVec{1});
        FAIL() << "expected StorageWriteError";
    } catch (const StorageWriteError& e) {
        EXPECT_EQ(e.code(), VAULTFHE_ERROR_STORAGE_WRITE);
        EXPECT_TRUE(static_cast<bool>(e.cause()));
    }
    EXPECT_THROW(KeyMaterialStore::save_atomic(file, ByteVec{1}), StorageWriteError);
    EXPECT_THROW(KeyMaterialStore::save_private(file, ByteVec{1}), StorageWriteError);
}

TEST_F(KeyStoreTest, NonHexContentThrowsMalformedEncoding) {
    fs::path file = root_ / "bad.hex";
    {
        std::ofstream out(file);
        out << "zz11";
    }
    EXPECT_THROW(KeyMaterialStore::load(file), MalformedEncoding);

    {
        std::ofstream out(file, std::ios::trunc);
        out << "abc";
    }
    EXPECT_THROW(KeyMaterialStore::load(file), MalformedEncoding);

    {
        std::ofstream out(file, std::ios::trunc);
        out << "0x0102";
    }
    EXPECT_THROW(KeyMaterialStore::load(file), MalformedEncoding);
}

TEST_F(KeyStoreTest, StorageErrorsShareBase) {
    EXPECT_THROW(KeyMaterialStore::load(root_ / "missing.hex"), StorageError);
    EXPECT_THROW(KeyMaterialStore::load(root_ / "missing.hex"), Error);
}
