/**
 * @file errors.hpp
 * @brief Exception taxonomy for vaultfhe
 *
 * Every exception carries the matching vaultfhe_error_t so that C callers
 * and the CLI can map failures to codes and exit statuses.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef VAULTFHE_CORE_ERRORS_HPP
#define VAULTFHE_CORE_ERRORS_HPP

#include "vaultfhe/core/common.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace vaultfhe {

/**
 * @brief Base class of every vaultfhe exception
 */
class Error : public std::runtime_error {
public:
    Error(vaultfhe_error_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    vaultfhe_error_t code() const noexcept { return code_; }

private:
    vaultfhe_error_t code_;
};

/**
 * @brief Scheme parameters or runtime configuration cannot be constructed
 *
 * Fatal: no partial key material exists when this is thrown.
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg)
        : Error(VAULTFHE_ERROR_CONFIGURATION, msg) {}
};

/**
 * @brief Common base for file-system failures of the key store
 */
class StorageError : public Error {
public:
    StorageError(vaultfhe_error_t code,
                 const std::string& what,
                 const std::filesystem::path& path,
                 std::error_code cause)
        : Error(code, what + " '" + path.string() + "': " + cause.message())
        , path_(path)
        , cause_(cause) {}

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::error_code& cause() const noexcept { return cause_; }

private:
    std::filesystem::path path_;
    std::error_code cause_;
};

class StorageWriteError : public StorageError {
public:
    StorageWriteError(const std::filesystem::path& path, std::error_code cause)
        : StorageError(VAULTFHE_ERROR_STORAGE_WRITE, "cannot write key file", path, cause) {}
};

class StorageReadError : public StorageError {
public:
    StorageReadError(const std::filesystem::path& path, std::error_code cause)
        : StorageError(VAULTFHE_ERROR_STORAGE_READ, "cannot read key file", path, cause) {}
};

/**
 * @brief Text is not a valid hex encoding
 */
class MalformedEncoding : public Error {
public:
    explicit MalformedEncoding(const std::string& msg)
        : Error(VAULTFHE_ERROR_MALFORMED_ENCODING, msg) {}
};

/**
 * @brief Bytes do not match the binary layout of the requested type
 */
class DeserializationError : public Error {
public:
    DeserializationError(const std::string& expected_type, const std::string& msg)
        : Error(VAULTFHE_ERROR_DESERIALIZATION,
                "cannot deserialize " + expected_type + ": " + msg)
        , expected_type_(expected_type) {}

    const std::string& expected_type() const noexcept { return expected_type_; }

private:
    std::string expected_type_;
};

/**
 * @brief Plaintext rejected by the encryption engine
 */
class EncryptionError : public Error {
public:
    explicit EncryptionError(const std::string& msg)
        : Error(VAULTFHE_ERROR_ENCRYPTION, msg) {}
};

class InvalidAddress : public Error {
public:
    explicit InvalidAddress(const std::string& msg)
        : Error(VAULTFHE_ERROR_INVALID_ADDRESS, msg) {}
};

/**
 * @brief Ledger network or transaction failure
 */
class LedgerError : public Error {
public:
    explicit LedgerError(const std::string& msg)
        : Error(VAULTFHE_ERROR_LEDGER, msg) {}
};

} // namespace vaultfhe

#endif // VAULTFHE_CORE_ERRORS_HPP
