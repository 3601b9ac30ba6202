/**
 * @file version.h
 * @brief Unified Version Information for vaultfhe
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * When releasing a new version, ONLY modify this file.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef VAULTFHE_VERSION_H
#define VAULTFHE_VERSION_H

/** Major version number (API breaking changes) */
#define VAULTFHE_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define VAULTFHE_VERSION_MINOR 0

/** Patch version number (bug fixes) */
#define VAULTFHE_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define VAULTFHE_VERSION_STRING "1.0.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define VAULTFHE_VERSION_NUMBER ((VAULTFHE_VERSION_MAJOR * 10000) + \
                                 (VAULTFHE_VERSION_MINOR * 100) + \
                                 VAULTFHE_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define VAULTFHE_RELEASE_DATE "2026-10-19"

/** Library name */
#define VAULTFHE_LIBRARY_NAME "vaultfhe"

/** Full library description */
#define VAULTFHE_DESCRIPTION "FHE key lifecycle and integer encryption for vault settlement"

/** Build type identifier */
#ifdef NDEBUG
#define VAULTFHE_BUILD_TYPE "Release"
#else
#define VAULTFHE_BUILD_TYPE "Debug"
#endif

#endif // VAULTFHE_VERSION_H
