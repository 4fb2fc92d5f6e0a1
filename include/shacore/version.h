/**
 * @file version.h
 * @brief Unified Version Information for shacore Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_VERSION_H
#define SHACORE_VERSION_H

/** Major version number (API breaking changes) */
#define SHACORE_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define SHACORE_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define SHACORE_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define SHACORE_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define SHACORE_VERSION_NUMBER ((SHACORE_VERSION_MAJOR * 10000) + \
                                (SHACORE_VERSION_MINOR * 100) + \
                                SHACORE_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define SHACORE_RELEASE_DATE "2026-10-19"

/** Library name */
#define SHACORE_LIBRARY_NAME "shacore"

/** Full library description */
#define SHACORE_DESCRIPTION "FIPS 180-4 SHA-256 from first principles"

/** Build type identifier */
#ifdef NDEBUG
#define SHACORE_BUILD_TYPE "Release"
#else
#define SHACORE_BUILD_TYPE "Debug"
#endif

#endif /* SHACORE_VERSION_H */
