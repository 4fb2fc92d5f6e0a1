/**
 * @file sha256.h
 * @brief SHA-256 Hash Algorithm - Public C API
 *
 * FIPS 180-4 compliant SHA-256 built from the 32-bit primitives, with
 * round constants generated at first use.
 * Features:
 * - One-shot digest (binary or hex)
 * - Access to the generated round constants for verification
 *
 * All functions return SHACORE_SUCCESS or an error code; no C++
 * exception crosses this boundary.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CRYPTO_SHA256_H
#define SHACORE_CRYPTO_SHA256_H

#include "shacore/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Hex digest length including the terminating NUL */
#define SHACORE_SHA256_HEX_SIZE (SHACORE_SHA256_DIGEST_SIZE * 2 + 1)

/**
 * @brief Compute SHA-256 hash in one call
 * @param data Input data (may be NULL when len is 0)
 * @param len Input length in bytes
 * @param digest Output buffer (32 bytes)
 * @return SHACORE_SUCCESS, SHACORE_ERROR_INVALID_PARAM or
 *         SHACORE_ERROR_LENGTH_OVERFLOW
 */
SHACORE_API shacore_error_t shacore_sha256(const uint8_t* data, size_t len,
                                           uint8_t digest[SHACORE_SHA256_DIGEST_SIZE]);

/**
 * @brief Compute SHA-256 as a NUL-terminated lowercase hex string
 * @param data Input data (may be NULL when len is 0)
 * @param len Input length in bytes
 * @param hex Output buffer
 * @param hex_size Size of @p hex, at least SHACORE_SHA256_HEX_SIZE
 */
SHACORE_API shacore_error_t shacore_sha256_hex(const uint8_t* data, size_t len,
                                               char* hex, size_t hex_size);

/**
 * @brief Copy the first @p count generated round constants
 * @param out Output array of at least @p count words
 * @param count Number of constants, at most SHACORE_SHA256_ROUNDS
 */
SHACORE_API shacore_error_t shacore_sha256_constants(uint32_t* out, size_t count);

#ifdef __cplusplus
}
#endif

#endif // SHACORE_CRYPTO_SHA256_H
