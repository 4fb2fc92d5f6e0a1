/**
 * @file shacore.h
 * @brief shacore - FIPS 180-4 SHA-256 built from first principles
 *
 * Unified header for the library.
 *
 * Modules:
 * - Primitives: Ch, Maj, Parity, ROTR, SHR, Σ0/Σ1, σ0/σ1
 * - Constants: round constants from cube roots of primes (GMP)
 * - Padding: lazy 64-byte block parser
 * - Compression: per-block state update
 * - Driver: one-shot digest, C and C++ APIs
 * - Advanced: dictionary attack demonstration
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_H
#define SHACORE_H

#include "shacore/version.h"
#include "shacore/core/common.h"
#include "shacore/core/types.h"
#include "shacore/crypto/sha256.h"
#include "shacore/utils/encoding.h"

#ifdef __cplusplus
#include "shacore/crypto/hash/sha256.hpp"
#include "shacore/advanced/dictionary_attack.hpp"
#endif

#endif // SHACORE_H
