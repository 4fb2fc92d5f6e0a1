/**
 * @file types.h
 * @brief Type definitions for shacore library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CORE_TYPES_H
#define SHACORE_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

// C++ types
#ifdef __cplusplus

#include <vector>

namespace shacore {

using ByteVec = std::vector<uint8_t>;

/** SHA-256 word: all arithmetic on it is modulo 2^32 */
using Word = uint32_t;

} // namespace shacore

#endif // __cplusplus

#endif // SHACORE_CORE_TYPES_H
