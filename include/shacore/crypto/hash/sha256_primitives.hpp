/**
 * @file sha256_primitives.hpp
 * @brief SHA-256 logical functions on 32-bit words (FIPS 180-4 §4.1.2)
 *
 * All functions operate on uint32_t only, so every result is already
 * reduced modulo 2^32. rotr/shr validate their amount and throw
 * std::invalid_argument outside [0, 31]; the sigma functions use fixed
 * amounts and go through the unchecked helpers.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CRYPTO_HASH_SHA256_PRIMITIVES_HPP
#define SHACORE_CRYPTO_HASH_SHA256_PRIMITIVES_HPP

#include <cstdint>
#include <stdexcept>

#include "shacore/core/types.h"

namespace shacore::sha256 {

namespace detail {

// Amount must already be in [0, 31]; masking keeps rotr(x, 0) defined.
constexpr Word rotr_unchecked(Word x, unsigned n) noexcept {
    return (x >> n) | (x << ((32u - n) & 31u));
}

constexpr Word shr_unchecked(Word x, unsigned n) noexcept {
    return x >> n;
}

} // namespace detail

// ============================================================================
// Bitwise selection functions
// ============================================================================

/**
 * @brief Parity(x, y, z) = x XOR y XOR z
 */
constexpr Word parity(Word x, Word y, Word z) noexcept {
    return x ^ y ^ z;
}

/**
 * @brief Ch(x, y, z): x chooses between y and z bit by bit
 */
constexpr Word ch(Word x, Word y, Word z) noexcept {
    return (x & y) ^ (~x & z);
}

/**
 * @brief Maj(x, y, z): bitwise majority vote
 */
constexpr Word maj(Word x, Word y, Word z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

// ============================================================================
// Rotation and shift
// ============================================================================

/**
 * @brief Circular right rotation within 32 bits
 * @param x Word to rotate
 * @param n Rotation amount in [0, 31]
 * @throws std::invalid_argument if n is outside [0, 31]
 */
constexpr Word rotr(Word x, int n) {
    if (n < 0 || n > 31) {
        throw std::invalid_argument("rotr: rotation amount must be in [0, 31]");
    }
    return detail::rotr_unchecked(x, static_cast<unsigned>(n));
}

/**
 * @brief Logical right shift, zero-filled
 * @param x Word to shift
 * @param n Shift amount in [0, 31]
 * @throws std::invalid_argument if n is outside [0, 31]
 */
constexpr Word shr(Word x, int n) {
    if (n < 0 || n > 31) {
        throw std::invalid_argument("shr: shift amount must be in [0, 31]");
    }
    return detail::shr_unchecked(x, static_cast<unsigned>(n));
}

// ============================================================================
// Compression and message-schedule sigma functions
// ============================================================================

/** Σ0 */
constexpr Word big_sigma0(Word x) noexcept {
    return detail::rotr_unchecked(x, 2) ^ detail::rotr_unchecked(x, 13) ^
           detail::rotr_unchecked(x, 22);
}

/** Σ1 */
constexpr Word big_sigma1(Word x) noexcept {
    return detail::rotr_unchecked(x, 6) ^ detail::rotr_unchecked(x, 11) ^
           detail::rotr_unchecked(x, 25);
}

/** σ0 */
constexpr Word small_sigma0(Word x) noexcept {
    return detail::rotr_unchecked(x, 7) ^ detail::rotr_unchecked(x, 18) ^
           detail::shr_unchecked(x, 3);
}

/** σ1 */
constexpr Word small_sigma1(Word x) noexcept {
    return detail::rotr_unchecked(x, 17) ^ detail::rotr_unchecked(x, 19) ^
           detail::shr_unchecked(x, 10);
}

} // namespace shacore::sha256

#endif // SHACORE_CRYPTO_HASH_SHA256_PRIMITIVES_HPP
