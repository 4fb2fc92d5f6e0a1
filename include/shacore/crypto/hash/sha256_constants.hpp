/**
 * @file sha256_constants.hpp
 * @brief SHA-256 round constants and initial hash value (FIPS 180-4 §4.2.2, §5.3.3)
 *
 * The round constants K[0..63] are derived here rather than typed in:
 * the first 32 bits of the fractional parts of the cube roots of the
 * first 64 primes. Root extraction is exact (GMP integer roots), so the
 * truncation never depends on floating-point rounding.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CRYPTO_HASH_SHA256_CONSTANTS_HPP
#define SHACORE_CRYPTO_HASH_SHA256_CONSTANTS_HPP

#include <array>
#include <cstdint>
#include <vector>

#include "shacore/core/types.h"

namespace shacore::sha256 {

/** Number of compression rounds, one constant per round */
constexpr int kRounds = 64;

using RoundConstants = std::array<Word, kRounds>;

/**
 * @brief SHA-256 initial hash value H(0)
 *
 * First 32 bits of the fractional parts of the square roots of the
 * first 8 primes. Checked against generate_initial_hash() in tests.
 */
constexpr std::array<Word, 8> kInitialHash = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/**
 * @brief First @p count primes, by trial division
 * @throws std::invalid_argument if count is negative
 */
std::vector<uint32_t> first_primes(int count);

/**
 * @brief Generate SHA-256 round constants
 *
 * For each of the first @p count primes p, yields
 * floor(frac(cbrt(p)) * 2^32), computed as floor(cbrt(p * 2^96)) mod 2^32.
 *
 * @param count Number of constants (64 for SHA-256)
 * @return Constants in prime order
 * @throws std::invalid_argument if count is negative
 */
std::vector<Word> generate_constants(int count = kRounds);

/**
 * @brief Generate initial hash words from square roots of primes
 *
 * floor(frac(sqrt(p)) * 2^32) for the first @p count primes.
 *
 * @throws std::invalid_argument if count is negative
 */
std::vector<Word> generate_initial_hash(int count = 8);

/**
 * @brief Process-wide round constant table
 *
 * Built from generate_constants(kRounds) on first use. Initialization
 * happens exactly once even under concurrent first calls; afterwards
 * the table is read-only.
 */
const RoundConstants& round_constants();

} // namespace shacore::sha256

#endif // SHACORE_CRYPTO_HASH_SHA256_CONSTANTS_HPP
