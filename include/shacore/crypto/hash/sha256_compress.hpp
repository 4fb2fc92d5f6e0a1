/**
 * @file sha256_compress.hpp
 * @brief SHA-256 compression function (FIPS 180-4 §6.2.2)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CRYPTO_HASH_SHA256_COMPRESS_HPP
#define SHACORE_CRYPTO_HASH_SHA256_COMPRESS_HPP

#include <array>

#include "shacore/core/types.h"
#include "shacore/crypto/hash/sha256_constants.hpp"
#include "shacore/crypto/hash/sha256_padding.hpp"

namespace shacore::sha256 {

/** Running 256-bit hash value H0..H7 */
using State = std::array<Word, 8>;

using MessageSchedule = std::array<Word, kRounds>;

/**
 * @brief Expand one block into the 64-word message schedule W[0..63]
 */
MessageSchedule message_schedule(const Block& block) noexcept;

/**
 * @brief Fold one block into the hash state
 *
 * Pure function: the input state is not modified and nothing is carried
 * between calls except through the returned state.
 *
 * @param state Current hash value
 * @param block Padded 64-byte block
 * @param constants Round constants K[0..63]
 * @return Updated hash value
 */
State compress(const State& state, const Block& block,
               const RoundConstants& constants) noexcept;

} // namespace shacore::sha256

#endif // SHACORE_CRYPTO_HASH_SHA256_COMPRESS_HPP
