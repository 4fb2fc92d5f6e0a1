/**
 * @file sha256.hpp
 * @brief SHA-256 Hash Algorithm - C++ API
 *
 * One-shot digest over a resident message. Internally the message is
 * padded block by block (BlockParser) and each block is folded into the
 * state with compress(); see the component headers for the pieces.
 *
 * Example:
 * @code
 *   auto d = shacore::sha256::digest(std::string("abc"));
 *   std::string hex = shacore::sha256::digest_hex(std::string("abc"));
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CRYPTO_HASH_SHA256_HPP
#define SHACORE_CRYPTO_HASH_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "shacore/core/common.h"
#include "shacore/core/types.h"
#include "shacore/crypto/hash/sha256_compress.hpp"
#include "shacore/crypto/hash/sha256_constants.hpp"
#include "shacore/crypto/hash/sha256_padding.hpp"
#include "shacore/crypto/hash/sha256_primitives.hpp"

namespace shacore::sha256 {

constexpr size_t kDigestSize = SHACORE_SHA256_DIGEST_SIZE;

using Digest = std::array<uint8_t, kDigestSize>;

/**
 * @brief Serialize a state as big-endian H0..H7
 */
Digest serialize_state(const State& state) noexcept;

/**
 * @brief Compute SHA-256 of a message
 * @param data Message bytes (may be null when len == 0)
 * @param len Message length in bytes
 * @return 32-byte digest
 * @throws std::invalid_argument if data is null and len is non-zero
 * @throws std::length_error if the message bit length exceeds 2^64 - 1
 */
Digest digest(const uint8_t* data, size_t len);
Digest digest(const ByteVec& message);
Digest digest(const std::string& message);

/**
 * @brief Compute SHA-256 and return it as 64 lowercase hex characters
 */
std::string digest_hex(const uint8_t* data, size_t len);
std::string digest_hex(const ByteVec& message);
std::string digest_hex(const std::string& message);

} // namespace shacore::sha256

#endif // SHACORE_CRYPTO_HASH_SHA256_HPP
