/**
 * @file encoding.h
 * @brief Hex conversion for digests
 *
 * Digests are printed as lowercase hex and target digests are read back
 * from hex (either case).
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_UTILS_ENCODING_H
#define SHACORE_UTILS_ENCODING_H

#include "shacore/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Write @p len bytes as lowercase hex plus a terminating NUL
 * @param hex_size Size of @p hex, at least len * 2 + 1
 * @return Characters written (excluding NUL), 0 if a buffer is missing or too small
 */
SHACORE_API size_t shacore_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "shacore/core/types.h"
#include <stdexcept>
#include <string>

namespace shacore {
namespace encoding {

/**
 * @brief Malformed hex input
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

std::string hexEncode(const uint8_t* data, size_t len);

/**
 * @brief Parse a hex string of even length
 * @throws EncodingError on odd length or a non-hex character
 */
ByteVec hexDecode(const std::string& hex);

} // namespace encoding
} // namespace shacore

#endif // __cplusplus

#endif // SHACORE_UTILS_ENCODING_H
