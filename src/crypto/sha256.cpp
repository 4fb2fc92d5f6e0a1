/**
 * @file sha256.cpp
 * @brief SHA-256 - C ABI Export
 *
 * Architecture: C++ implementation (shacore::sha256) + extern "C" API.
 * Exceptions from the C++ layer are mapped to shacore_error_t here and
 * never propagate to C callers.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/crypto/sha256.h"
#include "shacore/crypto/hash/sha256.hpp"
#include "shacore/utils/encoding.h"

#include <cstring>
#include <new>
#include <stdexcept>

extern "C" {

shacore_error_t shacore_sha256(const uint8_t* data, size_t len,
                               uint8_t digest[SHACORE_SHA256_DIGEST_SIZE]) {
    if (!digest || (!data && len > 0)) {
        return SHACORE_ERROR_INVALID_PARAM;
    }

    try {
        const shacore::sha256::Digest d = shacore::sha256::digest(data, len);
        std::memcpy(digest, d.data(), d.size());
    } catch (const std::length_error&) {
        return SHACORE_ERROR_LENGTH_OVERFLOW;
    } catch (const std::invalid_argument&) {
        return SHACORE_ERROR_INVALID_PARAM;
    } catch (const std::bad_alloc&) {
        return SHACORE_ERROR_MEMORY_ALLOC;
    } catch (const std::exception&) {
        return SHACORE_ERROR_INTERNAL;
    }
    return SHACORE_SUCCESS;
}

shacore_error_t shacore_sha256_hex(const uint8_t* data, size_t len,
                                   char* hex, size_t hex_size) {
    if (!hex) {
        return SHACORE_ERROR_INVALID_PARAM;
    }
    if (hex_size < SHACORE_SHA256_HEX_SIZE) {
        return SHACORE_ERROR_BUFFER_TOO_SMALL;
    }

    uint8_t digest[SHACORE_SHA256_DIGEST_SIZE];
    shacore_error_t err = shacore_sha256(data, len, digest);
    if (err != SHACORE_SUCCESS) {
        return err;
    }
    if (shacore_hex_encode(digest, sizeof(digest), hex, hex_size) != sizeof(digest) * 2) {
        return SHACORE_ERROR_INTERNAL;
    }
    return SHACORE_SUCCESS;
}

shacore_error_t shacore_sha256_constants(uint32_t* out, size_t count) {
    if (!out && count > 0) {
        return SHACORE_ERROR_INVALID_PARAM;
    }
    if (count > SHACORE_SHA256_ROUNDS) {
        return SHACORE_ERROR_INVALID_PARAM;
    }

    try {
        const shacore::sha256::RoundConstants& K = shacore::sha256::round_constants();
        for (size_t i = 0; i < count; ++i) {
            out[i] = K[i];
        }
    } catch (const std::bad_alloc&) {
        return SHACORE_ERROR_MEMORY_ALLOC;
    } catch (const std::exception&) {
        return SHACORE_ERROR_INTERNAL;
    }
    return SHACORE_SUCCESS;
}

} // extern "C"
