/**
 * @file sha256.cpp
 * @brief SHA-256 hash driver - C++ API
 *
 * Threads the state through compress() for every block the parser
 * yields, starting from H(0), then serializes big-endian.
 *
 * Reference:
 * - [FIPS 180-4] https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/crypto/hash/sha256.hpp"
#include "shacore/utils/encoding.h"

namespace shacore::sha256 {

namespace {

inline void store32_be(uint8_t* p, Word v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

} // namespace

Digest serialize_state(const State& state) noexcept {
    Digest out{};
    for (size_t i = 0; i < state.size(); i++) {
        store32_be(out.data() + i * 4, state[i]);
    }
    return out;
}

Digest digest(const uint8_t* data, size_t len) {
    const RoundConstants& K = round_constants();
    BlockParser parser(data, len);

    State H = kInitialHash;
    Block block;
    while (parser.next(block)) {
        H = compress(H, block, K);
    }
    return serialize_state(H);
}

Digest digest(const ByteVec& message) {
    return digest(message.data(), message.size());
}

Digest digest(const std::string& message) {
    return digest(reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

std::string digest_hex(const uint8_t* data, size_t len) {
    const Digest d = digest(data, len);
    return encoding::hexEncode(d.data(), d.size());
}

std::string digest_hex(const ByteVec& message) {
    return digest_hex(message.data(), message.size());
}

std::string digest_hex(const std::string& message) {
    return digest_hex(reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

} // namespace shacore::sha256
