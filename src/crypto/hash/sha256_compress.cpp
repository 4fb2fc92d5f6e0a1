/**
 * @file sha256_compress.cpp
 * @brief SHA-256 compression function (scalar)
 *
 * Reference:
 * - [FIPS 180-4] §6.2.2 SHA-256 Hash Computation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/crypto/hash/sha256_compress.hpp"
#include "shacore/crypto/hash/sha256_primitives.hpp"

namespace shacore::sha256 {

namespace {

inline Word load32_be(const uint8_t* p) noexcept {
    return (static_cast<Word>(p[0]) << 24) | (static_cast<Word>(p[1]) << 16) |
           (static_cast<Word>(p[2]) << 8) | static_cast<Word>(p[3]);
}

} // namespace

MessageSchedule message_schedule(const Block& block) noexcept {
    MessageSchedule W;
    for (size_t t = 0; t < 16; t++) {
        W[t] = load32_be(block.data() + t * 4);
    }
    for (size_t t = 16; t < W.size(); t++) {
        W[t] = small_sigma1(W[t - 2]) + W[t - 7] + small_sigma0(W[t - 15]) + W[t - 16];
    }
    return W;
}

State compress(const State& state, const Block& block,
               const RoundConstants& constants) noexcept {
    const MessageSchedule W = message_schedule(block);

    // Working variables
    Word a = state[0], b = state[1], c = state[2], d = state[3];
    Word e = state[4], f = state[5], g = state[6], h = state[7];

    for (size_t t = 0; t < W.size(); t++) {
        const Word t1 = h + big_sigma1(e) + ch(e, f, g) + constants[t] + W[t];
        const Word t2 = big_sigma0(a) + maj(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    return State{
        state[0] + a, state[1] + b, state[2] + c, state[3] + d,
        state[4] + e, state[5] + f, state[6] + g, state[7] + h
    };
}

} // namespace shacore::sha256
