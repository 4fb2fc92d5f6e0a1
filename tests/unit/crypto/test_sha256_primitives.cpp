/**
 * @file test_sha256_primitives.cpp
 * @brief Unit tests for the SHA-256 logical functions (FIPS 180-4 §4.1.2)
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "shacore/crypto/hash/sha256_primitives.hpp"

using namespace shacore::sha256;
using shacore::Word;

// ============================================================================
// Selection functions
// ============================================================================

TEST(SHA256PrimitivesTest, ParityIsXorOfAllThree) {
    EXPECT_EQ(parity(0xF0F0F0F0u, 0xFF00FF00u, 0x0F0F0F0Fu), 0x00FF00FFu);
    EXPECT_EQ(parity(0xFFFFFFFFu, 0xFFFFFFFFu, 0xFFFFFFFFu), 0xFFFFFFFFu);
    EXPECT_EQ(parity(0x12345678u, 0x12345678u, 0u), 0u);
}

TEST(SHA256PrimitivesTest, ChSelectsByFirstArgument) {
    EXPECT_EQ(ch(0xFFFFFFFFu, 0x12345678u, 0x9ABCDEF0u), 0x12345678u);
    EXPECT_EQ(ch(0x00000000u, 0x12345678u, 0x9ABCDEF0u), 0x9ABCDEF0u);
    // Upper half from y, lower half from z
    EXPECT_EQ(ch(0xFFFF0000u, 0xAAAAAAAAu, 0x55555555u), 0xAAAA5555u);
}

TEST(SHA256PrimitivesTest, MajIsBitwiseMajority) {
    EXPECT_EQ(maj(0x12345678u, 0x12345678u, 0xFFFFFFFFu), 0x12345678u);
    EXPECT_EQ(maj(0xFF00FF00u, 0x0F0F0F0Fu, 0xF0F0F0F0u), 0xFF00FF00u);
    EXPECT_EQ(maj(0u, 0u, 0xFFFFFFFFu), 0u);
}

// ============================================================================
// Rotation and shift
// ============================================================================

TEST(SHA256PrimitivesTest, RotrRotatesWithinThirtyTwoBits) {
    EXPECT_EQ(rotr(0x12345678u, 8), 0x78123456u);
    EXPECT_EQ(rotr(0x12345678u, 4), 0x81234567u);
    EXPECT_EQ(rotr(0x00000001u, 1), 0x80000000u);
    EXPECT_EQ(rotr(0x80000000u, 31), 0x00000001u);
}

TEST(SHA256PrimitivesTest, RotrByZeroIsIdentity) {
    EXPECT_EQ(rotr(0xDEADBEEFu, 0), 0xDEADBEEFu);
}

TEST(SHA256PrimitivesTest, ShrZeroFills) {
    EXPECT_EQ(shr(0x80000000u, 31), 0x00000001u);
    EXPECT_EQ(shr(0xFFFFFFFFu, 4), 0x0FFFFFFFu);
    EXPECT_EQ(shr(0xDEADBEEFu, 0), 0xDEADBEEFu);
}

TEST(SHA256PrimitivesTest, OutOfRangeAmountThrows) {
    EXPECT_THROW(rotr(1u, 32), std::invalid_argument);
    EXPECT_THROW(rotr(1u, -1), std::invalid_argument);
    EXPECT_THROW(shr(1u, 32), std::invalid_argument);
    EXPECT_THROW(shr(1u, -5), std::invalid_argument);
}

TEST(SHA256PrimitivesTest, UsableInConstantExpressions) {
    static_assert(rotr(0x12345678u, 8) == 0x78123456u, "rotr constexpr");
    static_assert(ch(0xFFFFFFFFu, 1u, 2u) == 1u, "ch constexpr");
    SUCCEED();
}

// ============================================================================
// Sigma functions
// ============================================================================

TEST(SHA256PrimitivesTest, BigSigmaKnownValues) {
    EXPECT_EQ(big_sigma0(0x6a09e667u), 0xce20b47eu);
    EXPECT_EQ(big_sigma1(0x6a09e667u), 0x55b65510u);
    EXPECT_EQ(big_sigma0(0x12345678u), 0x66146474u);
    EXPECT_EQ(big_sigma1(0x12345678u), 0x3561abdau);
}

TEST(SHA256PrimitivesTest, SmallSigmaKnownValues) {
    EXPECT_EQ(small_sigma0(0x6a09e667u), 0xba0cf582u);
    EXPECT_EQ(small_sigma1(0x6a09e667u), 0xcfe5da3cu);
    EXPECT_EQ(small_sigma0(0x12345678u), 0xe7fce6eeu);
    EXPECT_EQ(small_sigma1(0x12345678u), 0xa1f78649u);
}

TEST(SHA256PrimitivesTest, SigmasMatchTheirDefinitions) {
    const Word samples[] = {0u, 1u, 0x80000000u, 0xFFFFFFFFu, 0x510e527fu, 0x9b05688cu};
    for (Word x : samples) {
        EXPECT_EQ(big_sigma0(x), rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22));
        EXPECT_EQ(big_sigma1(x), rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25));
        EXPECT_EQ(small_sigma0(x), rotr(x, 7) ^ rotr(x, 18) ^ shr(x, 3));
        EXPECT_EQ(small_sigma1(x), rotr(x, 17) ^ rotr(x, 19) ^ shr(x, 10));
    }
}
