/**
 * @file test_sha256_padding.cpp
 * @brief SHA-256 padding and block parser tests (FIPS 180-4 §5.1.1)
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

#include "shacore/crypto/hash/sha256_padding.hpp"

using namespace shacore::sha256;

// Helper: drain a parser into one contiguous buffer
static std::vector<uint8_t> drain(BlockParser& parser) {
    std::vector<uint8_t> out;
    Block block;
    while (parser.next(block)) {
        out.insert(out.end(), block.begin(), block.end());
    }
    return out;
}

static std::vector<uint8_t> make_message(size_t len) {
    std::vector<uint8_t> msg(len);
    for (size_t i = 0; i < len; ++i) {
        msg[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    return msg;
}

// ============================================================================
// Empty message
// ============================================================================

TEST(SHA256PaddingTest, EmptyMessageIsOneBlock) {
    BlockParser parser(nullptr, 0);
    EXPECT_EQ(parser.block_count(), 1u);

    Block block;
    ASSERT_TRUE(parser.next(block));
    EXPECT_EQ(block[0], 0x80);
    for (size_t i = 1; i < block.size(); ++i) {
        EXPECT_EQ(block[i], 0x00) << "byte " << i;
    }
    EXPECT_FALSE(parser.next(block));
}

TEST(SHA256PaddingTest, AbcBlockLayout) {
    const uint8_t abc[] = {'a', 'b', 'c'};
    BlockParser parser = parse_blocks(abc, sizeof(abc));
    Block block;
    ASSERT_TRUE(parser.next(block));

    EXPECT_EQ(block[0], 'a');
    EXPECT_EQ(block[1], 'b');
    EXPECT_EQ(block[2], 'c');
    EXPECT_EQ(block[3], 0x80);
    for (size_t i = 4; i < 63; ++i) {
        EXPECT_EQ(block[i], 0x00) << "byte " << i;
    }
    EXPECT_EQ(block[63], 24);  // 3 bytes = 24 bits
    EXPECT_TRUE(parser.done());
}

// ============================================================================
// Block counts around the 448-bit boundary
// ============================================================================

TEST(SHA256PaddingTest, BoundaryBlockCounts) {
    struct Case { size_t len; size_t blocks; };
    const Case cases[] = {
        {0, 1}, {55, 1}, {56, 2}, {63, 2}, {64, 2}, {119, 2}, {120, 3}, {128, 3}
    };
    for (const auto& c : cases) {
        const auto msg = make_message(c.len);
        BlockParser parser(msg.data(), msg.size());
        EXPECT_EQ(parser.block_count(), c.blocks) << "len " << c.len;
        EXPECT_EQ(drain(parser).size(), c.blocks * kBlockSize) << "len " << c.len;
    }
}

TEST(SHA256PaddingTest, LayoutForEveryLengthUpTo300) {
    for (size_t len = 0; len <= 300; ++len) {
        const auto msg = make_message(len);
        BlockParser parser(msg.data(), msg.size());
        const auto padded = drain(parser);

        // Smallest multiple of 64 that fits message, marker and length
        ASSERT_EQ(padded.size() % kBlockSize, 0u);
        ASSERT_GE(padded.size(), len + 9);
        ASSERT_LT(padded.size() - kBlockSize, len + 9);
        ASSERT_EQ(padded.size(), padded_length(len));

        for (size_t i = 0; i < len; ++i) {
            ASSERT_EQ(padded[i], msg[i]) << "len " << len << " byte " << i;
        }
        ASSERT_EQ(padded[len], 0x80) << "len " << len;
        for (size_t i = len + 1; i < padded.size() - 8; ++i) {
            ASSERT_EQ(padded[i], 0x00) << "len " << len << " byte " << i;
        }

        uint64_t bit_len = 0;
        for (size_t i = padded.size() - 8; i < padded.size(); ++i) {
            bit_len = (bit_len << 8) | padded[i];
        }
        ASSERT_EQ(bit_len, static_cast<uint64_t>(len) * 8) << "len " << len;
    }
}

TEST(SHA256PaddingTest, ExactBlockMessageGetsFullPaddingBlock) {
    const auto msg = make_message(64);
    BlockParser parser(msg.data(), msg.size());
    Block first, second;
    ASSERT_TRUE(parser.next(first));
    ASSERT_TRUE(parser.next(second));
    EXPECT_FALSE(parser.next(second));

    EXPECT_EQ(second[0], 0x80);
    EXPECT_EQ(second[62], 0x02);  // 512 bits = 0x0200
    EXPECT_EQ(second[63], 0x00);
}

// ============================================================================
// Sequence behaviour
// ============================================================================

TEST(SHA256PaddingTest, NotRestartableOnceConsumed) {
    const auto msg = make_message(100);
    BlockParser parser(msg.data(), msg.size());
    EXPECT_EQ(drain(parser).size(), 128u);
    EXPECT_TRUE(parser.done());
    EXPECT_EQ(parser.blocks_emitted(), 2u);

    Block block;
    EXPECT_FALSE(parser.next(block));
    EXPECT_TRUE(parser.begin() == parser.end());
}

TEST(SHA256PaddingTest, RangeForVisitsEveryBlockOnce) {
    const auto msg = make_message(200);
    BlockParser parser(msg.data(), msg.size());

    size_t count = 0;
    for (const Block& block : parser) {
        if (count == 0) {
            EXPECT_EQ(block[0], msg[0]);
        }
        ++count;
    }
    EXPECT_EQ(count, parser.block_count());
    EXPECT_EQ(count, 4u);

    size_t again = 0;
    for (const Block& block : parser) {
        (void)block;
        ++again;
    }
    EXPECT_EQ(again, 0u);
}

TEST(SHA256PaddingTest, RepeatedBeginDoesNotSkipBlocks) {
    const auto msg = make_message(200);
    BlockParser parser(msg.data(), msg.size());

    auto first = parser.begin();
    ASSERT_TRUE(first != parser.end());
    EXPECT_EQ((*first)[0], msg[0]);
    EXPECT_FALSE(parser.done());

    std::vector<uint8_t> seen;
    for (const Block& block : parser) {
        seen.insert(seen.end(), block.begin(), block.end());
    }
    ASSERT_EQ(seen.size(), 4 * kBlockSize);
    EXPECT_TRUE(std::equal(msg.begin(), msg.end(), seen.begin()));
    EXPECT_TRUE(parser.done());
}

TEST(SHA256PaddingTest, NextReturnsBlockHeldByBegin) {
    const auto msg = make_message(70);
    BlockParser parser(msg.data(), msg.size());
    ASSERT_TRUE(parser.begin() != parser.end());

    const std::vector<uint8_t> all = drain(parser);
    ASSERT_EQ(all.size(), 2 * kBlockSize);
    EXPECT_TRUE(std::equal(msg.begin(), msg.end(), all.begin()));
    EXPECT_EQ(all[70], 0x80);
}

TEST(SHA256PaddingTest, IncrementalProgress) {
    const auto msg = make_message(130);
    BlockParser parser(msg.data(), msg.size());
    EXPECT_EQ(parser.block_count(), 3u);
    EXPECT_EQ(parser.blocks_emitted(), 0u);
    EXPECT_FALSE(parser.done());

    Block block;
    ASSERT_TRUE(parser.next(block));
    EXPECT_EQ(parser.blocks_emitted(), 1u);
    EXPECT_FALSE(parser.done());
}

// ============================================================================
// Contract violations
// ============================================================================

TEST(SHA256PaddingTest, NullDataWithLengthThrows) {
    EXPECT_THROW(BlockParser(nullptr, 5), std::invalid_argument);
}

TEST(SHA256PaddingTest, OversizedLengthThrows) {
    EXPECT_THROW(padded_length(std::numeric_limits<size_t>::max()), std::length_error);
    const uint8_t dummy = 0;
    EXPECT_THROW(BlockParser(&dummy, std::numeric_limits<size_t>::max()), std::length_error);
}
