/**
 * @file sha256_padding.hpp
 * @brief SHA-256 message padding and block parsing (FIPS 180-4 §5.1.1, §5.2.1)
 *
 * BlockParser turns a resident byte sequence into the padded stream of
 * 64-byte blocks without materializing the padded message. It holds one
 * block at a time and is single-pass: once drained it stays drained.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CRYPTO_HASH_SHA256_PADDING_HPP
#define SHACORE_CRYPTO_HASH_SHA256_PADDING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>

#include "shacore/core/common.h"

namespace shacore::sha256 {

constexpr size_t kBlockSize = SHACORE_SHA256_BLOCK_SIZE;

/** Bytes reserved at the end of the last block for the bit length */
constexpr size_t kLengthFieldSize = 8;

using Block = std::array<uint8_t, kBlockSize>;

/**
 * @brief Total padded length in bytes for a message of @p len bytes
 *
 * Smallest multiple of 64 that is >= len + 9 (0x80 marker plus the
 * 64-bit length field).
 *
 * @throws std::length_error if the bit length does not fit in 64 bits
 */
size_t padded_length(size_t len);

/**
 * @brief Lazy single-pass sequence of padded 64-byte blocks
 */
class BlockParser {
public:
    /**
     * @brief Input iterator over the remaining blocks
     *
     * All iterators of one parser share its position. The block under
     * an iterator stays held by the parser until the iterator advances.
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Block;
        using difference_type = std::ptrdiff_t;
        using pointer = const Block*;
        using reference = const Block&;

        iterator() = default;

        reference operator*() const { return parser_->current_; }
        pointer operator->() const { return &parser_->current_; }

        iterator& operator++() {
            if (!parser_->advance()) {
                parser_ = nullptr;
            }
            return *this;
        }

        bool operator==(const iterator& other) const { return parser_ == other.parser_; }
        bool operator!=(const iterator& other) const { return parser_ != other.parser_; }

    private:
        friend class BlockParser;
        explicit iterator(BlockParser* parser) : parser_(parser) {}

        BlockParser* parser_ = nullptr;
    };

    /**
     * @brief Create a parser over @p len bytes at @p data
     *
     * The bytes are not copied and must outlive the parser.
     *
     * @throws std::invalid_argument if data is null and len is non-zero
     * @throws std::length_error if len * 8 does not fit in 64 bits
     */
    BlockParser(const uint8_t* data, size_t len);

    /**
     * @brief Produce the next block
     *
     * A block fetched by begin() and not yet advanced past is returned
     * first.
     *
     * @param out Receives the block
     * @return false once every block has been produced
     */
    bool next(Block& out);

    /** True once the final (length-carrying) block has been handed out */
    bool done() const noexcept { return emitted_ == total_blocks_ && !held_; }

    /** Number of blocks the message pads to */
    size_t block_count() const noexcept { return total_blocks_; }

    /** Number of blocks produced so far */
    size_t blocks_emitted() const noexcept { return emitted_; }

    /**
     * @brief Start iterating at the first block not yet advanced past
     *
     * Repeated begin() calls without advancing yield the same block.
     */
    iterator begin();
    iterator end() noexcept { return iterator(); }

private:
    // Drop the held block and fetch the next one into current_
    bool advance();

    const uint8_t* data_;
    size_t len_;
    uint64_t bit_len_;
    size_t total_blocks_;
    size_t emitted_ = 0;
    Block current_{};
    bool held_ = false;
};

/**
 * @brief Build a block parser for a message
 * @see BlockParser::BlockParser
 */
BlockParser parse_blocks(const uint8_t* data, size_t len);

} // namespace shacore::sha256

#endif // SHACORE_CRYPTO_HASH_SHA256_PADDING_HPP
