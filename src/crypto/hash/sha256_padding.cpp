/**
 * @file sha256_padding.cpp
 * @brief SHA-256 padding / block parser implementation
 *
 * Padded message layout (FIPS 180-4 §5.1.1):
 *   M || 0x80 || 0x00 * k || bitlen(M) as 64-bit big-endian
 * with k minimal so that the total is a multiple of 64 bytes.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/crypto/hash/sha256_padding.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

namespace shacore::sha256 {

namespace {

constexpr uint8_t kPadMarker = 0x80;

inline void store64_be(uint8_t* p, uint64_t v) noexcept {
    for (int i = 7; i >= 0; --i) {
        p[i] = static_cast<uint8_t>(v);
        v >>= 8;
    }
}

} // namespace

size_t padded_length(size_t len) {
    constexpr uint64_t kMaxBytes = std::numeric_limits<uint64_t>::max() >> 3;
    if (static_cast<uint64_t>(len) > kMaxBytes ||
        len > std::numeric_limits<size_t>::max() - (kBlockSize + kLengthFieldSize)) {
        throw std::length_error("SHA-256 message length exceeds 2^64 - 1 bits");
    }
    return ((len + kLengthFieldSize + kBlockSize) / kBlockSize) * kBlockSize;
}

BlockParser::BlockParser(const uint8_t* data, size_t len)
    : data_(data),
      len_(len),
      bit_len_(0),
      total_blocks_(padded_length(len) / kBlockSize) {
    if (data == nullptr && len != 0) {
        throw std::invalid_argument("BlockParser: null data with non-zero length");
    }
    bit_len_ = static_cast<uint64_t>(len) << 3;
}

bool BlockParser::next(Block& out) {
    if (held_) {
        out = current_;
        held_ = false;
        return true;
    }
    if (emitted_ == total_blocks_) {
        return false;
    }

    const size_t offset = emitted_ * kBlockSize;
    size_t copied = 0;
    if (offset < len_) {
        copied = len_ - offset < kBlockSize ? len_ - offset : kBlockSize;
        std::memcpy(out.data(), data_ + offset, copied);
    }
    if (copied < kBlockSize) {
        std::memset(out.data() + copied, 0, kBlockSize - copied);
        // Marker goes right after the message, unless an earlier block held it
        if (offset + copied == len_) {
            out[copied] = kPadMarker;
        }
    }

    ++emitted_;
    if (emitted_ == total_blocks_) {
        // padded_length() reserves room, so this never overlaps message bytes
        store64_be(out.data() + kBlockSize - kLengthFieldSize, bit_len_);
    }
    return true;
}

bool BlockParser::advance() {
    held_ = false;
    held_ = next(current_);
    return held_;
}

BlockParser::iterator BlockParser::begin() {
    if (held_ || advance()) {
        return iterator(this);
    }
    return end();
}

BlockParser parse_blocks(const uint8_t* data, size_t len) {
    return BlockParser(data, len);
}

} // namespace shacore::sha256
