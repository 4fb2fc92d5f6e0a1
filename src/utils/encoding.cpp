/**
 * @file encoding.cpp
 * @brief Hex conversion for digests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/utils/encoding.h"

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

extern "C" size_t shacore_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if ((data == nullptr && len > 0) || hex == nullptr || hex_size / 2 < len ||
        hex_size - len * 2 < 1) {
        return 0;
    }

    char* out = hex;
    for (size_t i = 0; i < len; ++i) {
        *out++ = kHexDigits[data[i] >> 4];
        *out++ = kHexDigits[data[i] & 0x0F];
    }
    *out = '\0';
    return len * 2;
}

namespace shacore {
namespace encoding {

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex.push_back(kHexDigits[data[i] >> 4]);
        hex.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return hex;
}

ByteVec hexDecode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw EncodingError("hex string has odd length " + std::to_string(hex.size()));
    }

    ByteVec bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw EncodingError("non-hex character at offset " +
                                std::to_string(hi < 0 ? i : i + 1));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace encoding
} // namespace shacore
