/**
 * @file test_sha256_openssl.cpp
 * @brief Differential test: shacore SHA-256 against OpenSSL EVP_sha256
 *
 * Built only with SHACORE_ENABLE_OPENSSL. OpenSSL is the reference here,
 * never a dependency of the library itself.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <openssl/evp.h>

#include <random>
#include <vector>

#include "shacore/crypto/hash/sha256.hpp"

static shacore::sha256::Digest openssl_sha256(const std::vector<uint8_t>& msg) {
    shacore::sha256::Digest out{};
    unsigned int out_len = 0;
    const int ok = EVP_Digest(msg.data(), msg.size(), out.data(), &out_len, EVP_sha256(), nullptr);
    EXPECT_EQ(ok, 1);
    EXPECT_EQ(out_len, out.size());
    return out;
}

TEST(SHA256OpenSSLTest, RandomMessagesAgree) {
    std::mt19937 rng(20261019u);
    std::uniform_int_distribution<int> byte(0, 255);

    for (size_t len = 0; len <= 1000; len += 7) {
        std::vector<uint8_t> msg(len);
        for (auto& b : msg) {
            b = static_cast<uint8_t>(byte(rng));
        }
        ASSERT_EQ(shacore::sha256::digest(msg), openssl_sha256(msg)) << "len " << len;
    }
}

TEST(SHA256OpenSSLTest, EveryLengthAroundBlockBoundaries) {
    for (size_t len = 50; len <= 200; ++len) {
        const std::vector<uint8_t> msg(len, static_cast<uint8_t>(len));
        ASSERT_EQ(shacore::sha256::digest(msg), openssl_sha256(msg)) << "len " << len;
    }
}
