/**
 * @file benchmark_hash.cpp
 * @brief SHA-256 Performance Benchmark: shacore vs OpenSSL
 *
 * shacore is a portable scalar implementation with no SHA-NI path, so
 * OpenSSL is expected to win; the ratio shows by how much.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "shacore/crypto/sha256.h"
#include "shacore/crypto/hash/sha256.hpp"
#include "benchmark_common.hpp"

using namespace shacore_bench;

// Test data sizes
static const std::vector<size_t> TEST_SIZES = {
    1024,              // 1 KB
    64 * 1024,         // 64 KB
    1024 * 1024        // 1 MB
};

static std::string format_size(size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    return std::to_string(bytes / 1024) + " KB";
}

/**
 * @brief One OpenSSL EVP SHA-256 run, -1.0 on failure
 */
static double openssl_sha256_ms(const uint8_t* data, size_t len, uint8_t* digest) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return -1.0;

    unsigned int digest_len = 0;
    bool ok = true;
    double ms = time_ms([&]() {
        ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
             EVP_DigestUpdate(ctx, data, len) == 1 &&
             EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    });

    EVP_MD_CTX_free(ctx);
    return ok ? ms : -1.0;
}

static double shacore_sha256_ms(const uint8_t* data, size_t len, uint8_t* digest) {
    shacore_error_t err = SHACORE_SUCCESS;
    double ms = time_ms([&]() { err = shacore_sha256(data, len, digest); });
    return err == SHACORE_SUCCESS ? ms : -1.0;
}

void benchmark_hash_functions() {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "  shacore SHA-256 Benchmark vs OpenSSL" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    for (size_t data_size : TEST_SIZES) {
        std::cout << "\n--- Data Size: " << format_size(data_size) << " ---" << std::endl;
        std::cout << std::left << std::setw(25) << "Algorithm"
                  << std::setw(15) << "Implementation"
                  << std::right << std::setw(15) << "Throughput"
                  << std::setw(13) << "Avg Time"
                  << std::setw(13) << "Min Time"
                  << std::endl;
        std::cout << std::string(81, '-') << std::endl;

        std::vector<uint8_t> data(data_size);
        if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
            std::cerr << "Error: RAND_bytes failed" << std::endl;
            return;
        }

        uint8_t ssl_digest[32];
        uint8_t sc_digest[32];
        BenchmarkResult ssl = run_benchmark_ex(data_size, [&]() {
            return openssl_sha256_ms(data.data(), data.size(), ssl_digest);
        });
        BenchmarkResult sc = run_benchmark_ex(data_size, [&]() {
            return shacore_sha256_ms(data.data(), data.size(), sc_digest);
        });

        print_result("SHA-256", "OpenSSL", ssl);
        print_result("SHA-256", "shacore", sc);
        print_ratio(sc.throughput, ssl.throughput);

        if (shacore_secure_compare(ssl_digest, sc_digest, sizeof(sc_digest)) != 0) {
            std::cout << "  !! digest mismatch between OpenSSL and shacore" << std::endl;
        }
    }
}

void benchmark_constant_generation() {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "  Round constant generation (64 cube roots, GMP)" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    BenchmarkResult r = run_benchmark_ex(0, []() {
        size_t n = 0;
        double ms = time_ms([&]() { n = shacore::sha256::generate_constants().size(); });
        return n == 64 ? ms : -1.0;
    });
    print_result("generate_constants(64)", "shacore", r, "op/s");
}
