/**
 * @file sha256_constants.cpp
 * @brief SHA-256 constant generation from prime roots
 *
 * Uses GMP C API (mpz_t) for exact integer root extraction:
 *   K[i]  = floor(cbrt(p_i * 2^96)) mod 2^32
 *   H0[i] = floor(sqrt(p_i * 2^64)) mod 2^32
 * Scaling by 2^(32k) before the k-th root moves exactly 32 fractional
 * bits into the integer part, so the result is the FIPS truncation.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/crypto/hash/sha256_constants.hpp"

#include <gmp.h>

#include <stdexcept>
#include <string>

namespace shacore::sha256 {

namespace {

void check_count(int count, const char* what) {
    if (count < 0) {
        throw std::invalid_argument(std::string(what) + ": count must be non-negative, got " +
                                    std::to_string(count));
    }
}

/**
 * @brief First 32 fractional bits of the k-th root of p
 */
Word fractional_root_bits(uint32_t p, unsigned long k) {
    mpz_t scaled, root;
    mpz_init_set_ui(scaled, p);
    mpz_init(root);

    mpz_mul_2exp(scaled, scaled, 32 * k);
    mpz_root(root, scaled, k);
    mpz_fdiv_r_2exp(root, root, 32);
    const Word bits = static_cast<Word>(mpz_get_ui(root));

    mpz_clear(root);
    mpz_clear(scaled);
    return bits;
}

std::vector<Word> prime_root_words(int count, unsigned long k) {
    std::vector<Word> words;
    words.reserve(static_cast<size_t>(count));
    for (uint32_t p : first_primes(count)) {
        words.push_back(fractional_root_bits(p, k));
    }
    return words;
}

} // namespace

std::vector<uint32_t> first_primes(int count) {
    check_count(count, "first_primes");

    std::vector<uint32_t> primes;
    primes.reserve(static_cast<size_t>(count));
    for (uint32_t candidate = 2; primes.size() < static_cast<size_t>(count); ++candidate) {
        bool is_prime = true;
        for (uint32_t p : primes) {
            if (static_cast<uint64_t>(p) * p > candidate) {
                break;
            }
            if (candidate % p == 0) {
                is_prime = false;
                break;
            }
        }
        if (is_prime) {
            primes.push_back(candidate);
        }
    }
    return primes;
}

std::vector<Word> generate_constants(int count) {
    check_count(count, "generate_constants");
    return prime_root_words(count, 3);
}

std::vector<Word> generate_initial_hash(int count) {
    check_count(count, "generate_initial_hash");
    return prime_root_words(count, 2);
}

const RoundConstants& round_constants() {
    // Function-local static: initialized once, thread-safe since C++11
    static const RoundConstants table = [] {
        const std::vector<Word> generated = generate_constants(kRounds);
        RoundConstants k{};
        for (size_t i = 0; i < k.size(); ++i) {
            k[i] = generated[i];
        }
        return k;
    }();
    return table;
}

} // namespace shacore::sha256
