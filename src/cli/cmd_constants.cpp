/**
 * @file cmd_constants.cpp
 * @brief Print and verify the generated SHA-256 constants
 *
 * Usage:
 *   shacore constants
 *   shacore constants -init
 *
 * @author shacore Development Team
 * @date 2026-10-19
 */

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "shacore/crypto/hash/sha256.hpp"

namespace {

// FIPS 180-4 §4.2.2, as published
const uint32_t kPublishedK[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

int print_table(const char* title, const std::vector<uint32_t>& primes,
                const std::vector<uint32_t>& generated, const uint32_t* published) {
    int mismatches = 0;
    std::cout << title << "\n";
    for (size_t i = 0; i < generated.size(); ++i) {
        const bool ok = generated[i] == published[i];
        if (!ok) {
            ++mismatches;
        }
        std::cout << "  [" << std::setw(2) << std::setfill(' ') << std::dec << i << "] p="
                  << std::setw(3) << primes[i] << "  0x" << std::hex << std::setw(8)
                  << std::setfill('0') << generated[i] << std::dec << std::setfill(' ')
                  << (ok ? "" : "  MISMATCH") << "\n";
    }
    std::cout << (mismatches == 0 ? "All values match FIPS 180-4\n"
                                  : "Generated values differ from FIPS 180-4\n");
    return mismatches;
}

} // namespace

void print_constants_help() {
    std::cout << "\nUsage: shacore constants [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -init              Also print the initial hash value H(0)\n";
    std::cout << "  --help             Show this help message\n\n";
}

/**
 * @brief Constants subcommand handler
 */
int cmd_constants(int argc, char* argv[]) {
    bool show_init = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-init") {
            show_init = true;
        } else if (arg == "--help" || arg == "-h") {
            print_constants_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_constants_help();
            return 1;
        }
    }

    try {
        namespace sha = shacore::sha256;
        int mismatches = print_table("Round constants K (cube roots of first 64 primes):",
                                     sha::first_primes(sha::kRounds),
                                     sha::generate_constants(sha::kRounds), kPublishedK);
        if (show_init) {
            std::cout << "\n";
            mismatches += print_table("Initial hash H(0) (square roots of first 8 primes):",
                                      sha::first_primes(8), sha::generate_initial_hash(8),
                                      sha::kInitialHash.data());
        }
        return mismatches == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
