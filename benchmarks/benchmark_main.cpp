/**
 * @file benchmark_main.cpp
 * @brief shacore vs OpenSSL Performance Benchmark Suite
 *
 * Usage:
 *   shacore_benchmark [all|hash|constants]
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <string>

#include <openssl/crypto.h>

#include "shacore/shacore.h"

// Forward declarations for benchmark functions
void benchmark_hash_functions();
void benchmark_constant_generation();

static void print_header() {
    std::cout << SHACORE_LIBRARY_NAME << " " << shacore_version()
              << " (" << SHACORE_BUILD_TYPE << ", " << shacore_platform() << ")" << std::endl;
    std::cout << "Reference: " << OpenSSL_version(OPENSSL_VERSION) << std::endl;
}

int main(int argc, char* argv[]) {
    print_header();

    std::string which = argc > 1 ? argv[1] : "all";

    if (which == "all" || which == "hash") {
        benchmark_hash_functions();
    }
    if (which == "all" || which == "constants") {
        benchmark_constant_generation();
    }
    if (which != "all" && which != "hash" && which != "constants") {
        std::cerr << "Unknown benchmark: " << which << "\n";
        std::cerr << "Usage: shacore_benchmark [all|hash|constants]\n";
        return 1;
    }
    return 0;
}
