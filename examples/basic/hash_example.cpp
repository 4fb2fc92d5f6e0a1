/**
 * @file hash_example.cpp
 * @brief SHA-256 example: digest a few strings and walk the pipeline by hand
 */

#include "shacore/shacore.h"
#include <iostream>
#include <string>

int main() {
    std::cout << "=== shacore Hash Example ===" << std::endl;
    std::cout << "Library version: " << shacore_version() << std::endl;

    for (const std::string msg : {"", "abc", "hello world"}) {
        std::cout << "SHA-256(\"" << msg << "\") = "
                  << shacore::sha256::digest_hex(msg) << std::endl;
    }

    // Same result, one block at a time
    namespace sha = shacore::sha256;
    const std::string msg = "abc";
    sha::State H = sha::kInitialHash;
    for (const sha::Block& block :
         sha::parse_blocks(reinterpret_cast<const uint8_t*>(msg.data()), msg.size())) {
        H = sha::compress(H, block, sha::round_constants());
    }
    const sha::Digest d = sha::serialize_state(H);
    std::cout << "Block-wise SHA-256(\"abc\") = "
              << shacore::encoding::hexEncode(d.data(), d.size()) << std::endl;
    return 0;
}
