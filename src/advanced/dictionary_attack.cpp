/**
 * @file dictionary_attack.cpp
 * @brief Dictionary attack demonstration implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/advanced/dictionary_attack.hpp"
#include "shacore/utils/encoding.h"

#include <algorithm>
#include <stdexcept>

namespace shacore {
namespace advanced {

namespace {

sha256::Digest digest_from_hex(const std::string& hex) {
    const ByteVec bytes = encoding::hexDecode(hex);
    if (bytes.size() != sha256::kDigestSize) {
        throw std::invalid_argument("target digest must be 32 bytes, got " +
                                    std::to_string(bytes.size()));
    }
    sha256::Digest d{};
    std::copy(bytes.begin(), bytes.end(), d.begin());
    return d;
}

} // namespace

DictionaryAttack::DictionaryAttack(const sha256::Digest& target) : target_(target) {}

DictionaryAttack::DictionaryAttack(const std::string& target_hex)
    : target_(digest_from_hex(target_hex)) {}

bool DictionaryAttack::try_candidate(const std::string& candidate) {
    ++attempts_;
    const sha256::Digest d = sha256::digest(candidate);
    return shacore_secure_compare(d.data(), target_.data(), d.size()) == 0;
}

std::optional<std::string> DictionaryAttack::run(const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        if (try_candidate(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DictionaryAttack::run(std::istream& wordlist) {
    std::string line;
    while (std::getline(wordlist, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (try_candidate(line)) {
            return line;
        }
    }
    return std::nullopt;
}

} // namespace advanced
} // namespace shacore
