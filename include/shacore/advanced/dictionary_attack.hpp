/**
 * @file dictionary_attack.hpp
 * @brief Dictionary attack against an unsalted SHA-256 password digest
 *
 * Demonstrates why a bare SHA-256 of a password is weak: every candidate
 * from a wordlist is hashed and compared with the target digest.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_ADVANCED_DICTIONARY_ATTACK_HPP
#define SHACORE_ADVANCED_DICTIONARY_ATTACK_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "shacore/crypto/hash/sha256.hpp"

namespace shacore {
namespace advanced {

class DictionaryAttack {
public:
    explicit DictionaryAttack(const sha256::Digest& target);

    /**
     * @brief Create from a hex-encoded target digest
     * @throws encoding::EncodingError if @p target_hex is not valid hex
     * @throws std::invalid_argument if it does not decode to 32 bytes
     */
    explicit DictionaryAttack(const std::string& target_hex);

    /**
     * @brief Hash one candidate and compare it with the target
     */
    bool try_candidate(const std::string& candidate);

    /**
     * @brief Try candidates in order, stop at the first match
     */
    std::optional<std::string> run(const std::vector<std::string>& candidates);

    /**
     * @brief Try one candidate per line from a stream
     *
     * A trailing '\r' is stripped and empty lines are skipped.
     */
    std::optional<std::string> run(std::istream& wordlist);

    /** Number of candidates hashed so far */
    uint64_t attempts() const noexcept { return attempts_; }

    const sha256::Digest& target() const noexcept { return target_; }

private:
    sha256::Digest target_;
    uint64_t attempts_ = 0;
};

} // namespace advanced
} // namespace shacore

#endif // SHACORE_ADVANCED_DICTIONARY_ATTACK_HPP
