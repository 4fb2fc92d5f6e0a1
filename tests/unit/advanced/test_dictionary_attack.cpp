/**
 * @file test_dictionary_attack.cpp
 * @brief Dictionary attack demonstration tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "shacore/advanced/dictionary_attack.hpp"
#include "shacore/utils/encoding.h"

using shacore::advanced::DictionaryAttack;

// SHA-256("letmein")
static const char* kLetMeInHex =
    "1c8bfe8f801d79745c4631d09fff36c82aa37fc4cce4fc946683d7b336b63032";

TEST(DictionaryAttackTest, FindsPasswordInList) {
    DictionaryAttack attack{std::string(kLetMeInHex)};
    const std::vector<std::string> words = {"123456", "password", "letmein", "qwerty"};

    const auto found = attack.run(words);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "letmein");
    EXPECT_EQ(attack.attempts(), 3u);
}

TEST(DictionaryAttackTest, ReportsMissingPassword) {
    DictionaryAttack attack(shacore::sha256::digest(std::string("correct horse battery staple")));
    const std::vector<std::string> words = {"123456", "password", "letmein"};

    EXPECT_FALSE(attack.run(words).has_value());
    EXPECT_EQ(attack.attempts(), words.size());
}

TEST(DictionaryAttackTest, StreamSkipsBlankLinesAndCarriageReturns) {
    DictionaryAttack attack{std::string(kLetMeInHex)};
    std::istringstream wordlist("password\r\n\r\n\nabc123\r\nletmein\r\nunused\n");

    const auto found = attack.run(wordlist);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "letmein");
    EXPECT_EQ(attack.attempts(), 3u);
}

TEST(DictionaryAttackTest, TargetFromHexMatchesDigest) {
    DictionaryAttack attack{std::string(kLetMeInHex)};
    EXPECT_EQ(attack.target(), shacore::sha256::digest(std::string("letmein")));
    EXPECT_TRUE(attack.try_candidate("letmein"));
    EXPECT_FALSE(attack.try_candidate("LetMeIn"));
}

TEST(DictionaryAttackTest, RejectsMalformedTarget) {
    EXPECT_THROW(DictionaryAttack(std::string("not-hex")), shacore::encoding::EncodingError);
    EXPECT_THROW(DictionaryAttack(std::string("abcd")), std::invalid_argument);
}
