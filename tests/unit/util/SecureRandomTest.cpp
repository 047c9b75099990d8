/**
 * @file SecureRandomTest.cpp
 * @brief Unit tests for SecureRandom
 */

#include "util/SecureRandom.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

TEST(SecureRandomTest, HexToken_HasTwoCharsPerByte) {
    auto token = util::SecureRandom::hex_token(32);
    EXPECT_EQ(token.size(), 64u);
    EXPECT_TRUE(std::ranges::all_of(token, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
}

TEST(SecureRandomTest, HexToken_IsUnique) {
    std::set<std::string> tokens;
    for (int i = 0; i < 100; ++i) {
        tokens.insert(util::SecureRandom::hex_token(8));
    }
    EXPECT_EQ(tokens.size(), 100u);
}

TEST(SecureRandomTest, Fill_EmptyBuffer_DoesNothing) {
    std::vector<uint8_t> empty;
    EXPECT_NO_THROW(util::SecureRandom::fill(empty));
}

TEST(SecureRandomTest, Fill_ChangesBuffer) {
    std::vector<uint8_t> buffer(256, 0);
    util::SecureRandom::fill(buffer);
    EXPECT_FALSE(std::ranges::all_of(buffer, [](uint8_t b) { return b == 0; }));
}

TEST(SecureRandomTest, Uniform_StaysBelowBound) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(util::SecureRandom::uniform(7), 7u);
    }
    EXPECT_EQ(util::SecureRandom::uniform(0), 0u);
    EXPECT_EQ(util::SecureRandom::uniform(1), 0u);
}

TEST(SecureRandomTest, Uniform_ReachesEveryValue) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 2000; ++i) {
        seen.insert(util::SecureRandom::uniform(10));
    }
    EXPECT_EQ(seen.size(), 10u);
}
