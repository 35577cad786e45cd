/**
 * @file test_hashing.cpp
 * @brief Unit tests for SHA-254 node hashing
 */

#include <gtest/gtest.h>
#include <hashing/sha254.hpp>
#include <algorithm>
#include <string>

using namespace Commpute;

TEST(HashingTest, Determinism) {
    std::string data = "piece commitment";
    auto hash1 = Sha254::hash(data);
    auto hash2 = Sha254::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = Sha254::hash("test1");
    auto hash2 = Sha254::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, TruncatesTopTwoBits) {
    // sha256("abc") ends in 0xad; 0xad & 0x3f == 0x2d
    auto hash = Sha254::hash("abc");
    EXPECT_EQ(Sha254::to_hex(hash), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f200152d");
}

TEST(HashingTest, NodeOfZeroLeaves) {
    Sha254::Hash zero{};
    auto parent = Sha254::node(zero, zero);
    EXPECT_EQ(Sha254::to_hex(parent), "f5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb0b");
    EXPECT_EQ(parent[31] & 0xC0, 0);
}

TEST(HashingTest, ContiguousNodeMatchesPair) {
    auto left = Sha254::hash("left");
    auto right = Sha254::hash("right");

    uint8_t pair[64];
    std::copy(left.begin(), left.end(), pair);
    std::copy(right.begin(), right.end(), pair + 32);

    EXPECT_EQ(Sha254::node(pair), Sha254::node(left, right));
    EXPECT_NE(Sha254::node(left, right), Sha254::node(right, left));
}

TEST(HashingTest, HexConversion) {
    auto hash = Sha254::hash("hex_test");
    std::string hex = Sha254::to_hex(hash);
    auto hash_rt = Sha254::from_hex(hex);

    EXPECT_EQ(hash, hash_rt);
    EXPECT_EQ(hex.length(), 64u);
}

TEST(HashingTest, HexRejectsBadInput) {
    EXPECT_THROW(Sha254::from_hex("abcd"), std::invalid_argument);
    EXPECT_THROW(Sha254::from_hex(std::string(64, 'z')), std::invalid_argument);

    // Sign and whitespace prefixes are not hex digits
    EXPECT_THROW(Sha254::from_hex("-1" + std::string(62, '0')), std::invalid_argument);
    EXPECT_THROW(Sha254::from_hex("+f" + std::string(62, '0')), std::invalid_argument);
    EXPECT_THROW(Sha254::from_hex(" f" + std::string(62, '0')), std::invalid_argument);
    EXPECT_THROW(Sha254::from_hex(std::string(62, '0') + "0x"), std::invalid_argument);
    EXPECT_EQ(Sha254::from_hex("Ff" + std::string(62, '0'))[0], 0xFF);
}
