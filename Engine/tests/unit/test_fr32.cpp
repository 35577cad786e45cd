/**
 * @file test_fr32.cpp
 * @brief Fr32 bit padding
 */

#include <gtest/gtest.h>
#include <commitment/fr32.hpp>
#include <random>
#include <stdexcept>
#include <vector>

using namespace Commpute;

TEST(Fr32Test, ZeroStaysZero) {
    std::vector<uint8_t> in(127 * 4, 0);
    std::vector<uint8_t> out(128 * 4, 0xFF);
    Fr32::pad(in.data(), out.data(), in.size());
    for (uint8_t b : out) EXPECT_EQ(b, 0);
}

TEST(Fr32Test, EveryWordIsAFieldElement) {
    std::vector<uint8_t> in(127, 0xFF);
    std::vector<uint8_t> out(128);
    Fr32::pad(in.data(), out.data(), in.size());

    // All ones in, so each 32-byte word is 254 ones and two zero bits.
    for (size_t w = 0; w < 4; ++w) {
        for (size_t i = 0; i < 31; ++i) EXPECT_EQ(out[w * 32 + i], 0xFF) << "word " << w << " byte " << i;
        EXPECT_EQ(out[w * 32 + 31], 0x3F) << "word " << w;
    }
}

TEST(Fr32Test, SingleBitLandsAfterGap) {
    // Input bit 254 is the first bit of the second field element: padded bit 256.
    std::vector<uint8_t> in(127, 0);
    in[31] = 0x40;
    std::vector<uint8_t> out(128);
    Fr32::pad(in.data(), out.data(), in.size());

    EXPECT_EQ(out[31], 0x00);
    EXPECT_EQ(out[32], 0x01);
}

TEST(Fr32Test, UnpadInvertsPad) {
    std::mt19937 rng(7);
    std::vector<uint8_t> in(127 * 16);
    for (auto& b : in) b = static_cast<uint8_t>(rng());

    std::vector<uint8_t> padded(128 * 16);
    std::vector<uint8_t> back(in.size());
    Fr32::pad(in.data(), padded.data(), in.size());
    Fr32::unpad(padded.data(), back.data(), padded.size());

    EXPECT_EQ(back, in);
}

TEST(Fr32Test, RejectsPartialQuads) {
    std::vector<uint8_t> buf(256);
    EXPECT_THROW(Fr32::pad(buf.data(), buf.data(), 100), std::invalid_argument);
    EXPECT_THROW(Fr32::unpad(buf.data(), buf.data(), 127), std::invalid_argument);
}
