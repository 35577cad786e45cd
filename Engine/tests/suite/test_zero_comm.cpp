/**
 * @file test_zero_comm.cpp
 * @brief All-zero piece commitment table
 */

#include <gtest/gtest.h>
#include <commitment/zero_comm.hpp>
#include <commitment/piece_hasher.hpp>
#include <stdexcept>
#include <vector>

using namespace Commpute;

TEST(ZeroCommTest, KnownLevels) {
    EXPECT_EQ(Sha254::to_hex(ZeroComm::level(0)), std::string(64, '0'));
    EXPECT_EQ(Sha254::to_hex(ZeroComm::level(2)), "3731bb99ac689f66eef5973e4a94da188f4ddcae580724fc6f3fd60dfd488333");
    EXPECT_EQ(Sha254::to_hex(ZeroComm::level(3)), "642a607ef886b004bf2c1978463ae1d4693ac0f410eb2d1b7a47fe205e5e750f");
}

TEST(ZeroCommTest, EachLevelFoldsThePrevious) {
    for (unsigned i = 1; i <= 20; ++i) {
        EXPECT_EQ(ZeroComm::level(i), Sha254::node(ZeroComm::level(i - 1), ZeroComm::level(i - 1))) << "level " << i;
    }
}

TEST(ZeroCommTest, MatchesHashedZeros) {
    for (uint64_t padded : {128u, 256u, 2048u, 16384u}) {
        std::vector<uint8_t> zeros(PaddedPieceSize(padded).unpadded().value, 0);
        auto direct = PieceHasher::compute(zeros);
        EXPECT_EQ(direct.padded_size.value, padded);
        EXPECT_EQ(direct.commitment, ZeroComm::commitment(PaddedPieceSize(padded))) << padded;
        EXPECT_EQ(PieceCid::from_commitment(direct.commitment),
                  ZeroComm::piece_commitment(UnpaddedPieceSize(zeros.size())));
    }
}

TEST(ZeroCommTest, RejectsInvalidSizes) {
    EXPECT_THROW(ZeroComm::piece_commitment(UnpaddedPieceSize(1000)), std::invalid_argument);
    EXPECT_THROW(ZeroComm::commitment(PaddedPieceSize(100)), std::invalid_argument);
    EXPECT_THROW(ZeroComm::level(ZeroComm::LEVELS + 1), std::out_of_range);
}
