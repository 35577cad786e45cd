/**
 * @file zero_comm.hpp
 * @brief Commitments of all-zero pieces
 */

#pragma once

#include <export.hpp>
#include <commitment/piece_cid.hpp>
#include <hashing/sha254.hpp>
#include <piece/piece_size.hpp>

namespace Commpute {

class COMMPUTE_API ZeroComm {
public:
    /// Tree levels above the 32-byte leaves; covers padded sizes up to 2^63.
    static constexpr unsigned LEVELS = 59;

    /**
     * @brief Root of a zero tree `level` levels above its 32-byte leaves.
     */
    static const Sha254::Hash& level(unsigned level);

    static const Sha254::Hash& commitment(PaddedPieceSize size);

    /**
     * @brief CID of the all-zero piece of the given unpadded size.
     * @throws std::invalid_argument if the size is not a valid unpadded piece size
     */
    static PieceCid piece_commitment(UnpaddedPieceSize size);
};

} // namespace Commpute
