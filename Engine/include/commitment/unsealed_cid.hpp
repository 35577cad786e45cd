/**
 * @file unsealed_cid.hpp
 * @brief Combination of ordered piece commitments into one unsealed root
 */

#pragma once

#include <export.hpp>
#include <commitment/piece_cid.hpp>
#include <piece/piece_size.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Commpute {

/**
 * @brief Registered seal proof; selects the sector size bounding a combination.
 */
enum class SealProof : int64_t {
    StackedDrg2KiBV1 = 0,
    StackedDrg8MiBV1 = 1,
    StackedDrg512MiBV1 = 2,
    StackedDrg32GiBV1 = 3,
    StackedDrg64GiBV1 = 4,
    StackedDrg2KiBV1_1 = 5,
    StackedDrg8MiBV1_1 = 6,
    StackedDrg512MiBV1_1 = 7,
    StackedDrg32GiBV1_1 = 8,
    StackedDrg64GiBV1_1 = 9,
};

/**
 * @throws std::invalid_argument for unregistered values
 */
uint64_t sector_size(SealProof proof);

std::string to_string(SealProof proof);

/**
 * @brief Accepts registered names ("StackedDrg32GiBV1") or a bare sector
 * size ("32GiB", selecting the V1 proof).
 * @throws std::invalid_argument
 */
SealProof parse_seal_proof(const std::string& name);

struct PieceInfo {
    PaddedPieceSize size;
    PieceCid cid;
};

/**
 * @brief Fold ordered pieces into the unsealed commitment of the region they
 * occupy, inserting zero pieces wherever a smaller piece must be aligned
 * before a larger one.
 *
 * An empty list yields the zero commitment of a whole sector.
 *
 * @throws MerkleGenerationError on invalid piece sizes, undecodable CIDs, or
 * a total larger than the sector size
 */
COMMPUTE_API PieceCid generate_unsealed_cid(SealProof proof, const std::vector<PieceInfo>& pieces);

} // namespace Commpute
