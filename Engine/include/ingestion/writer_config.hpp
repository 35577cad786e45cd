#pragma once

#include <commitment/piece_cid.hpp>
#include <commitment/unsealed_cid.hpp>
#include <piece/piece_size.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace Commpute {

/**
 * @brief Commitment of one leaf and the padded size it was computed at
 */
struct LeafCommitment {
    PieceCid cid;
    PaddedPieceSize padded_size;
};

/**
 * @brief Commits one segment. Called concurrently from leaf tasks.
 */
using LeafHasher = std::function<LeafCommitment(const uint8_t* data, size_t len)>;

/**
 * @brief DataCidWriter configuration
 */
struct WriterConfig {
    static constexpr uint64_t DEFAULT_SEGMENT_PADDED_SIZE = uint64_t(8) << 20;

    size_t concurrency = default_concurrency();            // Max leaf tasks in flight
    uint64_t segment_padded_size = DEFAULT_SEGMENT_PADDED_SIZE;
    SealProof seal_proof = SealProof::StackedDrg32GiBV1;   // Bounds the combined piece
    LeafHasher leaf_hasher;                                 // Empty: DataCidWriter::compute_leaf

    PaddedPieceSize segment_padded() const { return PaddedPieceSize(segment_padded_size); }
    UnpaddedPieceSize segment_unpadded() const { return segment_padded().unpadded(); }

    /**
     * @brief Throws std::invalid_argument on a zero concurrency, a segment
     * size that is not a power of two >= 128, or an unknown seal proof.
     */
    void validate() const;

    /**
     * @brief Defaults overridden by COMMPUTE_CONCURRENCY, COMMPUTE_SEGMENT_SIZE
     * and COMMPUTE_SEAL_PROOF.
     */
    static WriterConfig from_env();

    /**
     * @brief Hardware concurrency, or 1 when it cannot be determined.
     */
    static size_t default_concurrency();
};

} // namespace Commpute
