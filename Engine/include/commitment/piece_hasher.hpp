/**
 * @file piece_hasher.hpp
 * @brief Piece commitment (commP) of a single in-memory buffer
 *
 * The payload is zero-extended to the next power-of-two padded size,
 * Fr32-padded, and folded pairwise with Sha254::node into a single root.
 */

#pragma once

#include <export.hpp>
#include <hashing/sha254.hpp>
#include <piece/piece_size.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Commpute {

struct PieceDigest {
    Sha254::Hash commitment;
    PaddedPieceSize padded_size;
};

class COMMPUTE_API PieceHasher {
public:
    /// 64 bytes or fewer would fit a 64-byte tree, below the smallest (128-byte) piece.
    static constexpr uint64_t MIN_PAYLOAD = 65;
    static constexpr uint64_t MAX_PIECE_SIZE = uint64_t(64) << 30;
    static constexpr uint64_t MAX_PAYLOAD = MAX_PIECE_SIZE / 128 * 127;

    /**
     * @brief Compute the commitment of `len` bytes.
     * @throws std::invalid_argument if len is outside [MIN_PAYLOAD, MAX_PAYLOAD]
     */
    static PieceDigest compute(const uint8_t* data, size_t len);

    static PieceDigest compute(const std::vector<uint8_t>& data) {
        return compute(data.data(), data.size());
    }

    /**
     * @brief Padded size a payload of `len` bytes is committed at.
     */
    static PaddedPieceSize padded_size_for(uint64_t len);

    /**
     * @brief Fold `count` contiguous 32-byte nodes (a power of two) into
     * their root. Overwrites the buffer.
     */
    static Sha254::Hash reduce(uint8_t* nodes, size_t count);
};

} // namespace Commpute
