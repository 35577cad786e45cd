#include <commitment/piece_hasher.hpp>
#include <commitment/fr32.hpp>
#include <cstring>
#include <stdexcept>
#include <string>

namespace Commpute {

PaddedPieceSize PieceHasher::padded_size_for(uint64_t len) {
    const uint64_t quads = (len + Fr32::UNPADDED_QUAD - 1) / Fr32::UNPADDED_QUAD;
    return PaddedPieceSize(next_pow2(quads * Fr32::PADDED_QUAD));
}

PieceDigest PieceHasher::compute(const uint8_t* data, size_t len) {
    if (len < MIN_PAYLOAD) {
        throw std::invalid_argument("insufficient data: commP is not defined for inputs shorter than "
                                    + std::to_string(MIN_PAYLOAD) + " bytes, got " + std::to_string(len));
    }
    if (len > MAX_PAYLOAD) {
        throw std::invalid_argument("payload of " + std::to_string(len) + " bytes exceeds the maximum of "
                                    + std::to_string(MAX_PAYLOAD));
    }

    const PaddedPieceSize padded = padded_size_for(len);

    // Zero-initialized: Fr32 padding of zero bytes is zero, so the tail needs no work.
    std::vector<uint8_t> tree(padded.value, 0);

    const size_t full_quads = len / Fr32::UNPADDED_QUAD;
    Fr32::pad(data, tree.data(), full_quads * Fr32::UNPADDED_QUAD);

    const size_t rest = len - full_quads * Fr32::UNPADDED_QUAD;
    if (rest != 0) {
        uint8_t quad[Fr32::UNPADDED_QUAD] = {0};
        std::memcpy(quad, data + full_quads * Fr32::UNPADDED_QUAD, rest);
        Fr32::pad_quad(quad, tree.data() + full_quads * Fr32::PADDED_QUAD);
    }

    PieceDigest result;
    result.commitment = reduce(tree.data(), padded.value / Sha254::HASH_SIZE);
    result.padded_size = padded;
    return result;
}

Sha254::Hash PieceHasher::reduce(uint8_t* nodes, size_t count) {
    // Parent i is written over slot i, which has already been consumed.
    while (count > 1) {
        for (size_t i = 0; i < count / 2; ++i) {
            Sha254::Hash parent = Sha254::node(nodes + 2 * i * Sha254::HASH_SIZE);
            std::memcpy(nodes + i * Sha254::HASH_SIZE, parent.data(), Sha254::HASH_SIZE);
        }
        count /= 2;
    }

    Sha254::Hash root;
    std::memcpy(root.data(), nodes, Sha254::HASH_SIZE);
    return root;
}

} // namespace Commpute
