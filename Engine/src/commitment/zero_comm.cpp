#include <commitment/zero_comm.hpp>
#include <array>
#include <stdexcept>
#include <string>

namespace Commpute {

namespace {

std::array<Sha254::Hash, ZeroComm::LEVELS + 1> build_table() {
    std::array<Sha254::Hash, ZeroComm::LEVELS + 1> table;
    table[0].fill(0);
    for (unsigned i = 1; i <= ZeroComm::LEVELS; ++i) {
        table[i] = Sha254::node(table[i - 1], table[i - 1]);
    }
    return table;
}

} // namespace

const Sha254::Hash& ZeroComm::level(unsigned level) {
    static const std::array<Sha254::Hash, LEVELS + 1> table = build_table();
    if (level > LEVELS) {
        throw std::out_of_range("zero commitment level " + std::to_string(level) + " exceeds " + std::to_string(LEVELS));
    }
    return table[level];
}

const Sha254::Hash& ZeroComm::commitment(PaddedPieceSize size) {
    size.validate();
    return level(log2_exact(size.value / Sha254::HASH_SIZE));
}

PieceCid ZeroComm::piece_commitment(UnpaddedPieceSize size) {
    size.validate();
    return PieceCid::from_commitment(commitment(size.padded()));
}

} // namespace Commpute
