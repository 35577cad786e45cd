#include <commitment/unsealed_cid.hpp>
#include <commitment/errors.hpp>
#include <commitment/zero_comm.hpp>
#include <hashing/sha254.hpp>
#include <stdexcept>

namespace Commpute {

namespace {

struct StackFrame {
    uint64_t size;
    Sha254::Hash commitment;
};

// Merge the two topmost frames while they cover equal sizes.
void reduce_stack(std::vector<StackFrame>& stack) {
    while (stack.size() > 1 && stack[stack.size() - 2].size == stack.back().size) {
        StackFrame rhs = stack.back();
        stack.pop_back();
        StackFrame& lhs = stack.back();
        lhs.commitment = Sha254::node(lhs.commitment, rhs.commitment);
        lhs.size *= 2;
    }
}

void push_zero(std::vector<StackFrame>& stack, uint64_t size) {
    stack.push_back(StackFrame{size, ZeroComm::commitment(PaddedPieceSize(size))});
    reduce_stack(stack);
}

struct ProofEntry {
    SealProof proof;
    const char* name;
    const char* short_name;
    uint64_t sector;
};

const ProofEntry PROOFS[] = {
    {SealProof::StackedDrg2KiBV1,     "StackedDrg2KiBV1",     "2KiB",   uint64_t(2) << 10},
    {SealProof::StackedDrg8MiBV1,     "StackedDrg8MiBV1",     "8MiB",   uint64_t(8) << 20},
    {SealProof::StackedDrg512MiBV1,   "StackedDrg512MiBV1",   "512MiB", uint64_t(512) << 20},
    {SealProof::StackedDrg32GiBV1,    "StackedDrg32GiBV1",    "32GiB",  uint64_t(32) << 30},
    {SealProof::StackedDrg64GiBV1,    "StackedDrg64GiBV1",    "64GiB",  uint64_t(64) << 30},
    {SealProof::StackedDrg2KiBV1_1,   "StackedDrg2KiBV1_1",   nullptr,  uint64_t(2) << 10},
    {SealProof::StackedDrg8MiBV1_1,   "StackedDrg8MiBV1_1",   nullptr,  uint64_t(8) << 20},
    {SealProof::StackedDrg512MiBV1_1, "StackedDrg512MiBV1_1", nullptr,  uint64_t(512) << 20},
    {SealProof::StackedDrg32GiBV1_1,  "StackedDrg32GiBV1_1",  nullptr,  uint64_t(32) << 30},
    {SealProof::StackedDrg64GiBV1_1,  "StackedDrg64GiBV1_1",  nullptr,  uint64_t(64) << 30},
};

const ProofEntry& lookup(SealProof proof) {
    for (const auto& e : PROOFS) {
        if (e.proof == proof) return e;
    }
    throw std::invalid_argument("unknown seal proof type " + std::to_string(static_cast<int64_t>(proof)));
}

} // namespace

uint64_t sector_size(SealProof proof) {
    return lookup(proof).sector;
}

std::string to_string(SealProof proof) {
    return lookup(proof).name;
}

SealProof parse_seal_proof(const std::string& name) {
    for (const auto& e : PROOFS) {
        if (name == e.name || (e.short_name && name == e.short_name)) return e.proof;
    }
    throw std::invalid_argument("unknown seal proof '" + name + "'");
}

PieceCid generate_unsealed_cid(SealProof proof, const std::vector<PieceInfo>& pieces) {
    uint64_t sector;
    try {
        sector = sector_size(proof);
    } catch (const std::invalid_argument& e) {
        throw MerkleGenerationError(e.what());
    }

    if (pieces.empty()) {
        return PieceCid::from_commitment(ZeroComm::commitment(PaddedPieceSize(sector)));
    }

    std::vector<StackFrame> todo;
    todo.reserve(pieces.size());
    uint64_t sum = 0;

    for (size_t i = 0; i < pieces.size(); ++i) {
        const PieceInfo& p = pieces[i];
        try {
            p.size.validate();
            todo.push_back(StackFrame{p.size.value, p.cid.commitment()});
        } catch (const std::exception& e) {
            throw MerkleGenerationError("piece " + std::to_string(i) + ": " + e.what());
        }
        sum += p.size.value;
        if (sum > sector) {
            throw MerkleGenerationError("size of all pieces exceeds sector size (" + std::to_string(sector) + ")");
        }
    }

    std::vector<StackFrame> stack;
    stack.reserve(64);
    stack.push_back(todo[0]);

    for (size_t i = 1; i < todo.size(); ++i) {
        // Pre-pad so the left limb is balanced before a larger piece lands.
        while (stack.back().size < todo[i].size) {
            push_zero(stack, stack.back().size);
        }
        stack.push_back(todo[i]);
        reduce_stack(stack);
    }

    while (stack.size() > 1) {
        push_zero(stack, stack.back().size);
    }

    // Pre-padding can grow the tree past the raw sum of piece sizes.
    if (stack[0].size > sector) {
        throw MerkleGenerationError("padded piece tree of " + std::to_string(stack[0].size)
                                    + " bytes exceeds sector size (" + std::to_string(sector) + ")");
    }

    return PieceCid::from_commitment(stack[0].commitment);
}

} // namespace Commpute
