/**
 * @file data_cid_writer.cpp
 * @brief Segment dispatch and ordered aggregation of leaf commitments
 */

#include <ingestion/data_cid_writer.hpp>
#include <commitment/errors.hpp>
#include <commitment/piece_hasher.hpp>
#include <commitment/unsealed_cid.hpp>
#include <commitment/zero_comm.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace Commpute {

namespace {

const WriterConfig& validated(const WriterConfig& config) {
    config.validate();
    return config;
}

} // namespace

DataCidWriter::DataCidWriter(const WriterConfig& config)
    : config_(validated(config)),
      hasher_(config.leaf_hasher ? config.leaf_hasher : LeafHasher(&DataCidWriter::compute_leaf)),
      segment_padded_(config.segment_padded()),
      segment_size_(static_cast<size_t>(config.segment_unpadded().value)),
      pool_(config.concurrency, segment_size_),
      buf_(segment_size_, 0) {
    Logger::debug("DataCidWriter: " + std::to_string(pool_.capacity()) + " leaf buffers of "
                  + std::to_string(segment_size_) + " bytes");
}

DataCidWriter::~DataCidWriter() {
    wait_for_leaves();
}

void DataCidWriter::wait_for_leaves() {
    for (auto& leaf : leaves_) {
        if (leaf.valid()) leaf.wait();
    }
}

LeafCommitment DataCidWriter::compute_leaf(const uint8_t* data, size_t len) {
    PieceDigest digest = PieceHasher::compute(data, len);
    LeafCommitment leaf;
    leaf.cid = PieceCid::from_commitment(digest.commitment);
    leaf.padded_size = digest.padded_size;
    return leaf;
}

size_t DataCidWriter::write(const void* data, size_t len) {
    if (finalized_) {
        throw std::logic_error("DataCidWriter: write after sum()");
    }

    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t remaining = len;

    while (remaining > 0) {
        const size_t buffered = static_cast<size_t>(len_ % segment_size_);
        const size_t to_buffer = std::min(segment_size_ - buffered, remaining);

        std::memcpy(buf_.data() + buffered, p, to_buffer);
        p += to_buffer;
        remaining -= to_buffer;
        len_ += to_buffer;

        if (len_ % segment_size_ == 0) {
            dispatch_segment();
        }
    }

    return len;
}

void DataCidWriter::dispatch_segment() {
    SegmentBufferPool::Lease lease = pool_.acquire();
    std::memcpy(lease.data(), buf_.data(), segment_size_);

    const size_t index = leaves_.size();
    const size_t size = segment_size_;
    Logger::debug("dispatching leaf " + std::to_string(index) + " on buffer " + std::to_string(lease.index()));

    leaves_.push_back(std::async(std::launch::async, [size, hasher = hasher_, lease = std::move(lease)]() mutable {
        // Owned by the task body so the buffer is back in the pool as soon as
        // the task exits, not when the future is collected.
        SegmentBufferPool::Lease held = std::move(lease);
        return hasher(held.data(), size);
    }));
}

DataCidSize DataCidWriter::sum() {
    if (finalized_) {
        throw std::logic_error("DataCidWriter: sum() already called");
    }
    finalized_ = true;

    if (len_ == 0) {
        throw EmptyInputError();
    }

    const uint64_t raw_len = len_;
    size_t last_len = static_cast<size_t>(len_ % segment_size_);

    std::vector<PieceCid> leaves;
    leaves.reserve(leaves_.size() + 1);

    for (size_t i = 0; i < leaves_.size(); ++i) {
        try {
            leaves.push_back(leaves_[i].get().cid);
        } catch (const std::exception& e) {
            // Later leaves are not inspected, only drained.
            wait_for_leaves();
            throw LeafComputationError(i, e.what());
        }
    }

    if (last_len != 0) {
        // Once any full leaf exists the tail must be a uniform segment too.
        if (!leaves.empty()) {
            std::fill(buf_.begin() + last_len, buf_.end(), 0);
            last_len = segment_size_;
        }

        LeafCommitment tail;
        try {
            tail = hasher_(buf_.data(), last_len);
        } catch (const std::exception& e) {
            throw LeafComputationError(leaves.size(), e.what());
        }

        if (tail.padded_size < segment_padded_) {
            Logger::debug("input smaller than one segment, committed at " + std::to_string(tail.padded_size.value));
            DataCidSize result;
            result.payload_size = raw_len;
            result.piece_size = tail.padded_size;
            result.piece_cid = tail.cid;
            return result;
        }

        leaves.push_back(tail.cid);
    }

    const size_t real = leaves.size();
    const size_t target = static_cast<size_t>(next_pow2(real));
    if (target > real) {
        const PieceCid zero = ZeroComm::piece_commitment(UnpaddedPieceSize(segment_size_));
        leaves.insert(leaves.end(), target - real, zero);
    }
    Logger::debug("aggregating " + std::to_string(real) + " leaves + " + std::to_string(target - real) + " zero leaves");

    DataCidSize result;
    result.payload_size = raw_len;
    result.piece_size = PaddedPieceSize(segment_padded_.value * leaves.size());

    if (leaves.size() == 1) {
        result.piece_cid = leaves[0];
        return result;
    }

    std::vector<PieceInfo> pieces;
    pieces.reserve(leaves.size());
    for (const auto& leaf : leaves) {
        pieces.push_back(PieceInfo{segment_padded_, leaf});
    }

    result.piece_cid = generate_unsealed_cid(config_.seal_proof, pieces);
    return result;
}

void to_json(nlohmann::json& j, const PieceCid& cid) {
    j = nlohmann::json{{"/", cid.to_string()}};
}

void to_json(nlohmann::json& j, const DataCidSize& size) {
    j = nlohmann::json{
        {"PayloadSize", size.payload_size},
        {"PieceSize", size.piece_size.value},
        {"PieceCID", size.piece_cid}
    };
}

} // namespace Commpute
