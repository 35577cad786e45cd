/**
 * @file data_cid_writer.hpp
 * @brief Streaming piece commitment over an unbounded byte stream
 *
 * Bytes are cut into segments of one unpadded segment size. Every full
 * segment is copied into a private pool buffer and committed on its own task;
 * sum() collects the leaf commitments in stream order, pads the list with
 * zero leaves to a power of two and folds it into the piece root.
 *
 * The result depends only on the bytes written, not on how they were chunked,
 * on the concurrency limit, or on the order in which leaf tasks finish.
 */

#pragma once

#include <export.hpp>
#include <commitment/piece_cid.hpp>
#include <ingestion/segment_buffer_pool.hpp>
#include <ingestion/writer_config.hpp>
#include <piece/piece_size.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

namespace Commpute {

/**
 * @brief Result of a DataCidWriter
 */
struct DataCidSize {
    uint64_t payload_size = 0;      // Bytes written, exact
    PaddedPieceSize piece_size;
    PieceCid piece_cid;
};

class COMMPUTE_API DataCidWriter {
public:
    explicit DataCidWriter(const WriterConfig& config = WriterConfig());

    /**
     * @brief Waits for leaf tasks still in flight.
     */
    ~DataCidWriter();

    DataCidWriter(const DataCidWriter&) = delete;
    DataCidWriter& operator=(const DataCidWriter&) = delete;

    /**
     * @brief Append bytes to the stream.
     *
     * Blocks only while every pool buffer is held by a running leaf task.
     * @return len (all bytes are always accepted)
     * @throws std::logic_error after sum()
     */
    size_t write(const void* data, size_t len);

    size_t write(const std::vector<uint8_t>& data) {
        return write(data.data(), data.size());
    }

    /**
     * @brief Finalize the stream. Can be called once.
     *
     * @throws EmptyInputError if nothing was written
     * @throws LeafComputationError for the first failed leaf in stream order,
     *         once every dispatched leaf task has finished
     * @throws MerkleGenerationError if the leaves cannot be combined
     * @throws std::logic_error on a second call
     */
    DataCidSize sum();

    uint64_t bytes_written() const { return len_; }
    size_t leaves_dispatched() const { return leaves_.size(); }
    size_t buffers_available() const { return pool_.available(); }
    const WriterConfig& config() const { return config_; }

    /**
     * @brief Hash one segment and encode its commitment.
     */
    static LeafCommitment compute_leaf(const uint8_t* data, size_t len);

private:
    void dispatch_segment();
    void wait_for_leaves();

    WriterConfig config_;
    LeafHasher hasher_;
    PaddedPieceSize segment_padded_;
    size_t segment_size_;                     // Unpadded bytes per leaf
    SegmentBufferPool pool_;
    std::vector<uint8_t> buf_;                // Scratch for the segment being filled
    uint64_t len_ = 0;
    bool finalized_ = false;
    std::vector<std::future<LeafCommitment>> leaves_;   // Declared after pool_: destroyed first
};

void to_json(nlohmann::json& j, const PieceCid& cid);
void to_json(nlohmann::json& j, const DataCidSize& size);

} // namespace Commpute
