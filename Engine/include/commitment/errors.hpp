/**
 * @file errors.hpp
 * @brief Exception hierarchy for piece commitment computation
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Commpute {

class CommPError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Hashing or encoding failed for one segment.
 */
class LeafComputationError : public CommPError {
public:
    LeafComputationError(size_t index, const std::string& cause)
        : CommPError("processing leaf " + std::to_string(index) + ": " + cause),
          index_(index), cause_(cause) {}

    size_t index() const { return index_; }
    const std::string& cause() const { return cause_; }

private:
    size_t index_;
    std::string cause_;
};

/**
 * @brief The root combination rejected the padded leaf list.
 */
class MerkleGenerationError : public CommPError {
public:
    explicit MerkleGenerationError(const std::string& cause)
        : CommPError("generating unsealed CID: " + cause) {}
};

class InputReadError : public CommPError {
public:
    using CommPError::CommPError;
};

/**
 * @brief Finalization of a stream that never received a byte.
 */
class EmptyInputError : public CommPError {
public:
    EmptyInputError() : CommPError("piece commitment is not defined for an empty stream") {}
};

class InvalidCidError : public CommPError {
public:
    using CommPError::CommPError;
};

} // namespace Commpute
