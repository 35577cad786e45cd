/**
 * @file piece_cid.hpp
 * @brief Content identifier of an unsealed piece commitment
 *
 * Binary layout (all integers unsigned varints):
 *   version (1) | codec fil-commitment-unsealed (0xf101)
 *   | multihash sha2-256-trunc254-padded (0x1012) | digest length (32) | digest
 * The text form is multibase base32, lower case, unpadded, prefixed with 'b'.
 */

#pragma once

#include <export.hpp>
#include <hashing/sha254.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace Commpute {

class COMMPUTE_API PieceCid {
public:
    static constexpr uint64_t CID_VERSION = 1;
    static constexpr uint64_t FIL_COMMITMENT_UNSEALED = 0xf101;
    static constexpr uint64_t SHA2_256_TRUNC254_PADDED = 0x1012;

    PieceCid() = default;

    /**
     * @brief Wrap a raw commP digest.
     */
    static PieceCid from_commitment(const Sha254::Hash& commitment);

    /**
     * @brief Decode the binary form.
     * @throws InvalidCidError for anything but a v1 unsealed commitment
     */
    static PieceCid from_bytes(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decode the multibase text form.
     * @throws InvalidCidError
     */
    static PieceCid parse(const std::string& text);

    bool defined() const { return defined_; }

    /**
     * @throws InvalidCidError if the CID is undefined
     */
    const Sha254::Hash& commitment() const;

    std::vector<uint8_t> bytes() const;
    std::string to_string() const;

    bool operator==(const PieceCid& o) const {
        return defined_ == o.defined_ && commitment_ == o.commitment_;
    }
    bool operator!=(const PieceCid& o) const { return !(*this == o); }

private:
    explicit PieceCid(const Sha254::Hash& commitment) : commitment_(commitment), defined_(true) {}

    Sha254::Hash commitment_{};
    bool defined_ = false;
};

inline std::ostream& operator<<(std::ostream& os, const PieceCid& cid) {
    return os << (cid.defined() ? cid.to_string() : std::string("<undefined>"));
}

namespace Multibase {

std::string base32_encode(const uint8_t* data, size_t len);

/**
 * @throws InvalidCidError on characters outside the lower-case alphabet
 */
std::vector<uint8_t> base32_decode(const std::string& text);

} // namespace Multibase

namespace Varint {

void put(std::vector<uint8_t>& out, uint64_t value);

/**
 * @brief Read one varint at `pos`, advancing it.
 * @throws InvalidCidError on truncation or overflow
 */
uint64_t get(const std::vector<uint8_t>& in, size_t& pos);

} // namespace Varint

} // namespace Commpute
