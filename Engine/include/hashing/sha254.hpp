/**
 * @file sha254.hpp
 * @brief SHA-256 truncated to 254 bits, the node hash of piece commitment trees
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Commpute {

/**
 * @brief SHA-256 with the two most significant bits of the final byte cleared.
 *
 * The truncated digest always fits in a BLS12-381 scalar field element, which
 * is what lets tree nodes be consumed by the proving system unchanged.
 */
class COMMPUTE_API Sha254 {
public:
    static constexpr size_t HASH_SIZE = 32;
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 32-byte truncated digest
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Parent of two tree nodes: hash(left || right)
     */
    static Hash node(const Hash& left, const Hash& right);

    /**
     * @brief Parent of two adjacent nodes stored contiguously (64 bytes)
     */
    static Hash node(const uint8_t* pair);

    /**
     * @brief Clear the two high bits of the last byte in place
     */
    static void truncate(uint8_t* digest) {
        digest[HASH_SIZE - 1] &= 0x3F;
    }

    static std::string to_hex(const Hash& hash);

    static Hash from_hex(const std::string& hex);
};

} // namespace Commpute
