/**
 * @file piece_size.hpp
 * @brief Padded and unpadded piece sizes
 *
 * Every 127 bytes of payload occupy 128 bytes once Fr32-padded, so the two
 * representations are related by:
 *   padded   = unpadded + unpadded / 127
 *   unpadded = padded - padded / 128
 */

#pragma once

#include <cstdint>

namespace Commpute {

struct UnpaddedPieceSize;

struct PaddedPieceSize {
    uint64_t value = 0;

    PaddedPieceSize() = default;
    constexpr explicit PaddedPieceSize(uint64_t v) : value(v) {}

    constexpr UnpaddedPieceSize unpadded() const;

    /**
     * @brief Throws std::invalid_argument unless the size is a power of two >= 128.
     */
    void validate() const;

    constexpr bool operator==(PaddedPieceSize o) const { return value == o.value; }
    constexpr bool operator!=(PaddedPieceSize o) const { return value != o.value; }
    constexpr bool operator<(PaddedPieceSize o) const { return value < o.value; }
};

struct UnpaddedPieceSize {
    uint64_t value = 0;

    UnpaddedPieceSize() = default;
    constexpr explicit UnpaddedPieceSize(uint64_t v) : value(v) {}

    constexpr PaddedPieceSize padded() const {
        return PaddedPieceSize(value + value / 127);
    }

    /**
     * @brief Throws std::invalid_argument unless the size is >= 127 and its
     * padded form is a power of two.
     */
    void validate() const;

    constexpr bool operator==(UnpaddedPieceSize o) const { return value == o.value; }
    constexpr bool operator!=(UnpaddedPieceSize o) const { return value != o.value; }
    constexpr bool operator<(UnpaddedPieceSize o) const { return value < o.value; }
};

constexpr UnpaddedPieceSize PaddedPieceSize::unpadded() const {
    return UnpaddedPieceSize(value - value / 128);
}

constexpr bool is_pow2(uint64_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

/**
 * @brief Smallest power of two >= v (v must be >= 1).
 */
constexpr uint64_t next_pow2(uint64_t v) {
    uint64_t p = 1;
    while (p < v) p <<= 1;
    return p;
}

/**
 * @brief Index of the single set bit of a power of two.
 */
constexpr unsigned log2_exact(uint64_t v) {
    unsigned n = 0;
    while (v > 1) {
        v >>= 1;
        ++n;
    }
    return n;
}

} // namespace Commpute
