/**
 * @file fr32.hpp
 * @brief Fr32 bit padding
 *
 * Payload is consumed in quads of 127 bytes (1016 bits). Each quad is written
 * as four 254-bit little-endian field elements, every one followed by two zero
 * bits, giving 128 output bytes whose 32-byte words are valid Fr elements.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace Commpute {
namespace Fr32 {

constexpr size_t UNPADDED_QUAD = 127;
constexpr size_t PADDED_QUAD = 128;

/**
 * @brief Pad `unpadded_len` bytes from `in` into `out`.
 *
 * `unpadded_len` must be a multiple of 127; `out` must hold
 * unpadded_len / 127 * 128 bytes. Buffers must not overlap.
 */
void pad(const uint8_t* in, uint8_t* out, size_t unpadded_len);

/**
 * @brief Inverse of pad(). `padded_len` must be a multiple of 128.
 */
void unpad(const uint8_t* in, uint8_t* out, size_t padded_len);

/**
 * @brief Pad exactly one quad.
 */
void pad_quad(const uint8_t* in, uint8_t* out);

void unpad_quad(const uint8_t* in, uint8_t* out);

} // namespace Fr32
} // namespace Commpute
