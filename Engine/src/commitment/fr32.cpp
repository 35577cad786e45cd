#include <commitment/fr32.hpp>
#include <cstring>
#include <stdexcept>
#include <string>

namespace Commpute {
namespace Fr32 {

void pad_quad(const uint8_t* in, uint8_t* out) {
    // First 254 bits are copied as-is, then the 2-bit gap.
    std::memcpy(out, in, 32);
    out[31] &= 0x3F;

    // Each following element starts with the bits the previous one did not fit.
    for (size_t i = 32; i < 64; ++i) {
        out[i] = (uint8_t)((in[i] << 2) | (in[i - 1] >> 6));
    }
    out[63] &= 0x3F;

    for (size_t i = 64; i < 96; ++i) {
        out[i] = (uint8_t)((in[i] << 4) | (in[i - 1] >> 4));
    }
    out[95] &= 0x3F;

    for (size_t i = 96; i < 127; ++i) {
        out[i] = (uint8_t)((in[i] << 6) | (in[i - 1] >> 2));
    }
    out[127] = (uint8_t)(in[126] >> 2);
}

void unpad_quad(const uint8_t* in, uint8_t* out) {
    std::memcpy(out, in, 31);
    out[31] = (uint8_t)((in[31] & 0x3F) | (in[32] << 6));

    for (size_t i = 32; i < 63; ++i) {
        out[i] = (uint8_t)((in[i] >> 2) | (in[i + 1] << 6));
    }
    out[63] = (uint8_t)(((in[63] >> 2) & 0x0F) | (in[64] << 4));

    for (size_t i = 64; i < 95; ++i) {
        out[i] = (uint8_t)((in[i] >> 4) | (in[i + 1] << 4));
    }
    out[95] = (uint8_t)(((in[95] >> 4) & 0x03) | (in[96] << 2));

    for (size_t i = 96; i < 127; ++i) {
        out[i] = (uint8_t)((in[i] >> 6) | (in[i + 1] << 2));
    }
}

void pad(const uint8_t* in, uint8_t* out, size_t unpadded_len) {
    if (unpadded_len % UNPADDED_QUAD != 0) {
        throw std::invalid_argument("fr32 pad: length " + std::to_string(unpadded_len) + " is not a multiple of 127");
    }
    const size_t quads = unpadded_len / UNPADDED_QUAD;
    for (size_t q = 0; q < quads; ++q) {
        pad_quad(in + q * UNPADDED_QUAD, out + q * PADDED_QUAD);
    }
}

void unpad(const uint8_t* in, uint8_t* out, size_t padded_len) {
    if (padded_len % PADDED_QUAD != 0) {
        throw std::invalid_argument("fr32 unpad: length " + std::to_string(padded_len) + " is not a multiple of 128");
    }
    const size_t quads = padded_len / PADDED_QUAD;
    for (size_t q = 0; q < quads; ++q) {
        unpad_quad(in + q * PADDED_QUAD, out + q * UNPADDED_QUAD);
    }
}

} // namespace Fr32
} // namespace Commpute
