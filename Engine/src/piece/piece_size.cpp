#include <piece/piece_size.hpp>
#include <stdexcept>
#include <string>

namespace Commpute {

void PaddedPieceSize::validate() const {
    if (value < 128) {
        throw std::invalid_argument("minimum padded piece size is 128 bytes, got " + std::to_string(value));
    }
    if (!is_pow2(value)) {
        throw std::invalid_argument("padded piece size must be a power of 2, got " + std::to_string(value));
    }
}

void UnpaddedPieceSize::validate() const {
    if (value < 127) {
        throw std::invalid_argument("minimum unpadded piece size is 127 bytes, got " + std::to_string(value));
    }
    // 127 * 2^n
    if (value % 127 != 0 || !is_pow2(value / 127)) {
        throw std::invalid_argument("unpadded piece size must be a power of 2 multiple of 127, got " + std::to_string(value));
    }
}

} // namespace Commpute
