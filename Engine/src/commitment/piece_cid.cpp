#include <commitment/piece_cid.hpp>
#include <commitment/errors.hpp>
#include <algorithm>

namespace Commpute {

namespace {

constexpr char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";

std::string hex_code(uint64_t v) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    do {
        s.push_back(digits[v & 0xF]);
        v >>= 4;
    } while (v);
    std::reverse(s.begin(), s.end());
    return "0x" + s;
}

} // namespace

namespace Multibase {

std::string base32_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            out.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::vector<uint8_t> base32_decode(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        uint32_t v;
        if (c >= 'a' && c <= 'z') {
            v = (uint32_t)(c - 'a');
        } else if (c >= '2' && c <= '7') {
            v = (uint32_t)(c - '2') + 26;
        } else {
            throw InvalidCidError(std::string("invalid base32 character '") + c + "'");
        }
        buffer = (buffer << 5) | v;
        bits += 5;
        if (bits >= 8) {
            out.push_back((uint8_t)(buffer >> (bits - 8)));
            bits -= 8;
        }
    }
    return out;
}

} // namespace Multibase

namespace Varint {

void put(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back((uint8_t)(value | 0x80));
        value >>= 7;
    }
    out.push_back((uint8_t)value);
}

uint64_t get(const std::vector<uint8_t>& in, size_t& pos) {
    uint64_t value = 0;
    for (unsigned shift = 0; shift < 64; shift += 7) {
        if (pos >= in.size()) {
            throw InvalidCidError("truncated varint");
        }
        uint8_t b = in[pos++];
        value |= (uint64_t)(b & 0x7F) << shift;
        if ((b & 0x80) == 0) return value;
    }
    throw InvalidCidError("varint overflows 64 bits");
}

} // namespace Varint

PieceCid PieceCid::from_commitment(const Sha254::Hash& commitment) {
    return PieceCid(commitment);
}

PieceCid PieceCid::from_bytes(const std::vector<uint8_t>& bytes) {
    size_t pos = 0;

    uint64_t version = Varint::get(bytes, pos);
    if (version != CID_VERSION) {
        throw InvalidCidError("unsupported CID version " + std::to_string(version));
    }
    uint64_t codec = Varint::get(bytes, pos);
    if (codec != FIL_COMMITMENT_UNSEALED) {
        throw InvalidCidError("incorrect codec " + hex_code(codec) + " for unsealed commitment");
    }
    uint64_t mh_code = Varint::get(bytes, pos);
    if (mh_code != SHA2_256_TRUNC254_PADDED) {
        throw InvalidCidError("incorrect hash function " + hex_code(mh_code) + " for unsealed commitment");
    }
    uint64_t length = Varint::get(bytes, pos);
    if (length != Sha254::HASH_SIZE || bytes.size() - pos != Sha254::HASH_SIZE) {
        throw InvalidCidError("commitments must be 32 bytes long");
    }

    Sha254::Hash commitment;
    std::copy(bytes.begin() + pos, bytes.end(), commitment.begin());
    return PieceCid(commitment);
}

PieceCid PieceCid::parse(const std::string& text) {
    if (text.empty() || text[0] != 'b') {
        throw InvalidCidError("expected multibase base32 CID, got '" + text + "'");
    }
    return from_bytes(Multibase::base32_decode(text.substr(1)));
}

const Sha254::Hash& PieceCid::commitment() const {
    if (!defined_) {
        throw InvalidCidError("undefined CID");
    }
    return commitment_;
}

std::vector<uint8_t> PieceCid::bytes() const {
    std::vector<uint8_t> out;
    out.reserve(7 + Sha254::HASH_SIZE);
    Varint::put(out, CID_VERSION);
    Varint::put(out, FIL_COMMITMENT_UNSEALED);
    Varint::put(out, SHA2_256_TRUNC254_PADDED);
    Varint::put(out, Sha254::HASH_SIZE);
    const Sha254::Hash& c = commitment();
    out.insert(out.end(), c.begin(), c.end());
    return out;
}

std::string PieceCid::to_string() const {
    std::vector<uint8_t> raw = bytes();
    return "b" + Multibase::base32_encode(raw.data(), raw.size());
}

} // namespace Commpute
