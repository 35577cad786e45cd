/**
 * @file sha254.cpp
 * @brief SHA-254 hashing via OpenSSL EVP
 */

#include <hashing/sha254.hpp>
#include <openssl/evp.h>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace Commpute {

namespace {

using EVP_MD_CTX_unique_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

// One digest context per thread; leaf tasks hash hundreds of thousands of
// nodes each and re-creating the context per node dominates the cost.
EVP_MD_CTX* thread_context() {
    thread_local EVP_MD_CTX_unique_ptr ctx{EVP_MD_CTX_new(), ::EVP_MD_CTX_free};
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    return ctx.get();
}

void sha256(const void* data, size_t len, uint8_t* out) {
    EVP_MD_CTX* ctx = thread_context();
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx, out, &written) != 1 || written != Sha254::HASH_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
}

} // namespace

Sha254::Hash Sha254::hash(const void* data, size_t len) {
    Hash result;
    sha256(data, len, result.data());
    truncate(result.data());
    return result;
}

Sha254::Hash Sha254::node(const Hash& left, const Hash& right) {
    uint8_t pair[2 * HASH_SIZE];
    std::memcpy(pair, left.data(), HASH_SIZE);
    std::memcpy(pair + HASH_SIZE, right.data(), HASH_SIZE);
    return node(pair);
}

Sha254::Hash Sha254::node(const uint8_t* pair) {
    return hash(pair, 2 * HASH_SIZE);
}

std::string Sha254::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

Sha254::Hash Sha254::from_hex(const std::string& hex) {
    Hash result = {0};

    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) + ". Expected 64.");
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        std::string byte_str = hex.substr(i * 2, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte_str[0]))
            || !std::isxdigit(static_cast<unsigned char>(byte_str[1]))) {
            throw std::invalid_argument("Invalid hex digit in: " + byte_str);
        }
        result[i] = (uint8_t)std::stoul(byte_str, nullptr, 16);
    }

    return result;
}

} // namespace Commpute
