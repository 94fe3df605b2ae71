#include "utils/crypto.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace gate {
namespace crypto {

std::string sha256(const std::string& data) {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    digest.resize(length);
    return hex_encode(digest);
}

std::string hex_encode(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

} // namespace crypto
} // namespace gate
