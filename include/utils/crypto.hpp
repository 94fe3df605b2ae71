#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace gate {
namespace crypto {

/**
 * SHA-256 of the input as lowercase hex. Used for audit fingerprints.
 * Throws std::runtime_error if the OpenSSL digest fails.
 */
std::string sha256(const std::string& data);

std::string hex_encode(const std::vector<uint8_t>& bytes);

} // namespace crypto
} // namespace gate
