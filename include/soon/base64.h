/**
 * @file base64.h
 * @brief Base64 text form used for Binary values
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace soon {

/// Standard alphabet, '=' padded
std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

/**
 * @brief Decode standard Base64
 *
 * Decoding stops at the first '=' or character outside the alphabet.
 */
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace soon
