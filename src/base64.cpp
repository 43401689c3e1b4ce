/**
 * @file base64.cpp
 * @brief Base64 encode/decode
 */

#include "soon/base64.h"

#include <cctype>

namespace soon {

namespace {

const std::string kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool is_base64_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16);
        if (i + 1 < len) n |= (static_cast<uint32_t>(data[i + 1]) << 8);
        if (i + 2 < len) n |= data[i + 2];

        result += kBase64Chars[(n >> 18) & 0x3F];
        result += kBase64Chars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kBase64Chars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kBase64Chars[n & 0x3F] : '=';
    }
    return result;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> result;
    result.reserve(encoded.size() / 4 * 3);

    uint8_t quad[4];
    int count = 0;

    for (char ch : encoded) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '=' || !is_base64_char(c)) {
            break;
        }
        quad[count++] = static_cast<uint8_t>(kBase64Chars.find(static_cast<char>(c)));
        if (count == 4) {
            result.push_back(static_cast<uint8_t>((quad[0] << 2) + ((quad[1] & 0x30) >> 4)));
            result.push_back(static_cast<uint8_t>(((quad[1] & 0xf) << 4) + ((quad[2] & 0x3c) >> 2)));
            result.push_back(static_cast<uint8_t>(((quad[2] & 0x3) << 6) + quad[3]));
            count = 0;
        }
    }

    // Trailing partial group: 2 chars -> 1 byte, 3 chars -> 2 bytes
    if (count >= 2) {
        result.push_back(static_cast<uint8_t>((quad[0] << 2) + ((quad[1] & 0x30) >> 4)));
    }
    if (count == 3) {
        result.push_back(static_cast<uint8_t>(((quad[1] & 0xf) << 4) + ((quad[2] & 0x3c) >> 2)));
    }
    return result;
}

} // namespace soon
