/**
 * @file encoding.cpp
 * @brief Hexadecimal encoding utilities implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/utils/encoding.h"
#include "vaultfhe/core/errors.hpp"
#include <cstring>

// ============================================================================
// Internal Constants
// ============================================================================

static const char HEX_LOWER[] = "0123456789abcdef";
static const char HEX_UPPER[] = "0123456789ABCDEF";

static int hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ============================================================================
// C API: Hex Encoding/Decoding
// ============================================================================

extern "C" {

size_t vaultfhe_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if (data == nullptr || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }

    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_LOWER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';

    return len * 2;
}

int vaultfhe_is_hex_char(char c) {
    return hex_char_value(c) >= 0;
}

size_t vaultfhe_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size) {
    if (hex == nullptr || data == nullptr) {
        return 0;
    }

    if (hex_len == 0) {
        hex_len = strlen(hex);
    }

    // Must be even length
    if (hex_len % 2 != 0) {
        return 0;
    }

    size_t out_len = hex_len / 2;
    if (data_size < out_len) {
        return 0;
    }

    for (size_t i = 0; i < out_len; i++) {
        int hi = hex_char_value(hex[i * 2]);
        int lo = hex_char_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return 0;
        }
        data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return out_len;
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace vaultfhe {
namespace encoding {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Trimmed view [begin, end)
void digits_range(const std::string& text, size_t& begin, size_t& end) {
    begin = 0;
    end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
}

} // namespace

std::string hexEncode(const ByteVec& data) {
    return hexEncode(data.data(), data.size());
}

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string result(len * 2, '\0');
    for (size_t i = 0; i < len; i++) {
        result[i * 2] = HEX_LOWER[data[i] >> 4];
        result[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    return result;
}

std::string hexEncodeUpper(const ByteVec& data) {
    std::string result(data.size() * 2, '\0');
    for (size_t i = 0; i < data.size(); i++) {
        result[i * 2] = HEX_UPPER[data[i] >> 4];
        result[i * 2 + 1] = HEX_UPPER[data[i] & 0x0F];
    }
    return result;
}

ByteVec hexDecode(const std::string& hex) {
    size_t begin, end;
    digits_range(hex, begin, end);

    size_t digits = end - begin;
    if (digits % 2 != 0) {
        throw MalformedEncoding("hex text has odd length " + std::to_string(digits));
    }

    // Key material may be secret: report the position, never the content
    ByteVec result(digits / 2);
    for (size_t i = 0; i < result.size(); i++) {
        size_t pos = begin + i * 2;
        int hi = hex_char_value(hex[pos]);
        int lo = hex_char_value(hex[pos + 1]);
        if (hi < 0 || lo < 0) {
            throw MalformedEncoding("invalid hex character at offset " +
                                    std::to_string(hi < 0 ? pos : pos + 1));
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

ByteVec hexDecodeSafe(const std::string& hex) noexcept {
    try {
        return hexDecode(hex);
    } catch (const MalformedEncoding&) {
        return ByteVec();
    }
}

bool isValidHex(const std::string& str) noexcept {
    size_t begin, end;
    digits_range(str, begin, end);

    if ((end - begin) % 2 != 0) {
        return false;
    }

    for (size_t i = begin; i < end; i++) {
        if (hex_char_value(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace encoding
} // namespace vaultfhe
