#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pidbox {
namespace utils {

static constexpr char b64_enc_table[64] = {
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
    'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
    'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
    'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

static constexpr uint8_t b64_invalid = 0xFF;

constexpr uint8_t b64_decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<uint8_t>(c - 'A');
    if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(c - 'a' + 26);
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0' + 52);
    if (c == '+') return 62;
    if (c == '/') return 63;
    return b64_invalid;
}

/**
 * @brief Standard (RFC 4648, padded) base64 encoding.
 *
 * Envelope bodies on the Redis transport are carried this way.
 */
inline std::string base64_encode(std::string_view input) {
    const auto* data = reinterpret_cast<const uint8_t*>(input.data());
    size_t length = input.size();
    if (length == 0) return "";

    std::string result;
    result.resize(4 * ((length + 2) / 3));
    size_t i = 0, j = 0;
    while (i + 2 < length) {
        uint32_t val = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        i += 3;
        result[j + 0] = b64_enc_table[(val >> 18) & 0x3F];
        result[j + 1] = b64_enc_table[(val >> 12) & 0x3F];
        result[j + 2] = b64_enc_table[(val >> 6) & 0x3F];
        result[j + 3] = b64_enc_table[val & 0x3F];
        j += 4;
    }
    if (i < length) {
        uint32_t val = uint32_t(data[i]) << 16;
        if ((i + 1) < length) val |= (uint32_t(data[i + 1]) << 8);
        result[j + 0] = b64_enc_table[(val >> 18) & 0x3F];
        result[j + 1] = b64_enc_table[(val >> 12) & 0x3F];
        result[j + 2] = (i + 1) < length ? b64_enc_table[(val >> 6) & 0x3F] : '=';
        result[j + 3] = '=';
    }
    return result;
}

/**
 * @brief Strict standard base64 decoding.
 *
 * Returns nullopt on a length that is not a multiple of four, a character
 * outside the alphabet, or padding anywhere but the final one or two
 * positions.
 */
inline std::optional<std::string> base64_decode(std::string_view in) {
    if (in.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (!in.empty() && in.back() == '=') {
        padding = (in.size() >= 2 && in[in.size() - 2] == '=') ? 2 : 1;
    }

    std::string out;
    out.reserve((in.size() / 4) * 3);
    for (size_t i = 0; i < in.size(); i += 4) {
        bool last_quad = (i + 4 == in.size());
        uint8_t c[4];
        for (size_t k = 0; k < 4; ++k) {
            bool is_pad_slot = last_quad && k >= 4 - padding;
            if (is_pad_slot) {
                c[k] = 0;
                continue;
            }
            c[k] = b64_decode_char(in[i + k]);
            if (c[k] == b64_invalid) return std::nullopt;
        }
        uint32_t val = (uint32_t(c[0]) << 18) | (uint32_t(c[1]) << 12) |
                       (uint32_t(c[2]) << 6) | uint32_t(c[3]);
        out.push_back(static_cast<char>((val >> 16) & 0xFF));
        if (!last_quad || padding < 2) out.push_back(static_cast<char>((val >> 8) & 0xFF));
        if (!last_quad || padding < 1) out.push_back(static_cast<char>(val & 0xFF));
    }
    return out;
}

} // namespace utils
} // namespace pidbox
