/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/base64.hpp"
#include <cctype>

namespace castline::base64 {

namespace {
const char kTable[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(unsigned char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}
}

std::string encode(const std::uint8_t* data, std::size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);
    for (std::size_t i = 0; i < len; i += 3) {
        const std::uint32_t a = data[i];
        const std::uint32_t b = (i + 1 < len) ? data[i + 1] : 0;
        const std::uint32_t c = (i + 2 < len) ? data[i + 2] : 0;
        const std::uint32_t triple = (a << 16) | (b << 8) | c;
        result += kTable[(triple >> 18) & 0x3F];
        result += kTable[(triple >> 12) & 0x3F];
        result += (i + 1 < len) ? kTable[(triple >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kTable[triple & 0x3F] : '=';
    }
    return result;
}

std::optional<Bytes> decode(const std::string& text) {
    std::size_t start = 0;
    if (text.compare(0, 5, "data:") == 0) {
        auto comma = text.find(',');
        if (comma == std::string::npos) {
            return std::nullopt;
        }
        start = comma + 1;
    }

    Bytes out;
    out.reserve((text.size() - start) * 3 / 4);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = start; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            break;
        }
        const int value = decodeChar(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

}
