// src/base32.cpp
#include "base32.h"

#include <cctype>
#include <cstddef>

namespace {

constexpr const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int b32_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return 26 + (c - '2');
    return -1;
}

} // namespace

std::optional<std::string> base32_decode(const std::string& b32) {
    // Normalize: uppercase, drop whitespace; split off trailing padding
    std::string in;
    in.reserve(b32.size());
    std::size_t pad = 0;
    for (char c : b32) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') { ++pad; continue; }
        if (pad > 0) return std::nullopt; // data after padding
        in.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (pad > 0) {
        if (pad > 6 || (in.size() + pad) % 8 != 0) return std::nullopt;
    }

    // Final group lengths 1, 3 and 6 cannot come from whole bytes.
    const std::size_t rem = in.size() % 8;
    if (rem == 1 || rem == 3 || rem == 6) return std::nullopt;

    std::string out;
    out.reserve(in.size() * 5 / 8 + 1);

    unsigned int buffer = 0;
    int bits_left = 0;

    for (char c : in) {
        int v = b32_val(c);
        if (v < 0) return std::nullopt;
        buffer = (buffer << 5) | static_cast<unsigned int>(v);
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            out.push_back(static_cast<char>((buffer >> bits_left) & 0xFF));
        }
        buffer &= (1u << bits_left) - 1;
    }
    return out;
}

std::string base32_encode(const std::string& raw) {
    std::string out;
    out.reserve((raw.size() * 8 + 4) / 5);

    unsigned int buffer = 0;
    int bits = 0;
    for (unsigned char byte : raw) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kAlphabet[(buffer >> bits) & 0x1F]);
        }
        buffer &= (1u << bits) - 1;
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}
