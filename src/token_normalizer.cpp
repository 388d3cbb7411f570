// src/token_normalizer.cpp
#include "token_normalizer.h"

#include <cctype>
#include <cstddef>

std::string normalize_token(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    const std::size_t n = input.size();
    std::size_t i = 0;
    while (i < n) {
        const auto c0 = static_cast<unsigned char>(input[i]);

        // U+FF10..U+FF19 full-width digits: EF BC 90..99
        if (c0 == 0xEF && i + 2 < n &&
            static_cast<unsigned char>(input[i + 1]) == 0xBC) {
            const auto c2 = static_cast<unsigned char>(input[i + 2]);
            if (c2 >= 0x90 && c2 <= 0x99) {
                out.push_back(static_cast<char>('0' + (c2 - 0x90)));
                i += 3;
                continue;
            }
        }
        // U+3000 ideographic space: E3 80 80
        if (c0 == 0xE3 && i + 2 < n &&
            static_cast<unsigned char>(input[i + 1]) == 0x80 &&
            static_cast<unsigned char>(input[i + 2]) == 0x80) {
            i += 3;
            continue;
        }
        // U+00A0 no-break space: C2 A0
        if (c0 == 0xC2 && i + 1 < n &&
            static_cast<unsigned char>(input[i + 1]) == 0xA0) {
            i += 2;
            continue;
        }

        if (c0 < 0x80) {
            if (std::isspace(c0)) { ++i; continue; }
            out.push_back(static_cast<char>(std::toupper(c0)));
        } else {
            out.push_back(input[i]);
        }
        ++i;
    }
    return out;
}

bool is_numeric_token(const std::string& s) noexcept {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}
