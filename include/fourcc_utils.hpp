//
//  fourcc_utils.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

// FourCC helpers.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

// Box and tag codes of the Novatek GPS layout.
inline constexpr uint32_t kMoovType = fourcc('m', 'o', 'o', 'v');
inline constexpr uint32_t kGpsBoxType = fourcc('g', 'p', 's', ' ');  // trailing space
inline constexpr uint32_t kFreeType = fourcc('f', 'r', 'e', 'e');
inline constexpr uint32_t kGpsRecordMagic = fourcc('G', 'P', 'S', ' ');

inline bool is_printable_fourcc(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        if (c < 0x20 || c > 0x7E) {
            return false;
        }
    }
    return true;
}

// Printable codes come back verbatim, anything else as 0x-prefixed hex so log lines stay
// readable for garbage headers.
inline std::string fourcc_to_string(uint32_t type) {
    if (!is_printable_fourcc(type)) {
        static const char *hex = "0123456789abcdef";
        std::string s = "0x";
        for (int shift = 28; shift >= 0; shift -= 4) {
            s.push_back(hex[(type >> shift) & 0xF]);
        }
        return s;
    }
    std::string s(4, ' ');
    s[0] = static_cast<char>((type >> 24) & 0xFF);
    s[1] = static_cast<char>((type >> 16) & 0xFF);
    s[2] = static_cast<char>((type >> 8) & 0xFF);
    s[3] = static_cast<char>(type & 0xFF);
    return s;
}
