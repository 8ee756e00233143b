//
//  byte_order.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <cstring>
#include <istream>

// Utility: read big-endian 32-bit value.
uint32_t read_u32(std::istream &in);

// Buffer readers. Callers guarantee that enough bytes are available at `data`.
inline uint32_t load_u32_be(const uint8_t *data) {
    return (uint32_t(data[0]) << 24) | (uint32_t(data[1]) << 16) | (uint32_t(data[2]) << 8) |
           uint32_t(data[3]);
}

inline uint32_t load_u32_le(const uint8_t *data) {
    return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
           (uint32_t(data[3]) << 24);
}

// IEEE-754 single precision, little-endian.
inline float load_f32_le(const uint8_t *data) {
    const uint32_t raw = load_u32_le(data);
    float value;
    std::memcpy(&value, &raw, sizeof(float));
    return value;
}
