//
//  byte_order.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_order.hpp"

uint32_t read_u32(std::istream &in) {
    uint8_t b[4] = {};
    in.read(reinterpret_cast<char *>(b), 4);
    return load_u32_be(b);
}
