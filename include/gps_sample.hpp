//
//  gps_sample.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <vector>

#include "civil_time.hpp"

/// One decoded (or interpolated) GPS fix.
struct GpsSample {
    double latitude = 0.0;   ///< decimal degrees, south negative
    double longitude = 0.0;  ///< decimal degrees, west negative
    ZonedTimestamp time;
    double speed = 0.0;    ///< m/s
    double bearing = 0.0;  ///< degrees from true north
};

// One slot per sampling tick; empty when the camera had no fix for that tick. The slot index
// is the elapsed time in ticks and keeps frames aligned, so slots are never removed.
using TrackSlot = std::optional<GpsSample>;
using Track = std::vector<TrackSlot>;

inline size_t count_fixes(const Track &track) {
    size_t n = 0;
    for (const auto &slot : track) {
        if (slot) {
            ++n;
        }
    }
    return n;
}
