//
//  interpolator.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "gps_sample.hpp"

inline double lerp(double from, double to, double ratio) { return from + (to - from) * ratio; }

// Map any angle into [0, 360).
double normalize_bearing(double degrees);

// Walk the shorter arc from `prev` toward `next`; the result is always in [0, 360).
double interpolate_bearing(double prev, double next, double ratio);

// prev + (next - prev) * ratio at millisecond resolution, clamped to [prev, next].
TimePointMs interpolate_time(TimePointMs prev, TimePointMs next, double ratio);

// Synthetic sample between two fixes. `ratio` is clamped to [0, 1]; ratio 0 reproduces `prev`
// (bearing normalized). The UTC offset is taken from `prev`.
GpsSample interpolate(const GpsSample &prev, const GpsSample &next, double ratio);

struct FramePlan {
    uint32_t frame_number = 0;  // 1-based, the numbering of extracted frame files.
    uint32_t slot_index = 0;    // track slot the frame belongs to.
    uint32_t step = 0;          // 0..samples_per_tick-1 within that slot.
    GpsSample point;
};

// Plan the geotag of every extracted frame. Each tick owns `samples_per_tick` consecutive
// frame numbers; ticks without a fix keep their numbers but produce no plan. Frames of a tick
// interpolate from the previous fix to the tick's own fix; the first fix stands in for its
// own predecessor.
std::vector<FramePlan> plan_frames(const Track &track, uint32_t samples_per_tick);
