//
//  interpolator.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "interpolator.hpp"

#include <algorithm>
#include <cmath>

#include "logging.hpp"

double normalize_bearing(double degrees) {
    double d = std::fmod(degrees, 360.0);
    if (d < 0.0) {
        d += 360.0;
    }
    // fmod of a tiny negative value can round up to exactly 360.
    if (d >= 360.0) {
        d = 0.0;
    }
    return d;
}

double interpolate_bearing(double prev, double next, double ratio) {
    // Signed arc from prev to next in [-180, 180).
    const double delta = normalize_bearing(next - prev + 180.0) - 180.0;
    return normalize_bearing(prev + delta * ratio);
}

TimePointMs interpolate_time(TimePointMs prev, TimePointMs next, double ratio) {
    const int64_t span = (next - prev).count();
    int64_t offset = static_cast<int64_t>(std::llround(static_cast<double>(span) * ratio));
    offset = std::clamp<int64_t>(offset, std::min<int64_t>(0, span), std::max<int64_t>(0, span));
    return prev + std::chrono::milliseconds(offset);
}

GpsSample interpolate(const GpsSample &prev, const GpsSample &next, double ratio) {
    const double r = std::clamp(ratio, 0.0, 1.0);
    GpsSample out;
    out.latitude = lerp(prev.latitude, next.latitude, r);
    out.longitude = lerp(prev.longitude, next.longitude, r);
    out.speed = lerp(prev.speed, next.speed, r);
    out.bearing = interpolate_bearing(prev.bearing, next.bearing, r);
    out.time.utc = interpolate_time(prev.time.utc, next.time.utc, r);
    out.time.utc_offset_s = prev.time.utc_offset_s;
    return out;
}

std::vector<FramePlan> plan_frames(const Track &track, uint32_t samples_per_tick) {
    std::vector<FramePlan> plans;
    if (samples_per_tick == 0) {
        TF_LOG("warn", "plan_frames: samples_per_tick must be at least 1");
        return plans;
    }
    plans.reserve(count_fixes(track) * samples_per_tick);

    uint32_t frame = 1;
    const GpsSample *prev = nullptr;
    for (size_t i = 0; i < track.size(); ++i) {
        const auto &slot = track[i];
        if (!slot) {
            frame += samples_per_tick;
            continue;
        }
        if (!prev) {
            prev = &*slot;
        }
        for (uint32_t step = 0; step < samples_per_tick; ++step) {
            FramePlan plan;
            plan.frame_number = frame++;
            plan.slot_index = static_cast<uint32_t>(i);
            plan.step = step;
            plan.point = interpolate(*prev, *slot,
                                     static_cast<double>(step) / samples_per_tick);
            plans.push_back(plan);
        }
        prev = &*slot;
    }
    TF_LOG("pipeline", "planned " << plans.size() << " frames over " << track.size()
                                  << " ticks at " << samples_per_tick << " per tick");
    return plans;
}
