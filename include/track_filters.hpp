//
//  track_filters.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "gps_sample.hpp"

// Circle around a position where no frames are written (home, work).
struct ExclusionZone {
    double latitude = 0.0;
    double longitude = 0.0;
    double radius_m = 0.0;
};

// "lat,lon,radius" with radius in meters.
std::optional<ExclusionZone> parse_exclusion_zone(const std::string &text);

struct FilterOptions {
    bool enabled = true;
    double min_frame_speed_mps = 4.0;   // frames slower than this are dropped.
    double movement_speed_mps = 0.5;    // a track needs one fix faster than this.
    double twilight_altitude_deg = -2.0;  // sun altitude at the last fix.
    std::vector<ExclusionZone> exclusion_zones;
};

// Stage deciding over a whole track; returns the skip reason when it rejects.
struct TrackFilterStage {
    std::string name;
    std::function<std::optional<std::string>(const Track &)> reject;
};

// Stage deciding over one interpolated frame position; true drops the frame.
struct FrameFilterStage {
    std::string name;
    std::function<bool(const GpsSample &)> reject;
};

TrackFilterStage make_has_fix_filter();
TrackFilterStage make_daylight_filter(double twilight_altitude_deg);
TrackFilterStage make_movement_filter(double min_speed_mps);
FrameFilterStage make_min_speed_filter(double min_speed_mps);
FrameFilterStage make_geofence_filter(std::vector<ExclusionZone> zones);

// Latest fix by timestamp, if any.
std::optional<GpsSample> latest_fix(const Track &track);

struct FilterChain {
    std::vector<TrackFilterStage> track_stages;
    std::vector<FrameFilterStage> frame_stages;

    // Reason of the first stage that rejects, nullopt when all accept.
    std::optional<std::string> check_track(const Track &track) const;
    // Name of the first stage that drops the frame, nullopt when kept.
    std::optional<std::string> check_frame(const GpsSample &point) const;
};

// Stage list of the geotagging pipeline. With `enabled == false` only the fix check remains.
FilterChain make_filter_chain(const FilterOptions &options);
