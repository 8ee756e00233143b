//
//  track_filters.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_filters.hpp"

#include <cmath>
#include <sstream>
#include <utility>

#include "geo_math.hpp"
#include "logging.hpp"

std::optional<ExclusionZone> parse_exclusion_zone(const std::string &text) {
    std::istringstream ss(text);
    std::string part;
    std::vector<double> values;
    while (std::getline(ss, part, ',')) {
        try {
            size_t used = 0;
            const double v = std::stod(part, &used);
            if (used != part.size() || !std::isfinite(v)) {
                return std::nullopt;
            }
            values.push_back(v);
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    if (values.size() != 3 || std::fabs(values[0]) > 90.0 || std::fabs(values[1]) > 180.0 ||
        values[2] < 0.0) {
        return std::nullopt;
    }
    ExclusionZone zone;
    zone.latitude = values[0];
    zone.longitude = values[1];
    zone.radius_m = values[2];
    return zone;
}

std::optional<GpsSample> latest_fix(const Track &track) {
    std::optional<GpsSample> latest;
    for (const auto &slot : track) {
        if (slot && (!latest || slot->time.utc > latest->time.utc)) {
            latest = slot;
        }
    }
    return latest;
}

TrackFilterStage make_has_fix_filter() {
    TrackFilterStage stage;
    stage.name = "has-fix";
    stage.reject = [](const Track &track) -> std::optional<std::string> {
        if (count_fixes(track) == 0) {
            return std::string("no GPS fix in track");
        }
        return std::nullopt;
    };
    return stage;
}

TrackFilterStage make_daylight_filter(double twilight_altitude_deg) {
    TrackFilterStage stage;
    stage.name = "daylight";
    stage.reject = [twilight_altitude_deg](const Track &track) -> std::optional<std::string> {
        const auto last = latest_fix(track);
        if (!last) {
            return std::nullopt;
        }
        const double altitude =
            solar_altitude_deg(last->latitude, last->longitude, last->time.utc);
        TF_LOG("filter", "sun altitude at last fix " << altitude << " deg");
        if (altitude > twilight_altitude_deg) {
            return std::nullopt;
        }
        return std::string("ends when the sun is down");
    };
    return stage;
}

TrackFilterStage make_movement_filter(double min_speed_mps) {
    TrackFilterStage stage;
    stage.name = "movement";
    stage.reject = [min_speed_mps](const Track &track) -> std::optional<std::string> {
        for (const auto &slot : track) {
            if (slot && slot->speed > min_speed_mps) {
                return std::nullopt;
            }
        }
        return std::string("does not include any movement");
    };
    return stage;
}

FrameFilterStage make_min_speed_filter(double min_speed_mps) {
    FrameFilterStage stage;
    stage.name = "min-speed";
    stage.reject = [min_speed_mps](const GpsSample &point) { return point.speed < min_speed_mps; };
    return stage;
}

FrameFilterStage make_geofence_filter(std::vector<ExclusionZone> zones) {
    FrameFilterStage stage;
    stage.name = "geofence";
    stage.reject = [zones = std::move(zones)](const GpsSample &point) {
        for (const auto &zone : zones) {
            if (haversine_distance_m(zone.latitude, zone.longitude, point.latitude,
                                     point.longitude) < zone.radius_m) {
                return true;
            }
        }
        return false;
    };
    return stage;
}

std::optional<std::string> FilterChain::check_track(const Track &track) const {
    for (const auto &stage : track_stages) {
        if (auto reason = stage.reject(track)) {
            TF_LOG("filter", "track rejected by " << stage.name << ": " << *reason);
            return reason;
        }
    }
    return std::nullopt;
}

std::optional<std::string> FilterChain::check_frame(const GpsSample &point) const {
    for (const auto &stage : frame_stages) {
        if (stage.reject(point)) {
            return stage.name;
        }
    }
    return std::nullopt;
}

FilterChain make_filter_chain(const FilterOptions &options) {
    FilterChain chain;
    chain.track_stages.push_back(make_has_fix_filter());
    if (!options.enabled) {
        return chain;
    }
    chain.track_stages.push_back(make_daylight_filter(options.twilight_altitude_deg));
    chain.track_stages.push_back(make_movement_filter(options.movement_speed_mps));
    chain.frame_stages.push_back(make_min_speed_filter(options.min_frame_speed_mps));
    if (!options.exclusion_zones.empty()) {
        chain.frame_stages.push_back(make_geofence_filter(options.exclusion_zones));
    }
    return chain;
}
