//
//  track_builder.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "gps_locator.hpp"
#include "gps_sample.hpp"
#include "time_zone.hpp"

enum class TrackOutcome {
    Ok,               // at least one fix.
    EmptyTrack,       // gps box present but no usable sample.
    NoGpsData,        // no vendor gps box.
    StructuralError,  // container boxes inconsistent.
    OpenFailed,       // source could not be read.
};

struct TrackStats {
    uint32_t entries = 0;
    uint32_t fixes = 0;
    uint32_t no_fix = 0;
    uint32_t malformed = 0;
};

struct TrackResult {
    TrackOutcome outcome = TrackOutcome::NoGpsData;
    Track track;  // one slot per index entry, also for EmptyTrack.
    TrackStats stats;
    std::string message;

    bool ok() const { return outcome == TrackOutcome::Ok; }
};

// Decode every entry in index order; failed records leave their slot empty.
Track build_track(std::istream &in, const std::vector<GpsIndexEntry> &entries,
                  const TimeZone &zone, TrackStats *stats = nullptr);

// Whole-file entry points. Record and atom problems never escape; only the outcome does.
TrackResult read_track(std::istream &in, const TimeZone &zone);
TrackResult read_track(const std::string &path, const TimeZone &zone);
TrackResult read_track(const std::vector<uint8_t> &bytes, const TimeZone &zone);

const char *track_outcome_name(TrackOutcome outcome);
