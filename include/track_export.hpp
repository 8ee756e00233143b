//
//  track_export.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "gps_sample.hpp"

// GPX 1.0 document with one track segment holding every fix of `track` (gaps are left out).
std::string make_gpx(const Track &track, const std::string &source_name);

// JSON description of the track: source, zone, slot count and the fixes with their slot index.
nlohmann::json track_to_json(const Track &track, const std::string &source_name,
                             const std::string &zone_name);

// Write `text` to `path`, or to stdout when path is "-".
bool write_text_output(const std::string &path, const std::string &text);
