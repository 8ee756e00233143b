//
//  civil_time.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cctz/civil_time.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using TimePointMs = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// UTC instant plus the UTC offset that was in effect in the recording time zone.
struct ZonedTimestamp {
    TimePointMs utc;
    int32_t utc_offset_s = 0;

    bool operator==(const ZonedTimestamp &other) const {
        return utc == other.utc && utc_offset_s == other.utc_offset_s;
    }
};

// Build a civil second from raw calendar fields. cctz normalizes out-of-range fields into a
// neighbouring date, so any field that did not survive unchanged yields nullopt.
std::optional<cctz::civil_second> make_civil_second(int64_t year, int64_t month, int64_t day,
                                                    int64_t hour, int64_t minute, int64_t second);

// Instant of `cs` read as UTC.
TimePointMs utc_instant(const cctz::civil_second &cs, int millisecond = 0);

// "2021-06-01T12:00:00.500Z"
std::string format_iso8601_utc(TimePointMs instant);
// "2021:06:01 12:00:00.500", the EXIF date layout.
std::string format_exif_utc(TimePointMs instant);
// "2021-06-01-12-00-00-500", fixed width so it sorts like the instants it encodes.
std::string format_sortable_utc(TimePointMs instant);
