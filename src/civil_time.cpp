//
//  civil_time.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "civil_time.hpp"

#include <cctz/time_zone.h>

std::optional<cctz::civil_second> make_civil_second(int64_t year, int64_t month, int64_t day,
                                                    int64_t hour, int64_t minute, int64_t second) {
    const cctz::civil_second cs(year, month, day, hour, minute, second);
    if (cs.year() != year || cs.month() != month || cs.day() != day || cs.hour() != hour ||
        cs.minute() != minute || cs.second() != second) {
        return std::nullopt;
    }
    return cs;
}

TimePointMs utc_instant(const cctz::civil_second &cs, int millisecond) {
    return TimePointMs(cctz::convert(cs, cctz::utc_time_zone())) +
           std::chrono::milliseconds(millisecond);
}

std::string format_iso8601_utc(TimePointMs instant) {
    return cctz::format("%Y-%m-%dT%H:%M:%E3SZ", instant, cctz::utc_time_zone());
}

std::string format_exif_utc(TimePointMs instant) {
    return cctz::format("%Y:%m:%d %H:%M:%E3S", instant, cctz::utc_time_zone());
}

std::string format_sortable_utc(TimePointMs instant) {
    // %E3S renders "SS.mmm".
    std::string out = cctz::format("%Y-%m-%d-%H-%M-%E3S", instant, cctz::utc_time_zone());
    out[out.size() - 4] = '-';
    return out;
}
