//
//  time_zone.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cctz/civil_time.h>
#include <cctz/time_zone.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "civil_time.hpp"

class TimeZoneError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Parse "Z", "UTC", "GMT", "+HH", "+HH:MM", "-HHMM" and the same with a "UTC"/"GMT" prefix.
// Signs follow ISO 8601 (east of Greenwich is positive).
std::optional<int32_t> parse_fixed_offset(const std::string &text);

/**
 * @brief Time zone able to turn camera wall-clock readings into instants.
 *
 * Instances are immutable after construction and hold no global state, so several files can be
 * decoded concurrently against the same zone.
 */
class TimeZone {
   public:
    TimeZone();  // UTC

    static TimeZone utc();
    static TimeZone fixed(int32_t offset_s);

    // Resolve a user supplied zone: fixed offsets first, then zone names from the zoneinfo
    // database ($TZDIR, else /usr/share/zoneinfo) or an absolute TZif path.
    // Throws TimeZoneError when nothing matches.
    static TimeZone load(const std::string &name);

    const std::string &name() const { return name_; }

    // UTC offset in seconds (east-positive) at the given instant.
    int32_t offset_at(TimePointMs instant) const;

    // Interpret `local` as wall-clock time in this zone. Ambiguous readings resolve to the
    // earlier instant; readings inside a skipped interval are read with the offset in effect
    // before the gap.
    ZonedTimestamp localize(const cctz::civil_second &local, int millisecond = 0) const;

   private:
    TimeZone(std::string name, cctz::time_zone zone);

    std::string name_;
    cctz::time_zone zone_;
};
