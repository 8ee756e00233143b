//
//  time_zone.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "time_zone.hpp"

#include <cctype>
#include <utility>

#include "logging.hpp"

std::optional<int32_t> parse_fixed_offset(const std::string &text) {
    if (text == "Z" || text == "UTC" || text == "GMT") {
        return 0;
    }
    std::string t = text;
    if (t.rfind("UTC", 0) == 0 || t.rfind("GMT", 0) == 0) {
        t = t.substr(3);
    }
    if (t.size() < 3 || (t[0] != '+' && t[0] != '-')) {
        return std::nullopt;
    }
    const int sign = t[0] == '-' ? -1 : 1;
    std::string digits;
    for (size_t i = 1; i < t.size(); ++i) {
        if (t[i] == ':' && i == 3) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(t[i]))) {
            return std::nullopt;
        }
        digits.push_back(t[i]);
    }
    if (digits.size() != 2 && digits.size() != 4) {
        return std::nullopt;
    }
    const int hours = std::stoi(digits.substr(0, 2));
    const int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hours > 18 || minutes > 59) {
        return std::nullopt;
    }
    return sign * (hours * 3600 + minutes * 60);
}

TimeZone::TimeZone() : name_("UTC"), zone_(cctz::utc_time_zone()) {}

TimeZone::TimeZone(std::string name, cctz::time_zone zone)
    : name_(std::move(name)), zone_(zone) {}

TimeZone TimeZone::utc() { return TimeZone(); }

TimeZone TimeZone::fixed(int32_t offset_s) {
    const auto zone = cctz::fixed_time_zone(cctz::seconds(offset_s));
    return TimeZone(zone.name(), zone);
}

TimeZone TimeZone::load(const std::string &name) {
    if (name.empty()) {
        throw TimeZoneError("empty time zone name");
    }
    if (auto offset = parse_fixed_offset(name)) {
        return TimeZone(name, cctz::fixed_time_zone(cctz::seconds(*offset)));
    }
    cctz::time_zone zone;
    if (!cctz::load_time_zone(name, &zone)) {
        throw TimeZoneError("unknown time zone: " + name);
    }
    TF_LOG("tz", "loaded zone " << name << " (" << zone.name() << ")");
    return TimeZone(name, zone);
}

int32_t TimeZone::offset_at(TimePointMs instant) const {
    return zone_.lookup(std::chrono::time_point_cast<cctz::seconds>(instant)).offset;
}

ZonedTimestamp TimeZone::localize(const cctz::civil_second &local, int millisecond) const {
    // `pre` is the earlier instant for repeated times and the pre-gap offset for skipped ones.
    const auto lookup = zone_.lookup(local);
    ZonedTimestamp ts;
    ts.utc = TimePointMs(lookup.pre) + std::chrono::milliseconds(millisecond);
    ts.utc_offset_s = zone_.lookup(lookup.pre).offset;
    return ts;
}
