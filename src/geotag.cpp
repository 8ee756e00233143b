//
//  geotag.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "geotag.hpp"

#include <cmath>
#include <numeric>

#include "interpolator.hpp"

Rational make_rational(uint64_t numerator, uint64_t denominator) {
    if (denominator == 0) {
        return Rational{0, 1};
    }
    const uint64_t g = std::gcd(numerator, denominator);
    Rational r;
    r.numerator = static_cast<uint32_t>(numerator / (g ? g : 1));
    r.denominator = static_cast<uint32_t>(denominator / (g ? g : 1));
    return r;
}

DmsCoordinate to_dms(double decimal_degrees) {
    const double magnitude = std::fabs(decimal_degrees);
    uint64_t degrees = static_cast<uint64_t>(magnitude);
    const double minutes_f = (magnitude - static_cast<double>(degrees)) * 60.0;
    uint64_t minutes = static_cast<uint64_t>(minutes_f);
    uint64_t seconds = static_cast<uint64_t>(
        std::llround((minutes_f - static_cast<double>(minutes)) * 60.0 * kSecondsDenominator));

    // Rounding can land on a full minute.
    if (seconds >= 60ull * kSecondsDenominator) {
        seconds -= 60ull * kSecondsDenominator;
        ++minutes;
    }
    if (minutes >= 60) {
        minutes -= 60;
        ++degrees;
    }

    DmsCoordinate dms;
    dms.degrees = make_rational(degrees, 1);
    dms.minutes = make_rational(minutes, 1);
    dms.seconds = make_rational(seconds, kSecondsDenominator);
    return dms;
}

static std::string hemisphere(double value, const char *negative, const char *positive) {
    if (value < 0.0) {
        return negative;
    }
    if (value > 0.0) {
        return positive;
    }
    return "";
}

GeoTag build_geotag(const GpsSample &point) {
    GeoTag tag;
    tag.decimal_latitude = point.latitude;
    tag.decimal_longitude = point.longitude;
    tag.speed = point.speed;
    tag.latitude_ref = hemisphere(point.latitude, "S", "N");
    tag.longitude_ref = hemisphere(point.longitude, "W", "E");
    tag.latitude = to_dms(point.latitude);
    tag.longitude = to_dms(point.longitude);

    // Bearings that floor to 0 centidegrees, 360 included, are left out.
    const auto centi = static_cast<uint32_t>(
        std::floor(normalize_bearing(point.bearing) * kBearingDenominator));
    if (centi != 0) {
        tag.bearing = Rational{centi, kBearingDenominator};
        tag.bearing_ref = "T";
    }

    tag.capture_time = format_exif_utc(point.time.utc);
    tag.file_stem = "frame-" + format_sortable_utc(point.time.utc);
    return tag;
}
