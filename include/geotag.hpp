//
//  geotag.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "gps_sample.hpp"

// Unsigned EXIF RATIONAL, kept in lowest terms.
struct Rational {
    uint32_t numerator = 0;
    uint32_t denominator = 1;

    double value() const { return denominator ? double(numerator) / denominator : 0.0; }
    bool operator==(const Rational &o) const {
        return numerator == o.numerator && denominator == o.denominator;
    }
};

struct DmsCoordinate {
    Rational degrees;
    Rational minutes;
    Rational seconds;  // 1e-5 second resolution
};

inline constexpr uint32_t kSecondsDenominator = 100000;
inline constexpr uint32_t kBearingDenominator = 100;

/**
 * @brief Fields a metadata writer needs for one frame.
 *
 * Hemisphere references are empty for a coordinate of exactly zero. `bearing` is empty when the
 * bearing is exactly zero, which this format cannot tell apart from "unknown".
 */
struct GeoTag {
    std::string latitude_ref;  ///< "N", "S" or ""
    DmsCoordinate latitude;
    std::string longitude_ref;  ///< "E", "W" or ""
    DmsCoordinate longitude;
    std::optional<Rational> bearing;  ///< centidegrees over 100, not reduced
    std::string bearing_ref;          ///< "T" (true north) when bearing is set
    std::string capture_time;         ///< UTC "YYYY:MM:DD HH:MM:SS.mmm"
    std::string file_stem;            ///< "frame-YYYY-MM-DD-HH-MM-SS-mmm", UTC
    double decimal_latitude = 0.0;
    double decimal_longitude = 0.0;
    double speed = 0.0;
};

Rational make_rational(uint64_t numerator, uint64_t denominator);

// Split |decimal_degrees| into whole degrees, whole minutes and seconds.
DmsCoordinate to_dms(double decimal_degrees);

GeoTag build_geotag(const GpsSample &point);
