//
//  geo_math.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "geo_math.hpp"

#include <cmath>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;
constexpr double kUnixEpochJulianDay = 2440587.5;
constexpr double kJ2000JulianDay = 2451545.0;

double wrap_degrees(double d) {
    d = std::fmod(d, 360.0);
    return d < 0.0 ? d + 360.0 : d;
}

}  // namespace

double haversine_distance_m(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = lat1 * kDegToRad;
    const double phi2 = lat2 * kDegToRad;
    const double dphi = (lat2 - lat1) * kDegToRad;
    const double dlambda = (lon2 - lon1) * kDegToRad;
    const double a = std::sin(dphi / 2) * std::sin(dphi / 2) +
                     std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) *
                         std::sin(dlambda / 2);
    return 2.0 * kEarthMeanRadiusMeters * std::asin(std::sqrt(std::fmin(1.0, a)));
}

// Low-precision solar ephemeris (Astronomical Almanac).
double solar_altitude_deg(double latitude, double longitude, TimePointMs instant) {
    const double unix_days = static_cast<double>(instant.time_since_epoch().count()) / 86400000.0;
    const double n = unix_days + kUnixEpochJulianDay - kJ2000JulianDay;

    const double mean_anomaly = wrap_degrees(357.529 + 0.98560028 * n) * kDegToRad;
    const double mean_longitude = wrap_degrees(280.459 + 0.98564736 * n);
    const double ecliptic_longitude =
        (mean_longitude + 1.915 * std::sin(mean_anomaly) + 0.020 * std::sin(2 * mean_anomaly)) *
        kDegToRad;
    const double obliquity = (23.439 - 0.00000036 * n) * kDegToRad;

    const double right_ascension =
        std::atan2(std::cos(obliquity) * std::sin(ecliptic_longitude),
                   std::cos(ecliptic_longitude)) *
        kRadToDeg;
    const double declination =
        std::asin(std::sin(obliquity) * std::sin(ecliptic_longitude));

    const double gmst_deg = wrap_degrees((18.697374558 + 24.06570982441908 * n) * 15.0);
    const double hour_angle = (gmst_deg + longitude - right_ascension) * kDegToRad;

    const double phi = latitude * kDegToRad;
    const double sin_alt = std::sin(phi) * std::sin(declination) +
                           std::cos(phi) * std::cos(declination) * std::cos(hour_angle);
    return std::asin(std::fmax(-1.0, std::fmin(1.0, sin_alt))) * kRadToDeg;
}
