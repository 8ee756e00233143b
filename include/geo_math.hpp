//
//  geo_math.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include "civil_time.hpp"

inline constexpr double kEarthMeanRadiusMeters = 6371008.8;

// Great-circle distance in meters between two WGS84 positions given in decimal degrees.
double haversine_distance_m(double lat1, double lon1, double lat2, double lon2);

// Geometric altitude of the sun's centre above the horizon in degrees (no refraction), good to
// a few hundredths of a degree for the years dash cams are in use.
double solar_altitude_deg(double latitude, double longitude, TimePointMs instant);
